/* log.h - leveled logging for mdlatex, printf-style, C linkage */
#ifndef LOG_H
#define LOG_H

#include <stddef.h>
#include <stdio.h>
#include <stdarg.h>

#ifdef __cplusplus
extern "C" {
#endif

#define LOG_OK              0
#define LOG_WRONG_FORMAT   -3   /* bad config line or format string */
#define LOG_WRITE_FAIL     -4
#define LOG_INIT_FAIL      -5   /* output could not be opened, category table full */

/* a message is written when its level >= the category level */
typedef enum {
    LOG_LEVEL_DEBUG = 20,
    LOG_LEVEL_INFO = 40,
    LOG_LEVEL_NOTICE = 60,
    LOG_LEVEL_WARN = 80,
    LOG_LEVEL_ERROR = 100,
    LOG_LEVEL_FATAL = 120
} log_level;

typedef struct log_category_s {
    char name[64];
    int level;
    FILE *output;       /* stderr unless the config names another stream */
    int enabled;
} log_category_t;

/* config may be NULL or "" to keep the current settings */
int log_init(const char *config);
/* closes a file output and restores default settings */
void log_fini(void);
/* finds or creates a named category with the current settings */
log_category_t* log_get_category(const char *cname);

int log_error(const char *format, ...);
int log_warn(const char *format, ...);
int log_info(const char *format, ...);
int log_debug(const char *format, ...);

int log_level_enabled(log_category_t *category, const int level);

/* set by log_init(), created on first use when logging before init */
extern log_category_t *log_default_category;

const char* log_level_to_string(int level);
/* -1 for an unknown name; "warning" is accepted for warn */
int log_level_from_string(const char *name);

/*
 * "key = value" per line, '#' to end of line is ignored.
 *   level       debug | info | notice | warn | error | fatal
 *   output      stdout | stderr | <path>, appended to
 *   timestamps  on | off
 *   colors      on | off
 */
int log_parse_config_file(const char *filename);
int log_parse_config_string(const char *config);

#ifdef __cplusplus
}
#endif

#endif /* LOG_H */
