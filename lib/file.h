#ifndef FILE_H
#define FILE_H

#include <stdbool.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// Read a whole text file into a malloc'ed, null-terminated buffer.
// Returns NULL if the file cannot be opened or read. out_len may be NULL.
char* read_text_file(const char *filename, size_t *out_len);

// Write content to a text file, replacing it. Returns false on any I/O error.
bool write_text_file(const char *filename, const char *content, size_t len);

#ifdef __cplusplus
}
#endif

#endif // FILE_H
