// options.cpp - Transpiler configuration helpers

#include "options.hpp"
#include "../lib/log.h"
#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace mdlatex {

struct LanguageMapping {
    const char* code;
    const char* babel;
};

static const LanguageMapping LANGUAGES[] = {
    {"en", "english"},
    {"de", "ngerman"},
    {"es", "spanish"},
    {"fr", "french"},
};

const char* babel_language(const std::string& code) {
    for (const auto& lang : LANGUAGES) {
        if (code == lang.code) return lang.babel;
    }
    log_debug("babel_language: unknown language '%s', using english", code.c_str());
    return "english";
}

bool parse_window_size(const char* arg, size_t* out) {
    if (!arg || !*arg || *arg == '-') return false;
    errno = 0;
    char* end = nullptr;
    unsigned long long value = strtoull(arg, &end, 10);
    if (errno != 0 || *end != '\0' || value == 0) return false;
    *out = (size_t)value;
    return true;
}

} // namespace mdlatex
