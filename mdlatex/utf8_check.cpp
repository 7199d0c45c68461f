// utf8_check.cpp - UTF-8 validation using utf8proc

#include "utf8_check.hpp"
#include "../lib/log.h"
#include <utf8proc.h>

namespace mdlatex {

bool validate_utf8(const std::string& text, size_t* bad_offset) {
    const utf8proc_uint8_t* bytes = (const utf8proc_uint8_t*)text.data();
    utf8proc_ssize_t len = (utf8proc_ssize_t)text.size();
    utf8proc_ssize_t pos = 0;

    while (pos < len) {
        utf8proc_int32_t codepoint;
        utf8proc_ssize_t n = utf8proc_iterate(bytes + pos, len - pos, &codepoint);
        if (n <= 0 || codepoint < 0) {
            log_debug("validate_utf8: invalid sequence at byte %zd: %s",
                pos, utf8proc_errmsg(n < 0 ? n : UTF8PROC_ERROR_INVALIDUTF8));
            if (bad_offset) *bad_offset = (size_t)pos;
            return false;
        }
        pos += n;
    }
    return true;
}

} // namespace mdlatex
