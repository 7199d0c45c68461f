// latex_escape.cpp - LaTeX special character escaping

#include "latex_escape.hpp"
#include "../lib/log.h"

namespace mdlatex {

static const char* const EMITTED_COMMANDS[] = {
    "\\textbf", "\\textit", "\\cite", "\\ref",
};

bool contains_emitted_latex(const std::string& text) {
    if (text.find('\\') == std::string::npos) return false;
    for (const char* cmd : EMITTED_COMMANDS) {
        if (text.find(cmd) != std::string::npos) return true;
    }
    return false;
}

std::string escape_latex(const std::string& text) {
    if (contains_emitted_latex(text)) {
        log_debug("escape_latex: span already holds LaTeX commands, left as is");
        return text;
    }

    std::string out;
    out.reserve(text.size() + text.size() / 8);
    for (char c : text) {
        switch (c) {
        case '&': case '%': case '$': case '#':
        case '_': case '{': case '}':
            out += '\\';
            out += c;
            break;
        case '~':
            out += "\\textasciitilde{}";
            break;
        case '^':
            out += "\\textasciicircum{}";
            break;
        default:
            out += c;
        }
    }
    return out;
}

} // namespace mdlatex
