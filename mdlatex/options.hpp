// options.hpp - Transpiler configuration

#ifndef MDLATEX_OPTIONS_HPP
#define MDLATEX_OPTIONS_HPP

#include "placeholder.hpp"
#include <string>

namespace mdlatex {

struct TranspileOptions {
    std::string language = "en";    // document language, consumed by the template
    int target_pages = 20;          // page budget, informational only
    PlaceholderWindows windows;     // placeholder lookahead, in bytes
};

// babel package language for an ISO code: en/de/es/fr, english otherwise
const char* babel_language(const std::string& code);

// Parse a positive window size; false on anything else.
bool parse_window_size(const char* arg, size_t* out);

} // namespace mdlatex

#endif // MDLATEX_OPTIONS_HPP
