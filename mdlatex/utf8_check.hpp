// utf8_check.hpp - UTF-8 validation of transpiler input

#ifndef MDLATEX_UTF8_CHECK_HPP
#define MDLATEX_UTF8_CHECK_HPP

#include <string>

namespace mdlatex {

// True if text is well-formed UTF-8. On failure *bad_offset (if given) is the
// byte offset of the first invalid sequence.
bool validate_utf8(const std::string& text, size_t* bad_offset);

} // namespace mdlatex

#endif // MDLATEX_UTF8_CHECK_HPP
