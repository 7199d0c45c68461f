// text_util.hpp - Line and RE2 rewrite helpers shared by the transpiler passes

#ifndef MDLATEX_TEXT_UTIL_HPP
#define MDLATEX_TEXT_UTIL_HPP

#include <re2/re2.h>
#include <functional>
#include <string>
#include <vector>

namespace mdlatex {

// Called once per match; groups[0] is the whole match, groups[i] the i-th capture.
using MatchRewriter = std::function<std::string(const std::vector<re2::StringPiece>& groups)>;

// Replace every non-overlapping match of re in text with rewrite(match).
// Unlike RE2::GlobalReplace the replacement may be computed per match.
std::string replace_matches(const std::string& text, const re2::RE2& re, const MatchRewriter& rewrite);

// Apply RE2::GlobalReplace and return the rewritten copy.
std::string global_replace(const std::string& text, const re2::RE2& re, const char* rewrite);

// Split on '\n'. A trailing newline yields a trailing empty line, so
// join_lines(split_lines(s)) == s.
std::vector<std::string> split_lines(const std::string& text);
std::string join_lines(const std::vector<std::string>& lines);

std::string trim(const std::string& s);
std::string to_lower(const std::string& s);
bool starts_with(const std::string& s, const char* prefix);
bool is_blank(const std::string& s);

// \label{} slug: lower-cased, [a-z0-9] only, at most 20 characters.
// Falls back to `fallback` when nothing survives.
std::string label_slug(const std::string& caption, const char* fallback);

} // namespace mdlatex

#endif // MDLATEX_TEXT_UTIL_HPP
