// text_util.cpp - Line and RE2 rewrite helpers

#include "text_util.hpp"
#include <cctype>

namespace mdlatex {

static const size_t LABEL_SLUG_MAX = 20;

std::string replace_matches(const std::string& text, const re2::RE2& re, const MatchRewriter& rewrite) {
    if (!re.ok()) return text;

    int ngroups = re.NumberOfCapturingGroups() + 1;
    std::vector<re2::StringPiece> groups(ngroups);
    re2::StringPiece input(text);

    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos <= text.size() &&
           re.Match(input, pos, text.size(), re2::RE2::UNANCHORED, groups.data(), ngroups)) {
        size_t start = groups[0].data() - text.data();
        size_t end = start + groups[0].size();
        out.append(text, pos, start - pos);
        out += rewrite(groups);
        if (end == start) {
            // empty match: copy one char and move on
            if (end < text.size()) out += text[end];
            pos = end + 1;
        } else {
            pos = end;
        }
    }
    if (pos < text.size()) out.append(text, pos, std::string::npos);
    return out;
}

std::string global_replace(const std::string& text, const re2::RE2& re, const char* rewrite) {
    std::string out = text;
    re2::RE2::GlobalReplace(&out, re, rewrite);
    return out;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); i++) {
        if (i > 0) out += '\n';
        out += lines[i];
    }
    return out;
}

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) b++;
    while (e > b && std::isspace((unsigned char)s[e - 1])) e--;
    return s.substr(b, e - b);
}

std::string to_lower(const std::string& s) {
    std::string out = s;
    for (char& c : out) c = (char)std::tolower((unsigned char)c);
    return out;
}

bool starts_with(const std::string& s, const char* prefix) {
    return s.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

bool is_blank(const std::string& s) {
    for (char c : s) {
        if (!std::isspace((unsigned char)c)) return false;
    }
    return true;
}

std::string label_slug(const std::string& caption, const char* fallback) {
    std::string slug;
    for (char c : caption) {
        unsigned char uc = (unsigned char)c;
        if (uc < 0x80 && std::isalnum(uc)) {
            slug += (char)std::tolower(uc);
            if (slug.size() >= LABEL_SLUG_MAX) break;
        }
    }
    return slug.empty() ? std::string(fallback) : slug;
}

} // namespace mdlatex
