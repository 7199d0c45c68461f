// citation.cpp - Citation tag recognition, rewriting and key extraction

#include "citation.hpp"
#include "text_util.hpp"
#include "../lib/log.h"
#include <cctype>
#include <set>

namespace mdlatex {

static const re2::RE2& multi_cite_re() {
    static const re2::RE2 re("\\[(" MDLATEX_CITE_TOKEN "(?:\\s*;\\s*" MDLATEX_CITE_TOKEN ")+)\\]");
    return re;
}

static const re2::RE2& single_cite_re() {
    static const re2::RE2 re("\\[(" MDLATEX_CITE_TOKEN ")\\]");
    return re;
}

static const re2::RE2& cite_command_re() {
    static const re2::RE2 re("\\\\cite\\{([^}]*)\\}");
    return re;
}

std::string normalize_citation_key(const std::string& surface) {
    std::string key;
    key.reserve(surface.size());
    for (char c : to_lower(surface)) {
        if (!std::isspace((unsigned char)c)) key += c;
    }
    return key;
}

// "Smith2020; Jones 2021" -> {"smith2020", "jones2021"}
static std::vector<std::string> split_keys(const std::string& group, char sep) {
    std::vector<std::string> keys;
    size_t start = 0;
    while (start <= group.size()) {
        size_t end = group.find(sep, start);
        if (end == std::string::npos) end = group.size();
        std::string key = normalize_citation_key(group.substr(start, end - start));
        if (!key.empty()) keys.push_back(key);
        start = end + 1;
    }
    return keys;
}

std::string resolve_multi_citations(const std::string& text) {
    return replace_matches(text, multi_cite_re(), [](const std::vector<re2::StringPiece>& g) {
        std::vector<std::string> keys = split_keys(std::string(g[1].data(), g[1].size()), ';');
        std::string arg;
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) arg += ',';
            arg += keys[i];
        }
        return "\\cite{" + arg + "}";
    });
}

std::string resolve_single_citations(const std::string& text) {
    return replace_matches(text, single_cite_re(), [](const std::vector<re2::StringPiece>& g) {
        return "\\cite{" + normalize_citation_key(std::string(g[1].data(), g[1].size())) + "}";
    });
}

std::string resolve_citations(const std::string& text) {
    return resolve_single_citations(resolve_multi_citations(text));
}

static void collect_matches(const std::string& text, const re2::RE2& re, char sep,
                            std::set<std::string>* keys) {
    re2::StringPiece input(text);
    std::string group;
    while (re2::RE2::FindAndConsume(&input, re, &group)) {
        for (const std::string& key : split_keys(group, sep)) keys->insert(key);
    }
}

std::vector<std::string> extract_citation_keys(const std::string& text) {
    std::set<std::string> keys;
    collect_matches(text, cite_command_re(), ',', &keys);
    collect_matches(text, multi_cite_re(), ';', &keys);
    collect_matches(text, single_cite_re(), ';', &keys);
    log_debug("extract_citation_keys: %zu unique keys", keys.size());
    return std::vector<std::string>(keys.begin(), keys.end());
}

} // namespace mdlatex
