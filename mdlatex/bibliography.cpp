// bibliography.cpp - Placeholder BibTeX synthesis

#include "bibliography.hpp"
#include "citation.hpp"
#include "../lib/log.h"
#include <re2/re2.h>
#include <cctype>

namespace mdlatex {

bool parse_citation_key(const std::string& key, std::string* author, std::string* year) {
    static const re2::RE2 author_year("([A-Za-z]+)(\\d{4})[a-z]?");
    return re2::RE2::FullMatch(key, author_year, author, year);
}

std::vector<BibliographyEntry> synthesize_bibliography(const std::vector<std::string>& keys) {
    std::vector<BibliographyEntry> entries;
    entries.reserve(keys.size());

    for (const std::string& key : keys) {
        std::string author, year;
        if (!parse_citation_key(key, &author, &year)) {
            log_debug("synthesize_bibliography: key '%s' is not author+year, skipped", key.c_str());
            continue;
        }
        author[0] = (char)std::toupper((unsigned char)author[0]);

        BibliographyEntry entry;
        entry.key = key;
        entry.author = author;
        entry.title = "Placeholder Title for " + author + year;
        entry.journal = "Placeholder Journal";
        entry.year = year;
        entry.volume = "1";
        entry.pages = "1--10";
        entry.note = MDLATEX_BIB_NOTE;
        entries.push_back(entry);
    }
    return entries;
}

std::string format_bibtex(const std::vector<BibliographyEntry>& entries) {
    std::string out;
    for (size_t i = 0; i < entries.size(); i++) {
        const BibliographyEntry& e = entries[i];
        if (i > 0) out += "\n\n";
        out += "@article{" + e.key + ",\n";
        out += "  author = {" + e.author + "},\n";
        out += "  title = {" + e.title + "},\n";
        out += "  journal = {" + e.journal + "},\n";
        out += "  year = {" + e.year + "},\n";
        out += "  volume = {" + e.volume + "},\n";
        out += "  pages = {" + e.pages + "},\n";
        out += "  note = {" + e.note + "}\n";
        out += "}";
    }
    return out;
}

std::string generate_bibliography(const std::string& latex_body) {
    std::vector<BibliographyEntry> entries = synthesize_bibliography(extract_citation_keys(latex_body));
    log_debug("generate_bibliography: %zu entries", entries.size());
    return format_bibtex(entries);
}

} // namespace mdlatex
