// bibliography.hpp - Placeholder BibTeX records for citation keys

#ifndef MDLATEX_BIBLIOGRAPHY_HPP
#define MDLATEX_BIBLIOGRAPHY_HPP

#include <string>
#include <vector>

namespace mdlatex {

#define MDLATEX_BIB_NOTE "Placeholder citation - replace with actual reference"

struct BibliographyEntry {
    std::string key;        // normalized citation key, e.g. "smith2020a"
    std::string author;     // "Smith"
    std::string title;
    std::string journal;
    std::string year;       // 4 characters
    std::string volume;
    std::string pages;
    std::string note;
};

// "smith2020a" -> author token "smith", year "2020". False when the key is not
// an author+year token.
bool parse_citation_key(const std::string& key, std::string* author, std::string* year);

// One entry per parseable key, in the order given (callers pass the sorted
// set from extract_citation_keys). Unparseable keys are skipped.
std::vector<BibliographyEntry> synthesize_bibliography(const std::vector<std::string>& keys);

// @article{...} records separated by one blank line.
std::string format_bibtex(const std::vector<BibliographyEntry>& entries);

// extract_citation_keys + synthesize_bibliography + format_bibtex.
std::string generate_bibliography(const std::string& latex_body);

} // namespace mdlatex

#endif // MDLATEX_BIBLIOGRAPHY_HPP
