// citation.hpp - Citation tag recognition, rewriting and key extraction
//
// Tag shapes:
//   single  [Smith2020]  [Smith2020a]
//   multi   [Smith2020; Jones2021]
// Both rewrite to \cite{...} with normalized keys (lower-cased, spaces removed).

#ifndef MDLATEX_CITATION_HPP
#define MDLATEX_CITATION_HPP

#include <string>
#include <vector>

namespace mdlatex {

// Author+year token: letters, 4-digit year, optional disambiguation letter.
#define MDLATEX_CITE_TOKEN "[A-Za-z]+\\d{4}[a-z]?"

std::string normalize_citation_key(const std::string& surface);

// [A; B] -> \cite{a,b}
std::string resolve_multi_citations(const std::string& text);
// [A] -> \cite{a}
std::string resolve_single_citations(const std::string& text);

// Multi-key tags first, then single-key tags. Running the single pass first
// would never match inside a multi tag, but the order is kept explicit.
std::string resolve_citations(const std::string& text);

// Re-scan finished text: every \cite{...} argument (comma lists split) plus any
// residual bracketed tags. Sorted, unique, normalized.
std::vector<std::string> extract_citation_keys(const std::string& text);

} // namespace mdlatex

#endif // MDLATEX_CITATION_HPP
