// latex_table.hpp - Pipe-delimited markdown tables to LaTeX tabular

#ifndef MDLATEX_LATEX_TABLE_HPP
#define MDLATEX_LATEX_TABLE_HPP

#include <string>
#include <vector>

namespace mdlatex {

#define MDLATEX_INLINE_TABLE_CAPTION "Data Summary"

struct TableBlock {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;

    size_t column_count() const { return header.size(); }
};

// "| a | b |" (surrounding whitespace allowed)
bool is_table_row(const std::string& line);
// "|---|:--:|"
bool is_separator_row(const std::string& line);
// "| a | b |" -> {"a", "b"}
std::vector<std::string> split_table_row(const std::string& line);

// Build a table from pipe lines; separator rows anywhere are skipped. The first
// remaining row is the header. Rows longer than the header are truncated,
// shorter rows keep only the cells present. Returns false (and leaves out
// untouched) when fewer than two lines were given.
bool parse_table_lines(const std::vector<std::string>& lines, TableBlock* out);

// \begin{tabular}{l...} ... \end{tabular}, cells escaped
std::string render_tabular(const TableBlock& table);

// table float: caption, tab: label and the tabular
std::string render_table(const TableBlock& table, const std::string& caption);

// Rewrite every "header / separator / data rows" run in text as a table float
// captioned MDLATEX_INLINE_TABLE_CAPTION.
std::string convert_inline_tables(const std::string& text);

} // namespace mdlatex

#endif // MDLATEX_LATEX_TABLE_HPP
