// latex_table.cpp - Pipe-delimited markdown tables to LaTeX tabular

#include "latex_table.hpp"
#include "latex_escape.hpp"
#include "text_util.hpp"
#include "../lib/log.h"

namespace mdlatex {

static const re2::RE2& separator_re() {
    static const re2::RE2 re("^\\s*\\|(?:\\s*:?-+:?\\s*\\|)+\\s*$");
    return re;
}

bool is_table_row(const std::string& line) {
    std::string t = trim(line);
    return t.size() >= 2 && t.front() == '|' && t.back() == '|';
}

bool is_separator_row(const std::string& line) {
    return re2::RE2::FullMatch(line, separator_re());
}

std::vector<std::string> split_table_row(const std::string& line) {
    std::string t = trim(line);
    if (!t.empty() && t.front() == '|') t.erase(0, 1);
    if (!t.empty() && t.back() == '|') t.pop_back();

    std::vector<std::string> cells;
    size_t start = 0;
    while (true) {
        size_t bar = t.find('|', start);
        if (bar == std::string::npos) {
            cells.push_back(trim(t.substr(start)));
            break;
        }
        cells.push_back(trim(t.substr(start, bar - start)));
        start = bar + 1;
    }
    return cells;
}

bool parse_table_lines(const std::vector<std::string>& lines, TableBlock* out) {
    if (lines.size() < 2) {
        log_debug("parse_table_lines: %zu line(s), table dropped", lines.size());
        return false;
    }

    TableBlock table;
    bool have_header = false;
    for (const std::string& line : lines) {
        if (is_separator_row(line)) continue;
        std::vector<std::string> cells = split_table_row(line);
        if (!have_header) {
            table.header = cells;
            have_header = true;
            continue;
        }
        if (cells.size() > table.column_count()) {
            cells.resize(table.column_count());
        } else if (cells.size() < table.column_count()) {
            log_debug("parse_table_lines: short row (%zu of %zu cells)",
                cells.size(), table.column_count());
        }
        table.rows.push_back(cells);
    }
    if (!have_header) {
        log_debug("parse_table_lines: no header row, table dropped");
        return false;
    }
    *out = table;
    return true;
}

static void append_row(std::string& out, const std::vector<std::string>& cells) {
    for (size_t i = 0; i < cells.size(); i++) {
        if (i > 0) out += " & ";
        out += escape_latex(cells[i]);
    }
    out += " \\\\\n";
}

std::string render_tabular(const TableBlock& table) {
    std::string out;
    out += "\\begin{tabular}{" + std::string(table.column_count(), 'l') + "}\n";
    out += "\\toprule\n";
    append_row(out, table.header);
    out += "\\midrule\n";
    for (const auto& row : table.rows) append_row(out, row);
    out += "\\bottomrule\n";
    out += "\\end{tabular}";
    return out;
}

std::string render_table(const TableBlock& table, const std::string& caption) {
    std::string out;
    out += "\\begin{table}[htbp]\n";
    out += "\\centering\n";
    out += "\\caption{" + escape_latex(caption) + "}\n";
    out += "\\label{tab:" + label_slug(caption, "table") + "}\n";
    out += render_tabular(table);
    out += "\n\\end{table}";
    return out;
}

std::string convert_inline_tables(const std::string& text) {
    std::vector<std::string> lines = split_lines(text);
    std::vector<std::string> result;
    int converted = 0;

    size_t i = 0;
    while (i < lines.size()) {
        bool starts_table = i + 2 < lines.size() &&
            is_table_row(lines[i]) && !is_separator_row(lines[i]) &&
            is_separator_row(lines[i + 1]) &&
            is_table_row(lines[i + 2]) && !is_separator_row(lines[i + 2]);
        if (!starts_table) {
            result.push_back(lines[i++]);
            continue;
        }

        size_t end = i + 2;
        while (end < lines.size() && is_table_row(lines[end])) end++;
        std::vector<std::string> block(lines.begin() + i, lines.begin() + end);

        TableBlock table;
        if (parse_table_lines(block, &table)) {
            result.push_back(render_table(table, MDLATEX_INLINE_TABLE_CAPTION));
            converted++;
        }
        i = end;
    }

    if (converted > 0) log_debug("convert_inline_tables: %d table(s)", converted);
    return join_lines(result);
}

} // namespace mdlatex
