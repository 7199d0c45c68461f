// placeholder.hpp - [FIGURE ...] / [TABLE ...] / [CHART ...] placeholder blocks
//
// A tag may be followed, on its own lines, by metadata:
//   [FIGURE: optional inline label]
//   Caption: Growth over time
//   Description: what the figure would show
//   Type: bar            (charts)
// A TABLE tag may also be followed by pipe-table lines. Only lines that start
// inside the lookahead window are considered. Consumed lines are replaced by
// the emitted environment.

#ifndef MDLATEX_PLACEHOLDER_HPP
#define MDLATEX_PLACEHOLDER_HPP

#include <string>
#include <vector>

namespace mdlatex {

#define MDLATEX_DEFAULT_FIGURE_CAPTION "Figure"
#define MDLATEX_DEFAULT_TABLE_CAPTION "Table"
#define MDLATEX_DEFAULT_CHART_CAPTION "Chart"
#define MDLATEX_DEFAULT_DESCRIPTION "Placeholder figure"
#define MDLATEX_DEFAULT_CHART_TYPE "line"

enum class PlaceholderKind { Figure, Table, Chart };

struct PlaceholderWindows {
    size_t figure = 500;
    size_t table = 1000;
    size_t chart = 500;
};

struct PlaceholderTag {
    PlaceholderKind kind = PlaceholderKind::Figure;
    std::string inline_label;               // text after the marker inside the brackets
    std::string caption;                    // empty when no Caption: line
    std::string description;
    std::string chart_type;
    std::vector<std::string> table_lines;   // pipe lines (TABLE only)
    std::string trailing;                   // text after the tag on its own line
    size_t consumed_end = 0;                // end of the last consumed line
};

const char* placeholder_marker(PlaceholderKind kind);

// Scan the lines following the line of a tag that ends at tag_end.
PlaceholderTag scan_placeholder(const std::string& text, size_t tag_end,
                                PlaceholderKind kind, size_t window);

// Caption with fallbacks applied: Caption line, inline label, fixed default.
std::string placeholder_caption(const PlaceholderTag& tag);

std::string render_figure(const PlaceholderTag& tag);
std::string render_chart(const PlaceholderTag& tag);
std::string render_table_placeholder(const PlaceholderTag& tag);

// Expand every tag of one kind.
std::string expand_placeholders(const std::string& text, PlaceholderKind kind, size_t window);

// Figures, then tables, then charts.
std::string expand_all_placeholders(const std::string& text, const PlaceholderWindows& windows);

// Drop leftover standalone Caption:/Description:/Type:/Data: lines.
std::string strip_metadata_lines(const std::string& text);

} // namespace mdlatex

#endif // MDLATEX_PLACEHOLDER_HPP
