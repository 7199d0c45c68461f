// placeholder.cpp - Figure / table / chart placeholder expansion

#include "placeholder.hpp"
#include "latex_escape.hpp"
#include "latex_table.hpp"
#include "text_util.hpp"
#include "../lib/log.h"

namespace mdlatex {

static const re2::RE2& tag_re(PlaceholderKind kind) {
    static const re2::RE2 figure_re("\\[FIGURE([^\\]\\n]*)\\]");
    static const re2::RE2 table_re("\\[TABLE([^\\]\\n]*)\\]");
    static const re2::RE2 chart_re("\\[CHART([^\\]\\n]*)\\]");
    switch (kind) {
    case PlaceholderKind::Table: return table_re;
    case PlaceholderKind::Chart: return chart_re;
    default: return figure_re;
    }
}

// "Caption: x", "**Caption:** x"
static const re2::RE2& metadata_re() {
    static const re2::RE2 re("^[*_]*(Caption|Description|Type|Data)[*_]*:[*_]*\\s*(.*)$");
    return re;
}

static const re2::RE2& metadata_line_re() {
    static const re2::RE2 re("(?m)^[ \\t]*[*_]*(?:Caption|Description|Type|Data)[*_]*:[^\\n]*\\n?");
    return re;
}

const char* placeholder_marker(PlaceholderKind kind) {
    switch (kind) {
    case PlaceholderKind::Table: return "TABLE";
    case PlaceholderKind::Chart: return "CHART";
    default: return "FIGURE";
    }
}

static size_t line_end(const std::string& text, size_t from) {
    size_t nl = text.find('\n', from);
    return nl == std::string::npos ? text.size() : nl;
}

PlaceholderTag scan_placeholder(const std::string& text, size_t tag_end,
                                PlaceholderKind kind, size_t window) {
    PlaceholderTag tag;
    tag.kind = kind;
    tag.consumed_end = tag_end;

    // rest of the tag's line is kept and re-emitted after the environment
    size_t cursor = line_end(text, tag_end);
    std::string rest = text.substr(tag_end, cursor - tag_end);
    if (!is_blank(rest)) tag.trailing = rest;
    tag.consumed_end = cursor;

    size_t limit = tag_end + window < text.size() ? tag_end + window : text.size();
    while (cursor < text.size()) {
        size_t start = cursor + 1;
        if (start >= limit) break;
        size_t end = line_end(text, start);
        std::string line = trim(text.substr(start, end - start));
        cursor = end;

        if (line.empty()) continue;  // blank lines are skipped but not consumed

        std::string key, value;
        if (re2::RE2::FullMatch(line, metadata_re(), &key, &value)) {
            value = trim(value);
            if (key == "Caption" && tag.caption.empty()) tag.caption = value;
            else if (key == "Description" && tag.description.empty()) tag.description = value;
            else if (key == "Type" && tag.chart_type.empty()) tag.chart_type = value;
            tag.consumed_end = end;
            continue;
        }
        if (kind == PlaceholderKind::Table && is_table_row(line)) {
            tag.table_lines.push_back(line);
            tag.consumed_end = end;
            continue;
        }
        break;
    }
    return tag;
}

std::string placeholder_caption(const PlaceholderTag& tag) {
    if (!tag.caption.empty()) return tag.caption;
    if (!tag.inline_label.empty()) return tag.inline_label;
    switch (tag.kind) {
    case PlaceholderKind::Table: return MDLATEX_DEFAULT_TABLE_CAPTION;
    case PlaceholderKind::Chart: return MDLATEX_DEFAULT_CHART_CAPTION;
    default: return MDLATEX_DEFAULT_FIGURE_CAPTION;
    }
}

// framed box standing in for content that does not exist
static std::string placeholder_box(const std::string& text, const char* height) {
    return std::string("\\fbox{\\parbox{0.8\\textwidth}{\\centering\\vspace{") + height + "}" +
        "\\textit{" + escape_latex(text) + "}\\vspace{" + height + "}}}\n";
}

static std::string caption_and_label(const std::string& caption, const char* prefix) {
    return "\\caption{" + escape_latex(caption) + "}\n" +
        "\\label{" + prefix + ":" + label_slug(caption, prefix) + "}\n";
}

std::string render_figure(const PlaceholderTag& tag) {
    std::string desc = tag.description.empty() ? MDLATEX_DEFAULT_DESCRIPTION : tag.description;
    std::string out = "\\begin{figure}[htbp]\n\\centering\n";
    out += placeholder_box(desc, "2cm");
    out += caption_and_label(placeholder_caption(tag), "fig");
    out += "\\end{figure}";
    return out;
}

std::string render_chart(const PlaceholderTag& tag) {
    std::string type = to_lower(trim(tag.chart_type));
    if (type.empty()) type = MDLATEX_DEFAULT_CHART_TYPE;

    const char* axis_opts = "";
    const char* plot_opts = "";
    const char* close_path = "";
    if (type.find("bar") != std::string::npos) {
        axis_opts = ", ybar";
        type = "bar";
    } else if (type.find("scatter") != std::string::npos) {
        plot_opts = "[only marks]";
        type = "scatter";
    } else if (type.find("area") != std::string::npos) {
        plot_opts = "[fill=gray!30]";
        close_path = " \\closedcycle";
        type = "area";
    } else {
        type = MDLATEX_DEFAULT_CHART_TYPE;
    }
    log_debug("render_chart: %s chart", type.c_str());

    std::string out = "\\begin{figure}[htbp]\n\\centering\n";
    out += "\\begin{tikzpicture}\n";
    out += std::string("\\begin{axis}[width=0.8\\textwidth, height=6cm") + axis_opts + "]\n";
    out += std::string("\\addplot") + plot_opts +
        " coordinates {(1,2) (2,3) (3,5) (4,4) (5,6)}" + close_path + ";\n";
    out += "\\end{axis}\n";
    out += "\\end{tikzpicture}\n";
    if (!tag.description.empty()) {
        out += "\\par\\footnotesize\\textit{" + escape_latex(tag.description) + "}\n";
    }
    out += caption_and_label(placeholder_caption(tag), "chart");
    out += "\\end{figure}";
    return out;
}

std::string render_table_placeholder(const PlaceholderTag& tag) {
    std::string caption = placeholder_caption(tag);
    TableBlock table;
    if (parse_table_lines(tag.table_lines, &table)) {
        return render_table(table, caption);
    }

    std::string out = "\\begin{table}[htbp]\n\\centering\n";
    out += caption_and_label(caption, "tab");
    out += placeholder_box(tag.description.empty() ? "Table placeholder" : tag.description, "1cm");
    out += "\\end{table}";
    return out;
}

static std::string inline_label(const re2::StringPiece& body) {
    std::string label(body.data(), body.size());
    size_t i = 0;
    while (i < label.size() && (label[i] == ':' || label[i] == '-' || label[i] == ' ' || label[i] == '\t')) i++;
    return trim(label.substr(i));
}

std::string expand_placeholders(const std::string& text, PlaceholderKind kind, size_t window) {
    const re2::RE2& re = tag_re(kind);
    re2::StringPiece groups[2];
    re2::StringPiece input(text);

    std::string out;
    size_t pos = 0;
    int expanded = 0;
    while (pos < text.size() &&
           re.Match(input, pos, text.size(), re2::RE2::UNANCHORED, groups, 2)) {
        size_t tag_start = groups[0].data() - text.data();
        size_t tag_end = tag_start + groups[0].size();

        PlaceholderTag tag = scan_placeholder(text, tag_end, kind, window);
        tag.inline_label = inline_label(groups[1]);

        out.append(text, pos, tag_start - pos);
        switch (kind) {
        case PlaceholderKind::Table: out += render_table_placeholder(tag); break;
        case PlaceholderKind::Chart: out += render_chart(tag); break;
        default: out += render_figure(tag); break;
        }
        out += tag.trailing;
        pos = tag.consumed_end;
        expanded++;
    }
    if (pos < text.size()) out.append(text, pos, std::string::npos);

    if (expanded > 0) {
        log_debug("expand_placeholders: %d %s placeholder(s)", expanded, placeholder_marker(kind));
    }
    return out;
}

std::string expand_all_placeholders(const std::string& text, const PlaceholderWindows& windows) {
    std::string out = expand_placeholders(text, PlaceholderKind::Figure, windows.figure);
    out = expand_placeholders(out, PlaceholderKind::Table, windows.table);
    return expand_placeholders(out, PlaceholderKind::Chart, windows.chart);
}

std::string strip_metadata_lines(const std::string& text) {
    return global_replace(text, metadata_line_re(), "");
}

} // namespace mdlatex
