// block_transform.cpp - Headers, emphasis, lists, whitespace

#include "block_transform.hpp"
#include "latex_escape.hpp"
#include "text_util.hpp"
#include "../lib/log.h"

namespace mdlatex {

std::string convert_headers(const std::string& text) {
    static const re2::RE2 h4("(?m)^#### (.+)$");
    static const re2::RE2 h3("(?m)^### (.+)$");
    static const re2::RE2 h2("(?m)^## (.+)$");
    static const re2::RE2 h1("(?m)^# (.+)$");

    std::string out = global_replace(text, h4, "\\\\subsubsection{\\1}");
    out = global_replace(out, h3, "\\\\subsection{\\1}");
    out = global_replace(out, h2, "\\\\section{\\1}");
    return global_replace(out, h1, "\\\\section*{\\1}");
}

std::string convert_emphasis(const std::string& text) {
    // bold first: "**" would otherwise read as two empty italics
    static const re2::RE2 bold("\\*\\*(.+?)\\*\\*");
    // the star of an emitted \section* is matched first and kept as is
    static const re2::RE2 italic("(\\\\section\\*)|\\*(.+?)\\*");

    std::string out = global_replace(text, bold, "\\\\textbf{\\1}");
    return replace_matches(out, italic, [](const std::vector<re2::StringPiece>& g) {
        if (g[1].data() != nullptr) return std::string(g[1].data(), g[1].size());
        return "\\textit{" + std::string(g[2].data(), g[2].size()) + "}";
    });
}

const char* list_environment(ListKind kind) {
    return kind == ListKind::Bullet ? "itemize" : "enumerate";
}

static ListState open_state(ListKind kind) {
    return kind == ListKind::Bullet ? ListState::InBulletList : ListState::InNumberedList;
}

// Item text of a list line of this kind, or false if the line is not one.
static bool match_item(ListKind kind, const std::string& line, std::string* item) {
    static const re2::RE2 numbered("(\\d+)\\. (.*)");
    std::string stripped = trim(line);
    if (kind == ListKind::Bullet) {
        if (!starts_with(stripped, "- ")) return false;
        *item = stripped.substr(2);
        return true;
    }
    std::string number;
    return re2::RE2::FullMatch(stripped, numbered, &number, item);
}

ListTransition list_transition(ListState state, ListKind kind, const std::string* line) {
    ListTransition t;
    const char* env = list_environment(kind);
    bool in_list = state == open_state(kind);

    // rendered table rows pass through untouched
    if (state == ListState::InTabular) {
        if (line) t.emitted.push_back(*line);
        bool closes = !line || starts_with(trim(*line), "\\end{tabular}");
        t.next = closes ? ListState::Outside : ListState::InTabular;
        return t;
    }
    if (line && starts_with(trim(*line), "\\begin{tabular}")) {
        if (in_list) {
            t.emitted.push_back(std::string("\\end{") + env + "}");
            t.closed++;
        }
        t.emitted.push_back(*line);
        t.next = ListState::InTabular;
        return t;
    }

    std::string item;
    if (line && match_item(kind, *line, &item)) {
        if (!in_list) {
            t.emitted.push_back(std::string("\\begin{") + env + "}");
            t.opened++;
        }
        t.emitted.push_back("  \\item " + escape_latex(item));
        t.next = open_state(kind);
        return t;
    }

    if (in_list) {
        t.emitted.push_back(std::string("\\end{") + env + "}");
        t.closed++;
    }
    if (line) t.emitted.push_back(*line);
    t.next = ListState::Outside;
    return t;
}

bool convert_lists(const std::string& text, ListKind kind, std::string* out) {
    std::vector<std::string> result;
    ListState state = ListState::Outside;
    int opened = 0, closed = 0;

    auto apply = [&](const ListTransition& t) {
        result.insert(result.end(), t.emitted.begin(), t.emitted.end());
        opened += t.opened;
        closed += t.closed;
        state = t.next;
    };
    for (const std::string& line : split_lines(text)) {
        apply(list_transition(state, kind, &line));
    }
    apply(list_transition(state, kind, nullptr));

    *out = join_lines(result);
    if (opened != closed || state != ListState::Outside) {
        log_error("convert_lists: unbalanced %s (%d begin, %d end)",
            list_environment(kind), opened, closed);
        return false;
    }
    if (opened > 0) log_debug("convert_lists: %d %s run(s)", opened, list_environment(kind));
    return true;
}

std::string normalize_whitespace(const std::string& text) {
    static const re2::RE2 blank_run("\\n(?:[ \\t]*\\n){2,}");
    std::string out = global_replace(text, blank_run, "\n\n");

    // first non-blank line starts after the last newline before it
    size_t first = out.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t nl = out.rfind('\n', first);
    size_t b = nl == std::string::npos ? 0 : nl + 1;
    size_t e = out.find_last_not_of(" \t\r\n") + 1;
    return out.substr(b, e - b) + "\n";
}

} // namespace mdlatex
