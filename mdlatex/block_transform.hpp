// block_transform.hpp - Headers, emphasis, bullet/numbered lists, whitespace

#ifndef MDLATEX_BLOCK_TRANSFORM_HPP
#define MDLATEX_BLOCK_TRANSFORM_HPP

#include <string>
#include <vector>

namespace mdlatex {

// #    -> \section*{}
// ##   -> \section{}
// ###  -> \subsection{}
// #### -> \subsubsection{}
std::string convert_headers(const std::string& text);

// **x** -> \textbf{x}, then *x* -> \textit{x}
std::string convert_emphasis(const std::string& text);

// =============================================================================
// List scanning
// =============================================================================

enum class ListKind { Bullet, Numbered };
// InTabular: between \begin{tabular} and \end{tabular}, where no list opens
enum class ListState { Outside, InBulletList, InNumberedList, InTabular };

struct ListTransition {
    ListState next = ListState::Outside;
    std::vector<std::string> emitted;
    int opened = 0;     // \begin lines in emitted
    int closed = 0;     // \end lines in emitted
};

const char* list_environment(ListKind kind);

// One step of the scan for lists of `kind`. line == nullptr is end of input,
// which closes an open list.
ListTransition list_transition(ListState state, ListKind kind, const std::string* line);

// Wrap every maximal run of `kind` items. Returns false when the emitted
// environments do not balance (internal invariant violation); out is still set.
bool convert_lists(const std::string& text, ListKind kind, std::string* out);

// Collapse 3+ consecutive newlines (2+ blank lines) to one blank line and trim
// leading/trailing blank lines.
std::string normalize_whitespace(const std::string& text);

} // namespace mdlatex

#endif // MDLATEX_BLOCK_TRANSFORM_HPP
