// latex_escape.hpp - LaTeX special character escaping for plain-text spans

#ifndef MDLATEX_LATEX_ESCAPE_HPP
#define MDLATEX_LATEX_ESCAPE_HPP

#include <string>

namespace mdlatex {

// True when text holds a backslash together with one of the commands the
// transpiler emits into running text (\textbf, \textit, \cite, \ref).
bool contains_emitted_latex(const std::string& text);

// Escape & % $ # _ { } ~ ^ for LaTeX. Text that already contains emitted
// commands (see contains_emitted_latex) is returned unchanged, so a span is
// never escaped twice. Also used for document titles and abstracts.
std::string escape_latex(const std::string& text);

} // namespace mdlatex

#endif // MDLATEX_LATEX_ESCAPE_HPP
