// transpiler.hpp - Markdown dialect to LaTeX body text
//
// The transpiler is a fixed pipeline of text rewrites. Each pass consumes the
// complete output of the previous one:
//   1. placeholder expansion (figures, tables, charts)
//   2. residual metadata line stripping
//   3. headers
//   4. bold, then italic
//   5. multi-key citations, then single-key citations
//   6. inline pipe tables
//   7. bullet lists, then numbered lists
//   8. whitespace normalization
// Citations run after emphasis and before tables and lists, so cell and item
// escaping sees the emitted \cite{} and leaves the span alone.

#ifndef MDLATEX_TRANSPILER_HPP
#define MDLATEX_TRANSPILER_HPP

#include "options.hpp"
#include <string>
#include <vector>

namespace mdlatex {

typedef enum TranspileErrorCode {
    TRANSPILE_OK = 0,
    TRANSPILE_ERROR_ENCODING,           // input is not valid UTF-8
    TRANSPILE_ERROR_UNBALANCED_LIST,    // list scanner emitted unbalanced environments
} TranspileErrorCode;

struct TranspileResult {
    bool ok = false;
    TranspileErrorCode code = TRANSPILE_OK;
    std::string error;                          // message when !ok
    std::string latex;                          // body-level LaTeX
    std::vector<std::string> citation_keys;     // sorted, unique, from the finished body
};

const char* transpile_error_name(TranspileErrorCode code);

// Transpile one document. Stateless: no data is kept between calls, so
// documents may be transpiled concurrently from different threads.
TranspileResult transpile_markdown(const std::string& markdown,
                                   const TranspileOptions& options = TranspileOptions());

} // namespace mdlatex

#endif // MDLATEX_TRANSPILER_HPP
