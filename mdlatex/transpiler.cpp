// transpiler.cpp - Markdown dialect to LaTeX pass pipeline

#include "transpiler.hpp"
#include "block_transform.hpp"
#include "citation.hpp"
#include "latex_table.hpp"
#include "placeholder.hpp"
#include "text_util.hpp"
#include "utf8_check.hpp"
#include "../lib/log.h"

namespace mdlatex {

const char* transpile_error_name(TranspileErrorCode code) {
    switch (code) {
    case TRANSPILE_OK: return "ok";
    case TRANSPILE_ERROR_ENCODING: return "encoding error";
    case TRANSPILE_ERROR_UNBALANCED_LIST: return "unbalanced list environment";
    }
    return "unknown error";
}

static TranspileResult fail(TranspileErrorCode code, const std::string& message) {
    log_error("transpile_markdown: %s", message.c_str());
    TranspileResult result;
    result.ok = false;
    result.code = code;
    result.error = message;
    return result;
}

static std::string normalize_newlines(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); i++) {
        if (text[i] == '\r') {
            if (i + 1 < text.size() && text[i + 1] == '\n') continue;
            out += '\n';
        } else {
            out += text[i];
        }
    }
    return out;
}

TranspileResult transpile_markdown(const std::string& markdown, const TranspileOptions& options) {
    size_t bad_offset = 0;
    if (!validate_utf8(markdown, &bad_offset)) {
        return fail(TRANSPILE_ERROR_ENCODING,
            "input is not valid UTF-8 at byte offset " + std::to_string(bad_offset));
    }
    log_debug("transpile_markdown: %zu bytes, language %s, target %d pages",
        markdown.size(), options.language.c_str(), options.target_pages);

    std::string text = normalize_newlines(markdown);

    text = expand_all_placeholders(text, options.windows);
    text = strip_metadata_lines(text);
    text = convert_headers(text);
    text = convert_emphasis(text);
    text = resolve_citations(text);
    text = convert_inline_tables(text);

    std::string listed;
    if (!convert_lists(text, ListKind::Bullet, &listed)) {
        return fail(TRANSPILE_ERROR_UNBALANCED_LIST, "unbalanced itemize environment");
    }
    if (!convert_lists(listed, ListKind::Numbered, &text)) {
        return fail(TRANSPILE_ERROR_UNBALANCED_LIST, "unbalanced enumerate environment");
    }

    TranspileResult result;
    result.ok = true;
    result.latex = normalize_whitespace(text);
    result.citation_keys = extract_citation_keys(result.latex);
    log_debug("transpile_markdown: %zu bytes of LaTeX, %zu citation key(s)",
        result.latex.size(), result.citation_keys.size());
    return result;
}

} // namespace mdlatex
