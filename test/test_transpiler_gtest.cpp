/**
 * @file test_transpiler_gtest.cpp
 * @brief End-to-end tests for the markdown to LaTeX pass pipeline
 *
 * Exercises the ordering between passes: citations before lists and tables
 * (no re-escaping of \cite{}), placeholder metadata consumption, list balance
 * and hard failures on invalid input encoding.
 */

#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>
#include "../mdlatex/transpiler.hpp"
#include "../lib/log.h"

using namespace mdlatex;

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

static size_t count_of(const std::string& haystack, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        count++;
    }
    return count;
}

class TranspilerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_init(NULL);
    }

    std::string latex(const std::string& markdown) {
        TranspileResult result = transpile_markdown(markdown);
        EXPECT_TRUE(result.ok) << result.error;
        return result.latex;
    }
};

TEST_F(TranspilerTest, EndToEndScenario) {
    TranspileResult result = transpile_markdown(
        "## Results\n\nOur findings [Lee2022] show **strong** support.\n- point one\n- point two");
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.code, TRANSPILE_OK);
    EXPECT_TRUE(contains(result.latex, "\\section{Results}"));
    EXPECT_TRUE(contains(result.latex, "\\cite{lee2022}"));
    EXPECT_TRUE(contains(result.latex, "\\textbf{strong}"));
    EXPECT_EQ(count_of(result.latex, "\\begin{itemize}"), 1u);
    EXPECT_EQ(count_of(result.latex, "\\end{itemize}"), 1u);
    EXPECT_EQ(count_of(result.latex, "\\item "), 2u);
    EXPECT_TRUE(contains(result.latex, "\\item point one\n  \\item point two\n\\end{itemize}"));

    std::vector<std::string> expected_keys = {"lee2022"};
    EXPECT_EQ(result.citation_keys, expected_keys);
}

TEST_F(TranspilerTest, ListBalancedWithoutTrailingBlankLine) {
    std::string out = latex("- a\n- b");
    EXPECT_EQ(out, "\\begin{itemize}\n  \\item a\n  \\item b\n\\end{itemize}\n");
}

TEST_F(TranspilerTest, NumberedListFollowedByBulletList) {
    std::string out = latex("1. first\n2. second\n- bullet");
    EXPECT_EQ(count_of(out, "\\begin{enumerate}"), 1u);
    EXPECT_EQ(count_of(out, "\\end{enumerate}"), 1u);
    EXPECT_EQ(count_of(out, "\\begin{itemize}"), 1u);
    EXPECT_EQ(count_of(out, "\\end{itemize}"), 1u);
}

TEST_F(TranspilerTest, MultiCitationPrecedence) {
    std::string out = latex("[Smith2020; Jones2021]");
    EXPECT_EQ(out, "\\cite{smith2020,jones2021}\n");
}

TEST_F(TranspilerTest, CitationInListItemNotEscaped) {
    std::string out = latex("- see [Lee2022] now");
    EXPECT_TRUE(contains(out, "  \\item see \\cite{lee2022} now"));
}

TEST_F(TranspilerTest, EmphasisInListItemNotEscaped) {
    std::string out = latex("- a **bold** claim");
    EXPECT_TRUE(contains(out, "  \\item a \\textbf{bold} claim"));
}

TEST_F(TranspilerTest, PlainListItemEscaped) {
    std::string out = latex("- costs 5$ & 10%");
    EXPECT_TRUE(contains(out, "  \\item costs 5\\$ \\& 10\\%"));
}

TEST_F(TranspilerTest, ListItemWithCitationSkipsEscaping) {
    // emitted markup in the item disables escaping for the whole item
    std::string out = latex("- see [Lee2022] & more");
    EXPECT_TRUE(contains(out, "  \\item see \\cite{lee2022} & more"));
}

TEST_F(TranspilerTest, CitationInsideTableCell) {
    std::string out = latex("| Source | Value |\n|---|---|\n| [Lee2022] | x_y |");
    EXPECT_TRUE(contains(out, "\\cite{lee2022} & x\\_y \\\\"));
    EXPECT_TRUE(contains(out, "\\caption{Data Summary}"));
}

TEST_F(TranspilerTest, TableRowsStartingWithListMarkers) {
    std::string out = latex("| A | B |\n|---|---|\n| - | 2 |\n| 1. x | 3 |");
    EXPECT_EQ(out.find("itemize"), std::string::npos);
    EXPECT_EQ(out.find("enumerate"), std::string::npos);
    EXPECT_EQ(out.find("\\&"), std::string::npos);
    EXPECT_TRUE(contains(out, "\\midrule\n- & 2 \\\\\n1. x & 3 \\\\\n\\bottomrule"));
}

TEST_F(TranspilerTest, TablePlaceholderRowsStartingWithListMarkers) {
    std::string out = latex("[TABLE]\nCaption: Gaps\n| A | B |\n|---|---|\n| - | 2 |\n| 1. x | 3 |");
    EXPECT_TRUE(contains(out, "\\caption{Gaps}"));
    EXPECT_EQ(out.find("itemize"), std::string::npos);
    EXPECT_EQ(out.find("enumerate"), std::string::npos);
    EXPECT_TRUE(contains(out, "\\midrule\n- & 2 \\\\\n1. x & 3 \\\\\n\\bottomrule"));
}

TEST_F(TranspilerTest, StarredHeadingWithEmphasis) {
    EXPECT_EQ(latex("# Intro to *AI*"), "\\section*{Intro to \\textit{AI}}\n");
}

TEST_F(TranspilerTest, CaptionAfterTagInsideSentence) {
    std::string out = latex("See [FIGURE] here.\nCaption: Results");
    EXPECT_TRUE(contains(out, "\\caption{Results}"));
    EXPECT_TRUE(contains(out, "\\end{figure} here."));
    EXPECT_FALSE(contains(out, "Caption:"));
}

TEST_F(TranspilerTest, TableRoundTrip) {
    std::string out = latex("| A | B |\n|---|---|\n| 1 | 2 |");
    EXPECT_TRUE(contains(out, "\\begin{tabular}{ll}"));
    EXPECT_TRUE(contains(out, "A & B"));
    EXPECT_TRUE(contains(out, "1 & 2"));
}

TEST_F(TranspilerTest, PlaceholderMetadataNotDuplicated) {
    std::string out = latex(
        "Intro.\n\n[FIGURE]\nCaption: My Figure\nDescription: shows X\n\nMore text.");
    EXPECT_TRUE(contains(out, "\\begin{figure}[htbp]"));
    EXPECT_TRUE(contains(out, "\\caption{My Figure}"));
    EXPECT_FALSE(contains(out, "Caption:"));
    EXPECT_FALSE(contains(out, "Description:"));
    EXPECT_TRUE(contains(out, "More text."));
}

TEST_F(TranspilerTest, StrayMetadataLinesRemoved) {
    std::string out = latex("Para one.\nType: line\nPara two.");
    EXPECT_EQ(out, "Para one.\nPara two.\n");
}

TEST_F(TranspilerTest, TablePlaceholderNotConvertedTwice) {
    std::string out = latex("[TABLE]\nCaption: Scores\n| A | B |\n|---|---|\n| 1 | 2 |\n\nDone.");
    EXPECT_EQ(count_of(out, "\\begin{table}"), 1u);
    EXPECT_TRUE(contains(out, "\\caption{Scores}"));
    EXPECT_FALSE(contains(out, "Data Summary"));
}

TEST_F(TranspilerTest, CitationInsidePlaceholderCaption) {
    std::string out = latex("[FIGURE]\nCaption: Adapted from [Lee2022]");
    EXPECT_TRUE(contains(out, "\\caption{Adapted from \\cite{lee2022}}"));
    TranspileResult result = transpile_markdown("[FIGURE]\nCaption: Adapted from [Lee2022]");
    ASSERT_EQ(result.citation_keys.size(), 1u);
    EXPECT_EQ(result.citation_keys[0], "lee2022");
}

TEST_F(TranspilerTest, HeaderWithEmphasis) {
    EXPECT_EQ(latex("## **Key** findings"), "\\section{\\textbf{Key} findings}\n");
}

TEST_F(TranspilerTest, WhitespaceCollapsed) {
    EXPECT_EQ(latex("a\n\n\n\n\nb"), "a\n\nb\n");
}

TEST_F(TranspilerTest, CrlfInput) {
    std::string out = latex("## Title\r\n- x\r\n- y\r\n");
    EXPECT_TRUE(contains(out, "\\section{Title}\n"));
    EXPECT_EQ(count_of(out, "\\end{itemize}"), 1u);
    EXPECT_FALSE(contains(out, "\r"));
}

TEST_F(TranspilerTest, Utf8TextPreserved) {
    EXPECT_EQ(latex("## Größe und Maß"), "\\section{Größe und Maß}\n");
}

TEST_F(TranspilerTest, InvalidUtf8IsHardFailure) {
    TranspileResult result = transpile_markdown(std::string("abc\xff def"));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.code, TRANSPILE_ERROR_ENCODING);
    EXPECT_TRUE(contains(result.error, "offset 3"));
    EXPECT_TRUE(result.latex.empty());
    EXPECT_STREQ(transpile_error_name(result.code), "encoding error");
}

TEST_F(TranspilerTest, EmptyInput) {
    TranspileResult result = transpile_markdown("");
    EXPECT_TRUE(result.ok);
    EXPECT_EQ(result.latex, "");
    EXPECT_TRUE(result.citation_keys.empty());
}

TEST_F(TranspilerTest, UnrecognizedConstructsStayLiteral) {
    EXPECT_EQ(latex("[not a cite] and [FIG] here"), "[not a cite] and [FIG] here\n");
}

TEST_F(TranspilerTest, WindowOptionBoundsMetadataScan) {
    TranspileOptions options;
    options.windows.figure = 3;
    TranspileResult result = transpile_markdown("[FIGURE]\n\n\n\nCaption: Far away", options);
    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(contains(result.latex, "\\caption{Figure}"));
    EXPECT_FALSE(contains(result.latex, "Far away"));
}

TEST_F(TranspilerTest, RepeatedCallsAreIndependent) {
    std::string doc = "# Title\n\n[FIGURE]\nCaption: One\n\n- item [Kim2019]\n";
    EXPECT_EQ(latex(doc), latex(doc));
}

TEST_F(TranspilerTest, ConcurrentDocuments) {
    const std::string doc = "## Part\n\nText [Abe2020; Bo2021].\n1. a\n2. b\n";
    const std::string expected = latex(doc);

    std::vector<std::string> outputs(8);
    std::vector<std::thread> workers;
    for (size_t i = 0; i < outputs.size(); i++) {
        workers.emplace_back([&doc, &outputs, i]() {
            outputs[i] = transpile_markdown(doc).latex;
        });
    }
    for (auto& worker : workers) worker.join();
    for (const auto& out : outputs) EXPECT_EQ(out, expected);
}
