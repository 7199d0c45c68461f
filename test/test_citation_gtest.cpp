/**
 * @file test_citation_gtest.cpp
 * @brief Tests for citation tag rewriting and citation key extraction
 */

#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "../mdlatex/citation.hpp"
#include "../lib/log.h"

using namespace mdlatex;

static size_t count_of(const std::string& haystack, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        count++;
    }
    return count;
}

class CitationTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_init(NULL);
    }
};

// =============================================================================
// Rewriting
// =============================================================================

TEST_F(CitationTest, NormalizeKey) {
    EXPECT_EQ(normalize_citation_key("Smith2020"), "smith2020");
    EXPECT_EQ(normalize_citation_key(" Van Dyke2019a "), "vandyke2019a");
}

TEST_F(CitationTest, SingleCitation) {
    EXPECT_EQ(resolve_citations("see [Smith2020]."), "see \\cite{smith2020}.");
}

TEST_F(CitationTest, DisambiguationLetter) {
    EXPECT_EQ(resolve_citations("[Smith2020a]"), "\\cite{smith2020a}");
}

TEST_F(CitationTest, MultiCitationIsOneCommand) {
    std::string out = resolve_citations("[Smith2020; Jones2021]");
    EXPECT_EQ(out, "\\cite{smith2020,jones2021}");
    EXPECT_EQ(count_of(out, "\\cite{"), 1u);
}

TEST_F(CitationTest, MultiCitationWithoutSpaces) {
    EXPECT_EQ(resolve_citations("[Abe2020;Bo2021;Cy2022b]"), "\\cite{abe2020,bo2021,cy2022b}");
}

TEST_F(CitationTest, MultiPassAloneLeavesSingleTags) {
    EXPECT_EQ(resolve_multi_citations("[Lee2022] and [A2020; B2021]"),
              "[Lee2022] and \\cite{a2020,b2021}");
}

TEST_F(CitationTest, MixedSingleAndMulti) {
    EXPECT_EQ(resolve_citations("As shown [Lee2022], and later [Kim2019; Park2020]."),
              "As shown \\cite{lee2022}, and later \\cite{kim2019,park2020}.");
}

TEST_F(CitationTest, NonCitationBracketsUntouched) {
    EXPECT_EQ(resolve_citations("[1] [see above] [Smith20] [2020]"),
              "[1] [see above] [Smith20] [2020]");
    // disambiguation letter must be lowercase
    EXPECT_EQ(resolve_citations("[Smith2020A]"), "[Smith2020A]");
}

// =============================================================================
// Extraction
// =============================================================================

TEST_F(CitationTest, ExtractKeysSortedUnique) {
    std::vector<std::string> keys = extract_citation_keys(
        "\\cite{lee2022} then \\cite{smith2020,jones2021} and \\cite{lee2022}");
    std::vector<std::string> expected = {"jones2021", "lee2022", "smith2020"};
    EXPECT_EQ(keys, expected);
}

TEST_F(CitationTest, ExtractNormalizesCommandArguments) {
    std::vector<std::string> keys = extract_citation_keys("\\cite{Abe2020, bo2021}");
    std::vector<std::string> expected = {"abe2020", "bo2021"};
    EXPECT_EQ(keys, expected);
}

TEST_F(CitationTest, ExtractResidualBracketTags) {
    std::vector<std::string> keys = extract_citation_keys("[Smith2020; Lee2022] and [Abe2019]");
    std::vector<std::string> expected = {"abe2019", "lee2022", "smith2020"};
    EXPECT_EQ(keys, expected);
}

TEST_F(CitationTest, ExtractSameKeysBeforeAndAfterRewrite) {
    std::string raw = "[Kim2019; Park2020] agree with [Lee2022] and [Kim2019].";
    EXPECT_EQ(extract_citation_keys(raw), extract_citation_keys(resolve_citations(raw)));
}

TEST_F(CitationTest, ExtractEmpty) {
    EXPECT_TRUE(extract_citation_keys("no citations here").empty());
}
