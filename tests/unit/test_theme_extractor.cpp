#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "themes/term_vectorizer.hpp"
#include "themes/theme_extractor.hpp"
#include <algorithm>

using namespace tfa;

namespace {

bool contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

} // namespace

// ==========================================
// Vectorizer Tests
// ==========================================

TEST(TermVectorizerTest, CountsNgramsAndPrunes) {
    VectorizerConfig config;
    config.stop_words = {"la", "de"};
    config.ngram_max = 2;
    config.min_count = 2;
    TermVectorizer vectorizer(config);

    auto terms = vectorizer.fit_transform("la salle de cours, la salle de pause");
    ASSERT_EQ(terms.size(), 1u);
    EXPECT_EQ(terms[0].term, "salle");
    EXPECT_EQ(terms[0].count, 2u);
}

TEST(TermVectorizerTest, VocabularyIsLexicographic) {
    TermVectorizer vectorizer;
    auto terms = vectorizer.fit_transform("zeta alpha mu");
    ASSERT_EQ(terms.size(), 3u);
    EXPECT_EQ(terms[0].term, "alpha");
    EXPECT_EQ(terms[1].term, "mu");
    EXPECT_EQ(terms[2].term, "zeta");
}

TEST(TermVectorizerTest, ShortTokensAreDropped) {
    TermVectorizer vectorizer;
    auto tokens = vectorizer.tokenize("a B cd É");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0], "cd");
}

TEST(TermVectorizerTest, EmptyVocabularyThrows) {
    VectorizerConfig config;
    config.min_count = 2;
    TermVectorizer vectorizer(config);
    EXPECT_THROW(vectorizer.fit_transform("un seul mot chacun"), VectorizerError);
    EXPECT_THROW(vectorizer.fit_transform(""), VectorizerError);
}

// ==========================================
// Extraction Tests
// ==========================================

class ThemeExtractorTest : public ::testing::Test {
protected:
    ThemeExtractor extractor;
};

TEST_F(ThemeExtractorTest, RepeatedTermsComeFromVectorizer) {
    auto extraction = extractor.extract_one(
        "La formation pratique était utile. La formation pratique manquait de temps.",
        LanguageLabel::FR);

    EXPECT_EQ(extraction.strategy, "vectorizer");
    ASSERT_EQ(extraction.themes.size(), 3u);
    EXPECT_EQ(extraction.themes[0], "formation");
    EXPECT_EQ(extraction.themes[1], "formation pratique");
    EXPECT_EQ(extraction.themes[2], "pratique");
}

TEST_F(ThemeExtractorTest, FallsBackToWordFrequency) {
    auto extraction = extractor.extract_one("Le formateur était excellent", LanguageLabel::FR);

    EXPECT_EQ(extraction.strategy, "frequency");
    ASSERT_EQ(extraction.themes.size(), 3u);
    EXPECT_EQ(extraction.themes[0], "formateur");
    EXPECT_EQ(extraction.themes[1], "était");
    EXPECT_EQ(extraction.themes[2], "excellent");
}

TEST_F(ThemeExtractorTest, BlankTextHasNoThemes) {
    auto extraction = extractor.extract_one("  ", LanguageLabel::FR);
    EXPECT_EQ(extraction.strategy, "empty");
    EXPECT_TRUE(extraction.themes.empty());
}

TEST_F(ThemeExtractorTest, TopNLimitsThemes) {
    auto extraction = extractor.extract_one(
        "salle salle café café pause pause projet projet", LanguageLabel::FR, 2);
    EXPECT_EQ(extraction.themes.size(), 2u);
}

TEST_F(ThemeExtractorTest, ArabicProfile) {
    auto extraction = extractor.extract_one("التدريب مفيد في العمل التدريب مفيد",
                                            LanguageLabel::AR);
    EXPECT_EQ(extraction.strategy, "vectorizer");
    EXPECT_TRUE(contains(extraction.themes, "التدريب مفيد"));
    EXPECT_FALSE(contains(extraction.themes, "في"));
}

TEST_F(ThemeExtractorTest, DarijaStopWordsRemoved) {
    auto extraction = extractor.extract_one(
        "lformation dyal lyoum mezyana, lformation dyal lyoum twila", LanguageLabel::DARIJA);
    EXPECT_EQ(extraction.strategy, "vectorizer");
    EXPECT_TRUE(contains(extraction.themes, "lformation lyoum"));
    for (const auto& theme : extraction.themes) {
        EXPECT_EQ(theme.find("dyal"), std::string::npos) << theme;
    }
}

TEST_F(ThemeExtractorTest, FrequencyKeywordsRankByCount) {
    auto keywords = ThemeExtractor::frequency_keywords(
        "Organisation organisation salle salle salle café", 5);
    ASSERT_EQ(keywords.size(), 3u);
    EXPECT_EQ(keywords[0], "salle");
    EXPECT_EQ(keywords[1], "organisation");
    EXPECT_EQ(keywords[2], "café");
}

// ==========================================
// Batch Tests
// ==========================================

TEST_F(ThemeExtractorTest, BatchInfo) {
    nlohmann::json info;
    auto results = extractor.extract_batch({"salle salle", "", "pause pause"},
                                           {LanguageLabel::FR, LanguageLabel::FR,
                                            LanguageLabel::FR},
                                           5, info);
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(info["method"], "count");
    EXPECT_EQ(info["n_texts"], 3);
    EXPECT_EQ(results[1].strategy, "empty");
}

TEST_F(ThemeExtractorTest, EmptyBatchHasEmptyInfo) {
    nlohmann::json info;
    auto results = extractor.extract_batch({}, {}, 5, info);
    EXPECT_TRUE(results.empty());
    EXPECT_TRUE(info.empty());
}

TEST_F(ThemeExtractorTest, GlobalThemesCountPerLanguage) {
    auto ranked = extractor.global_themes(
        {"salle salle", "salle salle", "salle salle"},
        {LanguageLabel::FR, LanguageLabel::FR, LanguageLabel::DARIJA});

    ASSERT_EQ(ranked.size(), 2u);
    EXPECT_EQ(ranked[0].theme, "salle");
    EXPECT_EQ(ranked[0].language, LanguageLabel::FR);
    EXPECT_EQ(ranked[0].frequency, 2);
    EXPECT_EQ(ranked[1].language, LanguageLabel::DARIJA);
    EXPECT_EQ(ranked[1].frequency, 1);
}
