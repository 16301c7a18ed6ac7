#include <gtest/gtest.h>
#include "storage/record_store.hpp"
#include "themes/theme_categorizer.hpp"
#include <chrono>

using namespace tfa;

namespace {

GlobalTheme theme(const std::string& name, int64_t frequency,
                  LanguageLabel language = LanguageLabel::FR) {
    GlobalTheme t;
    t.name = name;
    t.frequency = frequency;
    t.language = language;
    return t;
}

double percentage_sum(const CategoryBreakdown& breakdown) {
    double sum = 0.0;
    for (const auto& stats : breakdown.categories) {
        sum += stats.percentage;
    }
    return sum;
}

} // namespace

// ==========================================
// Categorize Tests
// ==========================================

TEST(ThemeCategorizerTest, KeywordMatching) {
    EXPECT_EQ(ThemeCategorizer::categorize("formateur", LanguageLabel::FR),
              ThemeCategory::TrainerCompetence);
    EXPECT_EQ(ThemeCategorizer::categorize("salle", LanguageLabel::FR),
              ThemeCategory::LogisticsOrganization);
    EXPECT_EQ(ThemeCategorizer::categorize("utile", LanguageLabel::FR),
              ThemeCategory::ApplicabilityUsefulness);
    EXPECT_EQ(ThemeCategorizer::categorize("المدرب", LanguageLabel::AR),
              ThemeCategory::TrainerCompetence);
}

TEST(ThemeCategorizerTest, MatchingIsCaseInsensitiveAndBidirectional) {
    // Theme contains the keyword
    EXPECT_EQ(ThemeCategorizer::categorize("Gestion du TEMPS", LanguageLabel::FR),
              ThemeCategory::LogisticsOrganization);
    // Keyword contains the theme
    EXPECT_EQ(ThemeCategorizer::categorize("pédago", LanguageLabel::FR),
              ThemeCategory::TrainerCompetence);
}

TEST(ThemeCategorizerTest, FirstCategoryWins) {
    // "pratique" is listed under both quality and applicability
    EXPECT_EQ(ThemeCategorizer::categorize("pratique", LanguageLabel::FR),
              ThemeCategory::FormationQuality);
}

TEST(ThemeCategorizerTest, UnmatchedGoesToFormationQuality) {
    EXPECT_EQ(ThemeCategorizer::categorize("zzz", LanguageLabel::FR),
              ThemeCategory::FormationQuality);
    EXPECT_EQ(ThemeCategorizer::categorize("zzz", LanguageLabel::DARIJA),
              ThemeCategory::FormationQuality);
}

TEST(ThemeCategorizerTest, CategoryNames) {
    EXPECT_EQ(category_to_string(ThemeCategory::FormationQuality), "Formation Quality");
    EXPECT_EQ(category_to_string(ThemeCategory::LogisticsOrganization),
              "Logistics & Organization");
}

// ==========================================
// Breakdown Tests
// ==========================================

TEST(ThemeCategorizerTest, PercentagesSumToHundred) {
    ThemeCategorizer categorizer;
    auto breakdown = categorizer.categorize_themes({
        theme("formateur", 3),
        theme("salle", 3),
        theme("utile", 3)
    });

    ASSERT_EQ(breakdown.categories.size(), 4u);
    EXPECT_NEAR(percentage_sum(breakdown), 100.0, 0.1);

    const auto& trainer = breakdown.get(ThemeCategory::TrainerCompetence);
    EXPECT_EQ(trainer.count, 1u);
    EXPECT_EQ(trainer.total_frequency, 3);
    EXPECT_DOUBLE_EQ(trainer.percentage, 33.3);
    EXPECT_DOUBLE_EQ(breakdown.get(ThemeCategory::FormationQuality).percentage, 0.0);
}

TEST(ThemeCategorizerTest, PercentagesAreWeightedByFrequency) {
    ThemeCategorizer categorizer;
    auto breakdown = categorizer.categorize_themes({
        theme("formation", 6),
        theme("contenu", 2),
        theme("salle", 2)
    });

    const auto& quality = breakdown.get(ThemeCategory::FormationQuality);
    EXPECT_EQ(quality.count, 2u);
    EXPECT_EQ(quality.total_frequency, 8);
    EXPECT_DOUBLE_EQ(quality.percentage, 80.0);
    EXPECT_DOUBLE_EQ(breakdown.get(ThemeCategory::LogisticsOrganization).percentage, 20.0);
    EXPECT_NEAR(percentage_sum(breakdown), 100.0, 0.1);
}

TEST(ThemeCategorizerTest, EmptyInputGivesZeroPercentages) {
    ThemeCategorizer categorizer;
    auto breakdown = categorizer.categorize_themes({});

    ASSERT_EQ(breakdown.categories.size(), 4u);
    for (const auto& stats : breakdown.categories) {
        EXPECT_EQ(stats.count, 0u);
        EXPECT_DOUBLE_EQ(stats.percentage, 0.0);
    }
}

TEST(ThemeCategorizerTest, JsonKeyedByCategoryName) {
    ThemeCategorizer categorizer;
    auto j = categorizer.categorize_themes({theme("salle", 4)}).to_json();

    ASSERT_TRUE(j.contains("Logistics & Organization"));
    EXPECT_EQ(j["Logistics & Organization"]["count"], 1);
    EXPECT_EQ(j["Logistics & Organization"]["themes"][0]["name"], "salle");
    EXPECT_EQ(j["Formation Quality"]["percentage"], 0.0);
}

TEST(ThemeCategorizerTest, TopThemesFromStore) {
    InMemoryRecordStore store;
    ThemeCounts counts;
    counts[{"salle", LanguageLabel::FR}] = 5;
    counts[{"formateur", LanguageLabel::FR}] = 3;
    counts[{"zzz", LanguageLabel::FR}] = 1;
    store.merge_theme_counts(counts, std::chrono::system_clock::now());

    ThemeCategorizer categorizer;
    auto breakdown = categorizer.get_categorized_themes(store, 2);

    EXPECT_EQ(breakdown.get(ThemeCategory::LogisticsOrganization).count, 1u);
    EXPECT_EQ(breakdown.get(ThemeCategory::TrainerCompetence).count, 1u);
    EXPECT_EQ(breakdown.get(ThemeCategory::FormationQuality).count, 0u);
    EXPECT_NEAR(percentage_sum(breakdown), 100.0, 0.1);
}
