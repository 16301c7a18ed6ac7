#include <gtest/gtest.h>
#include "core/records.hpp"

using namespace tfa;
using json = nlohmann::json;

// ==========================================
// Enumeration Tests
// ==========================================

TEST(RecordsTest, LanguageLabels) {
    EXPECT_EQ(language_to_string(LanguageLabel::DARIJA), "DARIJA");
    EXPECT_EQ(language_from_string("fr"), LanguageLabel::FR);
    EXPECT_EQ(language_from_string("Arabic"), LanguageLabel::AR);
    EXPECT_EQ(language_from_string("darija"), LanguageLabel::DARIJA);
    EXPECT_FALSE(language_from_string("en").has_value());
}

TEST(RecordsTest, InsightKinds) {
    EXPECT_EQ(insight_kind_to_string(InsightKind::LowSignal), "low-signal");
    EXPECT_EQ(insight_kind_from_string("signal_faible"), InsightKind::LowSignal);
    EXPECT_EQ(insight_kind_from_string("anything"), InsightKind::Trend);
}

// ==========================================
// Timestamp Tests
// ==========================================

TEST(RecordsTest, TimestampFormats) {
    auto date_only = parse_timestamp("2024-03-05");
    ASSERT_TRUE(date_only.has_value());
    EXPECT_EQ(format_timestamp(*date_only), "2024-03-05T00:00:00Z");

    auto with_space = parse_timestamp("2024-03-05 14:30:15");
    ASSERT_TRUE(with_space.has_value());
    EXPECT_EQ(format_timestamp(*with_space), "2024-03-05T14:30:15Z");

    auto iso = parse_timestamp("2024-03-05T14:30:15Z");
    ASSERT_TRUE(iso.has_value());
    EXPECT_EQ(*iso, *with_space);
}

TEST(RecordsTest, InvalidTimestamps) {
    EXPECT_FALSE(parse_timestamp("").has_value());
    EXPECT_FALSE(parse_timestamp("yesterday").has_value());
    EXPECT_FALSE(parse_timestamp("not-a-date").has_value());
}

// ==========================================
// Record JSON Tests
// ==========================================

TEST(RecordsTest, EvaluationFromIngestionJson) {
    json j = {
        {"evaluation_id", "EV-17"},
        {"formation_type", "Excel"},
        {"trainer_id", "T-3"},
        {"satisfaction", 4},
        {"content", nullptr},
        {"comment", "Très bien"},
        {"declared_language", "FR"},
        {"date", "2024-01-10"}
    };

    EvaluationText e = EvaluationText::from_json(j);
    EXPECT_EQ(e.id, 0);
    EXPECT_EQ(e.evaluation_id, "EV-17");
    EXPECT_EQ(e.satisfaction, 4);
    EXPECT_FALSE(e.content.has_value());
    EXPECT_FALSE(e.logistics.has_value());
    EXPECT_EQ(e.declared_language, LanguageLabel::FR);
    ASSERT_TRUE(e.date.has_value());
    EXPECT_EQ(format_timestamp(*e.date), "2024-01-10T00:00:00Z");

    json back = e.to_json();
    EXPECT_TRUE(back["content"].is_null());
    EXPECT_EQ(back["declared_language"], "FR");
}

TEST(RecordsTest, UnknownDeclaredLanguageIsIgnored) {
    EvaluationText e = EvaluationText::from_json({{"comment", "ok"}, {"declared_language", "EN"}});
    EXPECT_FALSE(e.declared_language.has_value());
}

TEST(RecordsTest, AnalysisWithoutCluster) {
    Analysis a;
    a.evaluation_id = 9;
    a.language = LanguageLabel::DARIJA;
    a.sentiment.polarity = Polarity::Negative;
    a.sentiment.score = -0.65;
    a.themes = {"salle"};

    json j = a.to_json();
    EXPECT_TRUE(j["cluster_id"].is_null());
    EXPECT_EQ(j["sentiment"]["polarity"], "negative");

    Analysis parsed = Analysis::from_json(j);
    EXPECT_FALSE(parsed.cluster_id.has_value());
    EXPECT_EQ(parsed.language, LanguageLabel::DARIJA);
    EXPECT_EQ(parsed.sentiment.polarity, Polarity::Negative);
    EXPECT_DOUBLE_EQ(parsed.sentiment.score, -0.65);
    EXPECT_EQ(parsed.themes, a.themes);
}

TEST(RecordsTest, InsightScopeSurvivesJson) {
    Insight insight;
    insight.kind = InsightKind::LowSignal;
    insight.title = "Low satisfaction for Excel";
    insight.data = {{"avg_satisfaction", 2.5}};
    insight.formation_type = "Excel";

    Insight parsed = Insight::from_json(insight.to_json());
    EXPECT_EQ(parsed.kind, InsightKind::LowSignal);
    EXPECT_EQ(parsed.formation_type, std::optional<std::string>("Excel"));
    EXPECT_FALSE(parsed.trainer_id.has_value());
    EXPECT_FALSE(parsed.date_range_start.has_value());
    EXPECT_DOUBLE_EQ(parsed.data["avg_satisfaction"].get<double>(), 2.5);
}
