#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tfa {

// ============================================================================
// Enumerations
// ============================================================================

enum class LanguageLabel {
    FR,
    AR,
    DARIJA
};

std::string language_to_string(LanguageLabel language);

/**
 * @brief Parse "FR" / "AR" / "DARIJA" (case-insensitive)
 */
std::optional<LanguageLabel> language_from_string(const std::string& s);

enum class Polarity {
    Positive,
    Negative,
    Neutral
};

std::string polarity_to_string(Polarity polarity);
Polarity polarity_from_string(const std::string& s);

enum class InsightKind {
    LowSignal,
    Trend,
    Recommendation,
    Anomaly
};

std::string insight_kind_to_string(InsightKind kind);
InsightKind insight_kind_from_string(const std::string& s);

// ============================================================================
// Timestamps
// ============================================================================

using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Format as UTC "YYYY-MM-DDTHH:MM:SSZ"
 */
std::string format_timestamp(Timestamp ts);

/**
 * @brief Parse "YYYY-MM-DD", "YYYY-MM-DD HH:MM:SS" or "YYYY-MM-DDTHH:MM:SS[Z]" as UTC
 */
std::optional<Timestamp> parse_timestamp(const std::string& s);

// ============================================================================
// Records
// ============================================================================

/**
 * @brief Sentiment of one comment
 *
 * score is in [-1, 1] and its sign always agrees with polarity
 * (neutral <=> 0).
 */
struct SentimentResult {
    Polarity polarity = Polarity::Neutral;
    double score = 0.0;                     ///< Signed polarity strength
    double confidence = 0.0;                ///< Certainty in [0, 1]
    std::string source_label;               ///< Model label or rule tag

    nlohmann::json to_json() const;
    static SentimentResult from_json(const nlohmann::json& j);
};

/**
 * @brief One survey answer as delivered by ingestion (read-only here)
 */
struct EvaluationText {
    int64_t id = 0;                         ///< Store identity
    std::string evaluation_id;              ///< External identifier
    std::string formation_id;
    std::string formation_type;
    std::string trainer_id;

    // Ratings 1..5, absent when not answered
    std::optional<int> satisfaction;
    std::optional<int> content;
    std::optional<int> logistics;
    std::optional<int> applicability;

    std::string comment;
    std::optional<LanguageLabel> declared_language;
    std::optional<Timestamp> date;
    std::string source_file;

    nlohmann::json to_json() const;
    static EvaluationText from_json(const nlohmann::json& j);
};

/**
 * @brief Analysis produced for one evaluation
 */
struct Analysis {
    int64_t id = 0;
    int64_t evaluation_id = 0;

    LanguageLabel language = LanguageLabel::FR;          ///< Declared or detected
    LanguageLabel detected_language = LanguageLabel::FR; ///< Classifier output
    double language_confidence = 0.0;

    SentimentResult sentiment;
    std::string sentiment_strategy;         ///< "remote", "rule-based", "empty"

    std::vector<std::string> themes;
    std::string theme_strategy;             ///< "vectorizer", "frequency", "empty"

    std::optional<int64_t> cluster_id;
    std::vector<float> embedding;

    std::string model_version;
    Timestamp processed_at{};

    nlohmann::json to_json() const;
    static Analysis from_json(const nlohmann::json& j);
};

struct PersistedCluster {
    int64_t id = 0;
    std::string label;                      ///< "Cluster N"
    int cluster_number = 0;
    size_t size = 0;
    std::vector<std::string> representative_themes;
    double avg_sentiment = 0.0;
    std::vector<float> centroid;
    Timestamp created_at{};

    nlohmann::json to_json() const;
    static PersistedCluster from_json(const nlohmann::json& j);
};

/**
 * @brief Corpus-wide theme counter, unique per (name, language)
 */
struct GlobalTheme {
    int64_t id = 0;
    std::string name;
    LanguageLabel language = LanguageLabel::FR;
    int64_t frequency = 0;
    std::vector<std::string> keywords;
    Timestamp created_at{};
    Timestamp updated_at{};

    nlohmann::json to_json() const;
    static GlobalTheme from_json(const nlohmann::json& j);
};

struct Insight {
    int64_t id = 0;
    InsightKind kind = InsightKind::Trend;
    std::string title;
    std::string description;
    nlohmann::json data = nlohmann::json::object();
    double confidence = 0.0;

    // Optional scoping
    std::optional<std::string> formation_type;
    std::optional<std::string> trainer_id;
    std::optional<Timestamp> date_range_start;
    std::optional<Timestamp> date_range_end;

    Timestamp created_at{};

    nlohmann::json to_json() const;
    static Insight from_json(const nlohmann::json& j);
};

} // namespace tfa
