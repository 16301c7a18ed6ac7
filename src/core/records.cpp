#include "core/records.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace tfa {

namespace {

std::string to_upper_ascii(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::string to_lower_ascii(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

json optional_int_to_json(const std::optional<int>& value) {
    return value ? json(*value) : json(nullptr);
}

std::optional<int> optional_int_from_json(const json& j, const std::string& key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<int>();
}

json optional_timestamp_to_json(const std::optional<Timestamp>& ts) {
    return ts ? json(format_timestamp(*ts)) : json(nullptr);
}

std::optional<Timestamp> optional_timestamp_from_json(const json& j, const std::string& key) {
    if (!j.contains(key) || !j[key].is_string()) {
        return std::nullopt;
    }
    return parse_timestamp(j[key].get<std::string>());
}

Timestamp timestamp_from_json(const json& j, const std::string& key) {
    auto ts = optional_timestamp_from_json(j, key);
    return ts ? *ts : Timestamp{};
}

json optional_string_to_json(const std::optional<std::string>& s) {
    return s ? json(*s) : json(nullptr);
}

std::optional<std::string> optional_string_from_json(const json& j, const std::string& key) {
    if (!j.contains(key) || !j[key].is_string()) {
        return std::nullopt;
    }
    return j[key].get<std::string>();
}

}  // namespace

// ============================================================================
// Enumerations
// ============================================================================

std::string language_to_string(LanguageLabel language) {
    switch (language) {
        case LanguageLabel::FR: return "FR";
        case LanguageLabel::AR: return "AR";
        case LanguageLabel::DARIJA: return "DARIJA";
        default: return "FR";
    }
}

std::optional<LanguageLabel> language_from_string(const std::string& s) {
    std::string upper = to_upper_ascii(s);
    if (upper == "FR" || upper == "FRENCH") return LanguageLabel::FR;
    if (upper == "AR" || upper == "ARABIC") return LanguageLabel::AR;
    if (upper == "DARIJA") return LanguageLabel::DARIJA;
    return std::nullopt;
}

std::string polarity_to_string(Polarity polarity) {
    switch (polarity) {
        case Polarity::Positive: return "positive";
        case Polarity::Negative: return "negative";
        case Polarity::Neutral: return "neutral";
        default: return "neutral";
    }
}

Polarity polarity_from_string(const std::string& s) {
    std::string lower = to_lower_ascii(s);
    if (lower == "positive") return Polarity::Positive;
    if (lower == "negative") return Polarity::Negative;
    return Polarity::Neutral;
}

std::string insight_kind_to_string(InsightKind kind) {
    switch (kind) {
        case InsightKind::LowSignal: return "low-signal";
        case InsightKind::Trend: return "trend";
        case InsightKind::Recommendation: return "recommendation";
        case InsightKind::Anomaly: return "anomaly";
        default: return "trend";
    }
}

InsightKind insight_kind_from_string(const std::string& s) {
    std::string lower = to_lower_ascii(s);
    if (lower == "low-signal" || lower == "low_signal" || lower == "signal_faible") {
        return InsightKind::LowSignal;
    }
    if (lower == "recommendation") return InsightKind::Recommendation;
    if (lower == "anomaly") return InsightKind::Anomaly;
    return InsightKind::Trend;
}

// ============================================================================
// Timestamps
// ============================================================================

std::string format_timestamp(Timestamp ts) {
    auto time = std::chrono::system_clock::to_time_t(ts);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

std::optional<Timestamp> parse_timestamp(const std::string& s) {
    if (s.size() < 10) {
        return std::nullopt;
    }

    std::tm tm{};
    std::istringstream ss(s);

    if (s.size() >= 19 && (s[10] == 'T' || s[10] == ' ')) {
        std::string normalized = s.substr(0, 19);
        normalized[10] = 'T';
        ss.str(normalized);
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    } else {
        ss.str(s.substr(0, 10));
        ss >> std::get_time(&tm, "%Y-%m-%d");
    }

    if (ss.fail()) {
        return std::nullopt;
    }

    std::time_t time = timegm(&tm);
    if (time == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(time);
}

// ============================================================================
// SentimentResult
// ============================================================================

json SentimentResult::to_json() const {
    json j;
    j["polarity"] = polarity_to_string(polarity);
    j["score"] = score;
    j["confidence"] = confidence;
    j["source_label"] = source_label;
    return j;
}

SentimentResult SentimentResult::from_json(const json& j) {
    SentimentResult r;
    r.polarity = polarity_from_string(j.value("polarity", "neutral"));
    r.score = j.value("score", 0.0);
    r.confidence = j.value("confidence", 0.0);
    r.source_label = j.value("source_label", "");
    return r;
}

// ============================================================================
// EvaluationText
// ============================================================================

json EvaluationText::to_json() const {
    json j;
    j["id"] = id;
    j["evaluation_id"] = evaluation_id;
    j["formation_id"] = formation_id;
    j["formation_type"] = formation_type;
    j["trainer_id"] = trainer_id;
    j["satisfaction"] = optional_int_to_json(satisfaction);
    j["content"] = optional_int_to_json(content);
    j["logistics"] = optional_int_to_json(logistics);
    j["applicability"] = optional_int_to_json(applicability);
    j["comment"] = comment;
    j["declared_language"] = declared_language
        ? json(language_to_string(*declared_language)) : json(nullptr);
    j["date"] = optional_timestamp_to_json(date);
    j["source_file"] = source_file;
    return j;
}

EvaluationText EvaluationText::from_json(const json& j) {
    EvaluationText e;
    e.id = j.value("id", static_cast<int64_t>(0));
    e.evaluation_id = j.value("evaluation_id", "");
    e.formation_id = j.value("formation_id", "");
    e.formation_type = j.value("formation_type", "");
    e.trainer_id = j.value("trainer_id", "");
    e.satisfaction = optional_int_from_json(j, "satisfaction");
    e.content = optional_int_from_json(j, "content");
    e.logistics = optional_int_from_json(j, "logistics");
    e.applicability = optional_int_from_json(j, "applicability");
    e.comment = j.value("comment", "");
    if (j.contains("declared_language") && j["declared_language"].is_string()) {
        e.declared_language = language_from_string(j["declared_language"].get<std::string>());
    }
    e.date = optional_timestamp_from_json(j, "date");
    e.source_file = j.value("source_file", "");
    return e;
}

// ============================================================================
// Analysis
// ============================================================================

json Analysis::to_json() const {
    json j;
    j["id"] = id;
    j["evaluation_id"] = evaluation_id;
    j["language"] = language_to_string(language);
    j["detected_language"] = language_to_string(detected_language);
    j["language_confidence"] = language_confidence;
    j["sentiment"] = sentiment.to_json();
    j["sentiment_strategy"] = sentiment_strategy;
    j["themes"] = themes;
    j["theme_strategy"] = theme_strategy;
    j["cluster_id"] = cluster_id ? json(*cluster_id) : json(nullptr);
    j["embedding"] = embedding;
    j["model_version"] = model_version;
    j["processed_at"] = format_timestamp(processed_at);
    return j;
}

Analysis Analysis::from_json(const json& j) {
    Analysis a;
    a.id = j.value("id", static_cast<int64_t>(0));
    a.evaluation_id = j.value("evaluation_id", static_cast<int64_t>(0));
    a.language = language_from_string(j.value("language", "FR")).value_or(LanguageLabel::FR);
    a.detected_language = language_from_string(j.value("detected_language", "FR"))
                              .value_or(LanguageLabel::FR);
    a.language_confidence = j.value("language_confidence", 0.0);
    if (j.contains("sentiment")) {
        a.sentiment = SentimentResult::from_json(j["sentiment"]);
    }
    a.sentiment_strategy = j.value("sentiment_strategy", "");
    a.themes = j.value("themes", std::vector<std::string>{});
    a.theme_strategy = j.value("theme_strategy", "");
    if (j.contains("cluster_id") && !j["cluster_id"].is_null()) {
        a.cluster_id = j["cluster_id"].get<int64_t>();
    }
    a.embedding = j.value("embedding", std::vector<float>{});
    a.model_version = j.value("model_version", "");
    a.processed_at = timestamp_from_json(j, "processed_at");
    return a;
}

// ============================================================================
// PersistedCluster
// ============================================================================

json PersistedCluster::to_json() const {
    json j;
    j["id"] = id;
    j["label"] = label;
    j["cluster_number"] = cluster_number;
    j["size"] = size;
    j["representative_themes"] = representative_themes;
    j["avg_sentiment"] = avg_sentiment;
    j["centroid"] = centroid;
    j["created_at"] = format_timestamp(created_at);
    return j;
}

PersistedCluster PersistedCluster::from_json(const json& j) {
    PersistedCluster c;
    c.id = j.value("id", static_cast<int64_t>(0));
    c.label = j.value("label", "");
    c.cluster_number = j.value("cluster_number", 0);
    c.size = j.value("size", static_cast<size_t>(0));
    c.representative_themes = j.value("representative_themes", std::vector<std::string>{});
    c.avg_sentiment = j.value("avg_sentiment", 0.0);
    c.centroid = j.value("centroid", std::vector<float>{});
    c.created_at = timestamp_from_json(j, "created_at");
    return c;
}

// ============================================================================
// GlobalTheme
// ============================================================================

json GlobalTheme::to_json() const {
    json j;
    j["id"] = id;
    j["name"] = name;
    j["language"] = language_to_string(language);
    j["frequency"] = frequency;
    j["keywords"] = keywords;
    j["created_at"] = format_timestamp(created_at);
    j["updated_at"] = format_timestamp(updated_at);
    return j;
}

GlobalTheme GlobalTheme::from_json(const json& j) {
    GlobalTheme t;
    t.id = j.value("id", static_cast<int64_t>(0));
    t.name = j.value("name", "");
    t.language = language_from_string(j.value("language", "FR")).value_or(LanguageLabel::FR);
    t.frequency = j.value("frequency", static_cast<int64_t>(0));
    t.keywords = j.value("keywords", std::vector<std::string>{});
    t.created_at = timestamp_from_json(j, "created_at");
    t.updated_at = timestamp_from_json(j, "updated_at");
    return t;
}

// ============================================================================
// Insight
// ============================================================================

json Insight::to_json() const {
    json j;
    j["id"] = id;
    j["kind"] = insight_kind_to_string(kind);
    j["title"] = title;
    j["description"] = description;
    j["data"] = data;
    j["confidence"] = confidence;
    j["formation_type"] = optional_string_to_json(formation_type);
    j["trainer_id"] = optional_string_to_json(trainer_id);
    j["date_range_start"] = optional_timestamp_to_json(date_range_start);
    j["date_range_end"] = optional_timestamp_to_json(date_range_end);
    j["created_at"] = format_timestamp(created_at);
    return j;
}

Insight Insight::from_json(const json& j) {
    Insight ins;
    ins.id = j.value("id", static_cast<int64_t>(0));
    ins.kind = insight_kind_from_string(j.value("kind", "trend"));
    ins.title = j.value("title", "");
    ins.description = j.value("description", "");
    ins.data = j.value("data", json::object());
    ins.confidence = j.value("confidence", 0.0);
    ins.formation_type = optional_string_from_json(j, "formation_type");
    ins.trainer_id = optional_string_from_json(j, "trainer_id");
    ins.date_range_start = optional_timestamp_from_json(j, "date_range_start");
    ins.date_range_end = optional_timestamp_from_json(j, "date_range_end");
    ins.created_at = timestamp_from_json(j, "created_at");
    return ins;
}

} // namespace tfa
