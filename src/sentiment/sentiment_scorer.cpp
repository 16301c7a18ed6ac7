#include "sentiment/sentiment_scorer.hpp"
#include "core/errors.hpp"
#include "core/text_utils.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <set>
#include <thread>

using json = nlohmann::json;

namespace tfa {

namespace {

SentimentLexicon french_lexicon() {
    return {
        {"excellent", "très bien", "parfait", "super", "génial", "bon", "bien",
         "satisfait", "satisfaisant", "intéressant", "utile", "efficace",
         "professionnel", "compétent", "clair", "dynamique", "enrichissant",
         "pertinent", "recommande"},
        {"mauvais", "nul", "décevant", "déçu", "insatisfait", "problème", "difficile",
         "compliqué", "incompréhensible", "ennuyeux", "perte de temps", "catastrophe",
         "inutile", "médiocre", "faible", "horrible", "terrible", "désastre",
         "incompétent", "mal", "pire", "vide", "superficiel", "obsolète",
         "périmé", "désengagé", "agressif", "fausse", "erreur", "pas terrible",
         "manque", "moyenne", "correct sans plus", "pas claire"}
    };
}

SentimentLexicon arabic_lexicon() {
    return {
        {"ممتاز", "جيد", "مفيد", "رائع"},
        {"سيء", "سيئة", "ضعيف", "قديم", "غير", "لا", "مضيعة"}
    };
}

SentimentLexicon darija_lexicon() {
    return {
        {"mezyan", "mzyan", "zwina", "labas", "top", "kamel"},
        {"khayb", "khayba", "machi mezyan", "ma3lich", "khsara", "walo",
         "ma kanet", "f9ir", "katastroph"}
    };
}

// Own entries first, then the other languages' entries not already present.
SentimentLexicon merge_lexicons(const SentimentLexicon& own,
                                const std::vector<SentimentLexicon>& others) {
    SentimentLexicon merged = own;
    std::set<std::string> seen_pos(own.positive.begin(), own.positive.end());
    std::set<std::string> seen_neg(own.negative.begin(), own.negative.end());
    for (const auto& other : others) {
        for (const auto& w : other.positive) {
            if (seen_pos.insert(w).second) merged.positive.push_back(w);
        }
        for (const auto& w : other.negative) {
            if (seen_neg.insert(w).second) merged.negative.push_back(w);
        }
    }
    return merged;
}

// "5 stars", "1_star", "4 Stars" -> 5, 1, 4
std::optional<int> parse_star_rating(const std::string& label) {
    if (label.empty() || label[0] < '1' || label[0] > '5') {
        return std::nullopt;
    }
    size_t pos = 1;
    while (pos < label.size() && (label[pos] == ' ' || label[pos] == '_')) {
        ++pos;
    }
    if (label.compare(pos, 4, "star") != 0) {
        return std::nullopt;
    }
    return label[0] - '0';
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // anonymous namespace

// ============================================================================
// RemoteSentimentModel
// ============================================================================

RemoteSentimentModel::RemoteSentimentModel(std::shared_ptr<HttpClient> http,
                                           RemoteSentimentConfig config)
    : http_(std::move(http)), config_(std::move(config)) {}

std::string RemoteSentimentModel::model_for(LanguageLabel language) const {
    switch (language) {
        case LanguageLabel::AR: return config_.arabic_model;
        case LanguageLabel::DARIJA: return config_.darija_model;
        case LanguageLabel::FR:
        default: return config_.french_model;
    }
}

std::optional<json> RemoteSentimentModel::top_prediction(const json& body) {
    if (!body.is_array() || body.empty()) {
        return std::nullopt;
    }

    const json& candidates = body[0].is_array() ? body[0] : body;

    std::optional<json> best;
    double best_score = -1.0;
    for (const auto& entry : candidates) {
        if (!entry.is_object() || !entry.contains("label") || !entry.contains("score")) {
            continue;
        }
        if (!entry["label"].is_string() || !entry["score"].is_number()) {
            continue;
        }
        double s = entry["score"].get<double>();
        if (s > best_score) {
            best_score = s;
            best = entry;
        }
    }
    return best;
}

SentimentResult RemoteSentimentModel::normalize(const std::string& label,
                                                double confidence) const {
    SentimentResult result;
    result.source_label = label;
    result.confidence = std::clamp(confidence, 0.0, 1.0);

    std::string lower = to_lower_utf8(label);

    enum class Direction { Positive, Negative, Neutral };
    Direction direction = Direction::Neutral;

    if (auto stars = parse_star_rating(lower)) {
        if (*stars >= 4) direction = Direction::Positive;
        else if (*stars <= 2) direction = Direction::Negative;
    } else if (contains(lower, "neu")) {
        direction = Direction::Neutral;
    } else if (contains(lower, "pos") || lower == "label_1") {
        direction = Direction::Positive;
    } else if (contains(lower, "neg") || lower == "label_0") {
        direction = Direction::Negative;
    }

    bool confident = result.confidence >= config_.confidence_threshold;
    if (direction == Direction::Positive && confident) {
        result.polarity = Polarity::Positive;
        result.score = result.confidence;
    } else if (direction == Direction::Negative && confident) {
        result.polarity = Polarity::Negative;
        result.score = -result.confidence;
    } else {
        result.polarity = Polarity::Neutral;
        result.score = 0.0;
    }
    return result;
}

std::optional<json> RemoteSentimentModel::query(const std::string& model,
                                                const std::string& text) {
    json payload;
    payload["inputs"] = truncate_utf8(text, config_.max_chars);

    std::vector<std::string> headers = {"Content-Type: application/json"};
    if (!config_.api_key.empty()) {
        headers.push_back("Authorization: Bearer " + config_.api_key);
    }

    std::string url = config_.api_url + model;
    int attempts = 0;
    int max_attempts = std::max(1, config_.max_retries);

    while (attempts < max_attempts) {
        try {
            HttpResponse response = http_->post(url, payload.dump(), headers,
                                                config_.timeout_seconds);
            if (!response.ok()) {
                throw HttpError("Sentiment API returned status " +
                                std::to_string(response.status) + ": " + response.body);
            }
            return json::parse(response.body);
        } catch (const std::exception& e) {
            attempts++;
            if (config_.verbose) {
                std::cerr << "[RemoteSentimentModel] Attempt " << attempts << "/"
                          << max_attempts << " failed for " << model << ": "
                          << e.what() << std::endl;
            }
            if (attempts >= max_attempts) {
                break;
            }
            // Exponential backoff
            std::this_thread::sleep_for(
                std::chrono::seconds(static_cast<int>(std::pow(2, attempts - 1)))
            );
        }
    }
    return std::nullopt;
}

std::optional<SentimentResult> RemoteSentimentModel::score(const std::string& text,
                                                           LanguageLabel language) {
    auto body = query(model_for(language), text);
    if (!body) {
        return std::nullopt;
    }

    auto top = top_prediction(*body);
    if (!top) {
        if (config_.verbose) {
            std::cerr << "[RemoteSentimentModel] Unexpected response shape" << std::endl;
        }
        return std::nullopt;
    }

    return normalize((*top)["label"].get<std::string>(), (*top)["score"].get<double>());
}

// ============================================================================
// RuleBasedSentiment
// ============================================================================

RuleBasedSentiment::RuleBasedSentiment() {
    SentimentLexicon fr = french_lexicon();
    SentimentLexicon ar = arabic_lexicon();
    SentimentLexicon da = darija_lexicon();

    lexicons_[LanguageLabel::FR] = merge_lexicons(fr, {ar, da});
    lexicons_[LanguageLabel::AR] = merge_lexicons(ar, {fr, da});
    lexicons_[LanguageLabel::DARIJA] = merge_lexicons(da, {fr, ar});
}

const SentimentLexicon& RuleBasedSentiment::lexicon_for(LanguageLabel language) const {
    auto it = lexicons_.find(language);
    if (it == lexicons_.end()) {
        return lexicons_.at(LanguageLabel::FR);
    }
    return it->second;
}

std::optional<SentimentResult> RuleBasedSentiment::score(const std::string& text,
                                                         LanguageLabel language) {
    const SentimentLexicon& lexicon = lexicon_for(language);
    std::string lower = to_lower_utf8(text);

    int pos_count = 0;
    int neg_count = 0;
    for (const auto& word : lexicon.positive) {
        if (contains(lower, word)) pos_count++;
    }
    for (const auto& word : lexicon.negative) {
        if (contains(lower, word)) neg_count++;
    }

    SentimentResult result;
    if (neg_count > 0 && neg_count >= pos_count) {
        result.polarity = Polarity::Negative;
        result.score = -std::min(0.8, 0.5 + neg_count * 0.15);
        result.confidence = std::min(0.75, 0.5 + neg_count * 0.1);
        result.source_label = "negative (rule-based)";
    } else if (pos_count > neg_count) {
        result.polarity = Polarity::Positive;
        result.score = std::min(0.8, 0.5 + pos_count * 0.15);
        result.confidence = std::min(0.75, 0.5 + pos_count * 0.1);
        result.source_label = "positive (rule-based)";
    } else {
        result.polarity = Polarity::Neutral;
        result.score = 0.0;
        result.confidence = 0.5;
        result.source_label = "neutral (rule-based)";
    }
    return result;
}

// ============================================================================
// SentimentScorer
// ============================================================================

SentimentScorer::SentimentScorer(std::vector<std::shared_ptr<SentimentStrategy>> strategies,
                                 bool verbose)
    : strategies_(std::move(strategies)), verbose_(verbose) {}

ScoredSentiment SentimentScorer::analyze(const std::string& text,
                                         LanguageLabel language) const {
    ScoredSentiment scored;

    if (is_blank(text)) {
        scored.result.polarity = Polarity::Neutral;
        scored.result.score = 0.0;
        scored.result.confidence = 0.0;
        scored.result.source_label = "neutral";
        scored.strategy = "empty";
        return scored;
    }

    for (const auto& strategy : strategies_) {
        auto result = strategy->score(text, language);
        if (result) {
            scored.result = *result;
            scored.strategy = strategy->name();
            return scored;
        }
        if (verbose_) {
            std::cerr << "[SentimentScorer] " << strategy->name()
                      << " produced no result, falling back" << std::endl;
        }
    }

    // Chain exhausted (only possible without a rule-based link)
    scored.result.polarity = Polarity::Neutral;
    scored.result.score = 0.0;
    scored.result.confidence = 0.0;
    scored.result.source_label = "neutral";
    scored.strategy = "none";
    return scored;
}

std::vector<ScoredSentiment> SentimentScorer::analyze_batch(
    const std::vector<std::string>& texts,
    const std::vector<LanguageLabel>& languages
) const {
    std::vector<ScoredSentiment> results;
    results.reserve(texts.size());
    for (size_t i = 0; i < texts.size(); ++i) {
        LanguageLabel language = (i < languages.size()) ? languages[i] : LanguageLabel::FR;
        results.push_back(analyze(texts[i], language));
    }
    return results;
}

std::unique_ptr<SentimentScorer> make_sentiment_scorer(
    std::shared_ptr<HttpClient> http,
    const RemoteSentimentConfig& config,
    bool remote_enabled
) {
    std::vector<std::shared_ptr<SentimentStrategy>> chain;
    if (remote_enabled && http) {
        chain.push_back(std::make_shared<RemoteSentimentModel>(std::move(http), config));
    }
    chain.push_back(std::make_shared<RuleBasedSentiment>());
    return std::make_unique<SentimentScorer>(std::move(chain), config.verbose);
}

} // namespace tfa
