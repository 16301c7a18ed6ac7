#pragma once

#include "core/records.hpp"
#include "http/http_client.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tfa {

// ============================================================================
// Strategy Interface
// ============================================================================

/**
 * @brief One link of the sentiment fallback chain
 *
 * Returning std::nullopt hands the text to the next strategy.
 */
class SentimentStrategy {
public:
    virtual ~SentimentStrategy() = default;

    virtual std::string name() const = 0;

    virtual std::optional<SentimentResult> score(const std::string& text,
                                                 LanguageLabel language) = 0;
};

/**
 * @brief Configuration for the hosted sentiment models
 */
struct RemoteSentimentConfig {
    std::string api_url = "https://api-inference.huggingface.co/models/";
    std::string api_key;                    ///< Bearer token (optional)
    std::string french_model = "cmarkea/distilcamembert-base-sentiment";
    std::string arabic_model = "CAMeL-Lab/bert-base-arabic-camelbert-msa-sentiment";
    std::string darija_model = "SI2M-Lab/DarijaBERT";
    int timeout_seconds = 10;
    size_t max_chars = 512;                 ///< Input truncation, in code points
    int max_retries = 1;                    ///< Total attempts per text
    double confidence_threshold = 0.55;
    bool verbose = false;
};

/**
 * @brief Scores text with a hosted classification model per language
 */
class RemoteSentimentModel : public SentimentStrategy {
public:
    RemoteSentimentModel(std::shared_ptr<HttpClient> http, RemoteSentimentConfig config);

    std::string name() const override { return "remote"; }

    std::optional<SentimentResult> score(const std::string& text,
                                         LanguageLabel language) override;

    std::string model_for(LanguageLabel language) const;

    /**
     * @brief Pick the top-scoring {label, score} entry of a model response
     *
     * Accepts a flat list or a list nested one level deep.
     */
    static std::optional<nlohmann::json> top_prediction(const nlohmann::json& body);

    /**
     * @brief Map a model label and its confidence onto polarity and score
     */
    SentimentResult normalize(const std::string& label, double confidence) const;

    const RemoteSentimentConfig& config() const { return config_; }

private:
    std::shared_ptr<HttpClient> http_;
    RemoteSentimentConfig config_;

    std::optional<nlohmann::json> query(const std::string& model, const std::string& text);
};

/**
 * @brief Positive and negative lexicon of one language
 */
struct SentimentLexicon {
    std::vector<std::string> positive;
    std::vector<std::string> negative;
};

/**
 * @brief Lexicon rule scorer; always produces a result
 */
class RuleBasedSentiment : public SentimentStrategy {
public:
    RuleBasedSentiment();

    std::string name() const override { return "rule-based"; }

    std::optional<SentimentResult> score(const std::string& text,
                                         LanguageLabel language) override;

    /**
     * @brief Lexicon consulted for a language (its own words plus the others')
     */
    const SentimentLexicon& lexicon_for(LanguageLabel language) const;

private:
    std::map<LanguageLabel, SentimentLexicon> lexicons_;
};

// ============================================================================
// Scorer
// ============================================================================

/**
 * @brief Sentiment plus the name of the strategy that produced it
 */
struct ScoredSentiment {
    SentimentResult result;
    std::string strategy;                   ///< "remote", "rule-based" or "empty"
};

/**
 * @brief Ordered fallback chain of sentiment strategies
 */
class SentimentScorer {
public:
    explicit SentimentScorer(std::vector<std::shared_ptr<SentimentStrategy>> strategies,
                             bool verbose = false);

    ScoredSentiment analyze(const std::string& text, LanguageLabel language) const;

    std::vector<ScoredSentiment> analyze_batch(const std::vector<std::string>& texts,
                                               const std::vector<LanguageLabel>& languages) const;

    size_t strategy_count() const { return strategies_.size(); }

private:
    std::vector<std::shared_ptr<SentimentStrategy>> strategies_;
    bool verbose_;
};

/**
 * @brief Remote model (when enabled) followed by the rule-based scorer
 */
std::unique_ptr<SentimentScorer> make_sentiment_scorer(
    std::shared_ptr<HttpClient> http,
    const RemoteSentimentConfig& config,
    bool remote_enabled
);

} // namespace tfa
