#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "sentiment/sentiment_scorer.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>

using namespace tfa;
using json = nlohmann::json;

namespace {

// Scripted transport: returns the queued response or throws when asked to
class FakeHttpClient : public HttpClient {
public:
    HttpResponse response{200, "[]"};
    bool throw_transport_error = false;
    int calls = 0;
    std::string last_url;
    std::string last_body;

    HttpResponse post(const std::string& url, const std::string& body,
                      const std::vector<std::string>&, int) override {
        calls++;
        last_url = url;
        last_body = body;
        if (throw_transport_error) {
            throw HttpError("Connection refused");
        }
        return response;
    }
};

void expect_consistent(const SentimentResult& result) {
    switch (result.polarity) {
        case Polarity::Positive: EXPECT_GT(result.score, 0.0); break;
        case Polarity::Negative: EXPECT_LT(result.score, 0.0); break;
        case Polarity::Neutral: EXPECT_DOUBLE_EQ(result.score, 0.0); break;
    }
    EXPECT_GE(result.confidence, 0.0);
    EXPECT_LE(result.confidence, 1.0);
}

} // namespace

class SentimentScorerTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeHttpClient> http = std::make_shared<FakeHttpClient>();
    RemoteSentimentConfig config;

    std::unique_ptr<SentimentScorer> make_scorer(bool remote = true) {
        return make_sentiment_scorer(http, config, remote);
    }
};

// ==========================================
// Fallback Chain Tests
// ==========================================

TEST_F(SentimentScorerTest, RuleBasedFallbackWhenRemoteUnavailable) {
    http->response = {503, "Service Unavailable"};
    auto scorer = make_scorer();

    const std::vector<std::string> comments = {
        "excellent formation, formateur compétent",
        "excellent formation, formateur compétent",
        "excellent formation, formateur compétent",
        "formation décevante, mal organisée",
        "formation décevante, mal organisée"
    };

    int positive = 0;
    int negative = 0;
    for (const auto& comment : comments) {
        ScoredSentiment scored = scorer->analyze(comment, LanguageLabel::FR);
        EXPECT_EQ(scored.strategy, "rule-based");
        expect_consistent(scored.result);
        if (scored.result.polarity == Polarity::Positive) positive++;
        if (scored.result.polarity == Polarity::Negative) negative++;
    }

    EXPECT_GE(positive, 3);
    EXPECT_GE(negative, 2);
}

TEST_F(SentimentScorerTest, TransportErrorFallsBack) {
    http->throw_transport_error = true;
    auto scorer = make_scorer();

    ScoredSentiment scored = scorer->analyze("formation décevante", LanguageLabel::FR);
    EXPECT_EQ(scored.strategy, "rule-based");
    EXPECT_EQ(scored.result.polarity, Polarity::Negative);
    EXPECT_EQ(http->calls, 1);
}

TEST_F(SentimentScorerTest, RemoteResultIsUsedWhenAvailable) {
    http->response = {200, R"([[{"label": "5 stars", "score": 0.82},
                               {"label": "1 star", "score": 0.05}]])"};
    auto scorer = make_scorer();

    ScoredSentiment scored = scorer->analyze("Super formation", LanguageLabel::FR);
    EXPECT_EQ(scored.strategy, "remote");
    EXPECT_EQ(scored.result.polarity, Polarity::Positive);
    EXPECT_DOUBLE_EQ(scored.result.score, 0.82);
    EXPECT_EQ(scored.result.source_label, "5 stars");
    EXPECT_EQ(http->last_url, config.api_url + config.french_model);
}

TEST_F(SentimentScorerTest, NonOkSuccessStatusFallsBack) {
    // A 2xx other than 200 (e.g. 202 while the model is loading) is not a result
    http->response = {202, R"([{"label": "5 stars", "score": 0.9}])"};
    auto scorer = make_scorer();

    ScoredSentiment scored = scorer->analyze("formation décevante", LanguageLabel::FR);
    EXPECT_EQ(scored.strategy, "rule-based");
    EXPECT_EQ(scored.result.polarity, Polarity::Negative);
}

TEST_F(SentimentScorerTest, RemoteDisabledSkipsNetwork) {
    auto scorer = make_scorer(false);
    EXPECT_EQ(scorer->strategy_count(), 1u);

    ScoredSentiment scored = scorer->analyze("très bien", LanguageLabel::FR);
    EXPECT_EQ(scored.strategy, "rule-based");
    EXPECT_EQ(http->calls, 0);
}

TEST_F(SentimentScorerTest, BlankTextIsNeutralWithoutScoring) {
    auto scorer = make_scorer();
    ScoredSentiment scored = scorer->analyze("   ", LanguageLabel::AR);
    EXPECT_EQ(scored.strategy, "empty");
    EXPECT_EQ(scored.result.polarity, Polarity::Neutral);
    EXPECT_DOUBLE_EQ(scored.result.score, 0.0);
    EXPECT_DOUBLE_EQ(scored.result.confidence, 0.0);
    EXPECT_EQ(http->calls, 0);
}

TEST_F(SentimentScorerTest, ExhaustedChainIsNeutral) {
    http->response = {500, ""};
    SentimentScorer scorer({std::make_shared<RemoteSentimentModel>(http, config)});

    ScoredSentiment scored = scorer.analyze("formation", LanguageLabel::FR);
    EXPECT_EQ(scored.strategy, "none");
    EXPECT_EQ(scored.result.polarity, Polarity::Neutral);
}

TEST_F(SentimentScorerTest, RemoteInputIsTruncated) {
    config.max_chars = 4;
    http->response = {200, R"([{"label": "positive", "score": 0.9}])"};
    RemoteSentimentModel model(http, config);

    auto result = model.score("éééééééé", LanguageLabel::DARIJA);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(json::parse(http->last_body)["inputs"], "éééé");
    EXPECT_EQ(http->last_url, config.api_url + config.darija_model);
}

TEST_F(SentimentScorerTest, BatchUsesPerTextLanguage) {
    auto scorer = make_scorer(false);
    auto results = scorer->analyze_batch({"مفيد", "khayb"},
                                         {LanguageLabel::AR, LanguageLabel::DARIJA});
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].result.polarity, Polarity::Positive);
    EXPECT_EQ(results[1].result.polarity, Polarity::Negative);
}

// ==========================================
// Label Normalization Tests
// ==========================================

TEST_F(SentimentScorerTest, NormalizeLabels) {
    RemoteSentimentModel model(http, config);

    EXPECT_EQ(model.normalize("POSITIVE", 0.9).polarity, Polarity::Positive);
    EXPECT_EQ(model.normalize("negative", 0.9).polarity, Polarity::Negative);
    EXPECT_EQ(model.normalize("LABEL_1", 0.9).polarity, Polarity::Positive);
    EXPECT_EQ(model.normalize("LABEL_0", 0.9).polarity, Polarity::Negative);
    EXPECT_EQ(model.normalize("neutral", 0.99).polarity, Polarity::Neutral);
    EXPECT_EQ(model.normalize("something else", 0.99).polarity, Polarity::Neutral);

    SentimentResult negative = model.normalize("neg", 0.7);
    EXPECT_DOUBLE_EQ(negative.score, -0.7);
    EXPECT_DOUBLE_EQ(negative.confidence, 0.7);
}

TEST_F(SentimentScorerTest, NormalizeStarRatings) {
    RemoteSentimentModel model(http, config);

    EXPECT_EQ(model.normalize("5 stars", 0.8).polarity, Polarity::Positive);
    EXPECT_EQ(model.normalize("4 stars", 0.8).polarity, Polarity::Positive);
    EXPECT_EQ(model.normalize("3 stars", 0.8).polarity, Polarity::Neutral);
    EXPECT_EQ(model.normalize("2 stars", 0.8).polarity, Polarity::Negative);
    EXPECT_EQ(model.normalize("1 star", 0.8).polarity, Polarity::Negative);
}

TEST_F(SentimentScorerTest, LowConfidenceIsNeutral) {
    RemoteSentimentModel model(http, config);

    SentimentResult result = model.normalize("positive", 0.54);
    EXPECT_EQ(result.polarity, Polarity::Neutral);
    EXPECT_DOUBLE_EQ(result.score, 0.0);
    EXPECT_DOUBLE_EQ(result.confidence, 0.54);

    EXPECT_EQ(model.normalize("positive", 0.55).polarity, Polarity::Positive);
}

TEST_F(SentimentScorerTest, TopPredictionShapes) {
    auto flat = RemoteSentimentModel::top_prediction(
        json::parse(R"([{"label": "a", "score": 0.2}, {"label": "b", "score": 0.7}])"));
    ASSERT_TRUE(flat.has_value());
    EXPECT_EQ((*flat)["label"], "b");

    auto nested = RemoteSentimentModel::top_prediction(
        json::parse(R"([[{"label": "x", "score": 0.6}, {"label": "y", "score": 0.4}]])"));
    ASSERT_TRUE(nested.has_value());
    EXPECT_EQ((*nested)["label"], "x");

    EXPECT_FALSE(RemoteSentimentModel::top_prediction(json::parse("[]")).has_value());
    EXPECT_FALSE(RemoteSentimentModel::top_prediction(
        json::parse(R"({"error": "Model is loading"})")).has_value());
}

TEST_F(SentimentScorerTest, ModelPerLanguage) {
    RemoteSentimentModel model(http, config);
    EXPECT_EQ(model.model_for(LanguageLabel::FR), config.french_model);
    EXPECT_EQ(model.model_for(LanguageLabel::AR), config.arabic_model);
    EXPECT_EQ(model.model_for(LanguageLabel::DARIJA), config.darija_model);
}

// ==========================================
// Rule-Based Tests
// ==========================================

TEST(RuleBasedSentimentTest, NegativeWinsTies) {
    RuleBasedSentiment rules;
    // One positive ("bien") and one negative ("problème") entry
    auto result = rules.score("bien mais problème", LanguageLabel::FR);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->polarity, Polarity::Negative);
    EXPECT_DOUBLE_EQ(result->score, -0.65);
    EXPECT_DOUBLE_EQ(result->confidence, 0.6);
}

TEST(RuleBasedSentimentTest, ScoresAreCapped) {
    RuleBasedSentiment rules;
    auto result = rules.score("excellent parfait super génial utile efficace",
                              LanguageLabel::FR);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->polarity, Polarity::Positive);
    EXPECT_DOUBLE_EQ(result->score, 0.8);
    EXPECT_DOUBLE_EQ(result->confidence, 0.75);
}

TEST(RuleBasedSentimentTest, NoHitsIsNeutral) {
    RuleBasedSentiment rules;
    auto result = rules.score("la salle se trouve au deuxième étage", LanguageLabel::FR);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->polarity, Polarity::Neutral);
    EXPECT_DOUBLE_EQ(result->score, 0.0);
    EXPECT_DOUBLE_EQ(result->confidence, 0.5);
}

TEST(RuleBasedSentimentTest, LexiconsIncludeOtherLanguages) {
    RuleBasedSentiment rules;
    const auto& darija = rules.lexicon_for(LanguageLabel::DARIJA);
    EXPECT_EQ(darija.positive.front(), "mezyan");
    EXPECT_NE(std::find(darija.positive.begin(), darija.positive.end(), "excellent"),
              darija.positive.end());

    // French words are recognized in a Darija comment
    auto result = rules.score("lformation kanet excellent", LanguageLabel::DARIJA);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->polarity, Polarity::Positive);
}
