#include "insights/insight_miner.hpp"
#include "core/errors.hpp"
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <unordered_map>

using json = nlohmann::json;

namespace tfa {

namespace {

std::string format_fixed(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

struct RatingGroup {
    double sum = 0.0;
    size_t rated = 0;                       ///< Evaluations with a satisfaction rating
    size_t total = 0;                       ///< All evaluations in the group

    bool has_mean() const { return rated > 0; }
    double mean() const { return sum / static_cast<double>(rated); }
};

} // anonymous namespace

InsightMiner::InsightMiner(InsightMinerConfig config, Clock clock)
    : config_(std::move(config)), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

void InsightMiner::low_satisfaction(const std::vector<EvaluationText>& evaluations,
                                    Timestamp now, std::vector<Insight>& out) const {
    std::map<std::string, RatingGroup> groups;
    for (const auto& e : evaluations) {
        if (e.formation_type.empty()) continue;
        RatingGroup& g = groups[e.formation_type];
        g.total++;
        if (e.satisfaction) {
            g.sum += *e.satisfaction;
            g.rated++;
        }
    }

    for (const auto& [formation, group] : groups) {
        if (!group.has_mean() || group.mean() >= config_.low_satisfaction_threshold) {
            continue;
        }
        double avg = group.mean();

        Insight insight;
        insight.kind = InsightKind::LowSignal;
        insight.title = "Low satisfaction for " + formation;
        insight.description = "Formation '" + formation + "' has a mean satisfaction of " +
                              format_fixed(avg, 2) + "/5, below the acceptable threshold.";
        insight.data = {{"formation", formation}, {"avg_satisfaction", avg}};
        insight.confidence = config_.low_satisfaction_confidence;
        insight.formation_type = formation;
        insight.created_at = now;
        out.push_back(std::move(insight));
    }
}

void InsightMiner::top_trainers(const std::vector<EvaluationText>& evaluations,
                                Timestamp now, std::vector<Insight>& out) const {
    std::map<std::string, RatingGroup> groups;
    for (const auto& e : evaluations) {
        if (e.trainer_id.empty()) continue;
        RatingGroup& g = groups[e.trainer_id];
        g.total++;
        if (e.satisfaction) {
            g.sum += *e.satisfaction;
            g.rated++;
        }
    }

    for (const auto& [trainer, group] : groups) {
        if (!group.has_mean() || group.mean() < config_.top_trainer_threshold ||
            group.total < config_.top_trainer_min_evaluations) {
            continue;
        }
        double avg = group.mean();

        Insight insight;
        insight.kind = InsightKind::Trend;
        insight.title = "Excellent trainer: " + trainer;
        insight.description = "Trainer " + trainer + " reaches an exceptional satisfaction of " +
                              format_fixed(avg, 2) + "/5 over " + std::to_string(group.total) +
                              " evaluations.";
        insight.data = {{"trainer", trainer},
                        {"avg_satisfaction", avg},
                        {"evaluations", group.total}};
        insight.confidence = config_.top_trainer_confidence;
        insight.trainer_id = trainer;
        insight.created_at = now;
        out.push_back(std::move(insight));
    }
}

void InsightMiner::negative_shift(const std::vector<EvaluationText>& evaluations,
                                  const std::vector<Analysis>& analyses,
                                  Timestamp now, std::vector<Insight>& out) const {
    Timestamp window_start = now - std::chrono::hours(24 * config_.recent_window_days);

    std::unordered_map<int64_t, Timestamp> dates;
    for (const auto& e : evaluations) {
        if (e.date) {
            dates[e.id] = *e.date;
        }
    }

    int positive = 0;
    int neutral = 0;
    int negative = 0;
    for (const auto& a : analyses) {
        auto it = dates.find(a.evaluation_id);
        if (it == dates.end() || it->second < window_start) continue;
        switch (a.sentiment.polarity) {
            case Polarity::Positive: positive++; break;
            case Polarity::Negative: negative++; break;
            case Polarity::Neutral: neutral++; break;
        }
    }

    int total = positive + neutral + negative;
    if (total == 0) {
        return;
    }

    double negative_pct = static_cast<double>(negative) / total * 100.0;
    if (negative_pct <= config_.negative_share_threshold) {
        return;
    }

    Insight insight;
    insight.kind = InsightKind::Trend;
    insight.title = "Rise in negative sentiment";
    insight.description = format_fixed(negative_pct, 1) + "% of recent evaluations (last " +
                          std::to_string(config_.recent_window_days) +
                          " days) express a negative sentiment.";
    insight.data = {
        {"sentiment_distribution", {{"positive", positive},
                                    {"neutral", neutral},
                                    {"negative", negative}}},
        {"negative_percentage", negative_pct}
    };
    insight.confidence = config_.negative_shift_confidence;
    insight.date_range_start = window_start;
    insight.date_range_end = now;
    insight.created_at = now;
    out.push_back(std::move(insight));
}

std::vector<Insight> InsightMiner::evaluate(const RecordStore& store) const {
    Timestamp now = clock_();
    auto evaluations = store.evaluations();

    std::vector<Insight> insights;
    low_satisfaction(evaluations, now, insights);
    top_trainers(evaluations, now, insights);
    negative_shift(evaluations, store.analyses(), now, insights);
    return insights;
}

std::vector<Insight> InsightMiner::generate(RecordStore& store) const {
    std::vector<Insight> insights = evaluate(store);

    try {
        StoreTransaction transaction(store);
        for (auto& insight : insights) {
            insight.id = store.add_insight(insight);
        }
        transaction.commit();
    } catch (const PersistenceError&) {
        throw;
    } catch (const std::exception& e) {
        throw PersistenceError(std::string("Error saving insights: ") + e.what());
    }

    if (config_.verbose) {
        std::cout << "[InsightMiner] Generated " << insights.size()
                  << " new insights" << std::endl;
    }
    return insights;
}

} // namespace tfa
