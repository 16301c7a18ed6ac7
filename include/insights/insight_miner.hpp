#pragma once

#include "core/records.hpp"
#include "storage/record_store.hpp"
#include <functional>
#include <vector>

namespace tfa {

/**
 * @brief Thresholds of the insight rules
 */
struct InsightMinerConfig {
    double low_satisfaction_threshold = 3.0;    ///< Formation mean below this
    double low_satisfaction_confidence = 0.9;

    double top_trainer_threshold = 4.5;         ///< Trainer mean at or above this
    size_t top_trainer_min_evaluations = 5;
    double top_trainer_confidence = 0.95;

    int recent_window_days = 7;
    double negative_share_threshold = 30.0;     ///< Percent of recent analyses
    double negative_shift_confidence = 0.8;

    bool verbose = false;
};

/**
 * @brief Applies fixed statistical rules to the store and records insights
 *
 * Every call inserts new insights; repeated runs on the same data produce
 * equivalent duplicates.
 */
class InsightMiner {
public:
    using Clock = std::function<Timestamp()>;

    explicit InsightMiner(InsightMinerConfig config = {}, Clock clock = nullptr);

    /**
     * @brief Evaluate all rules and persist the results in one transaction
     *
     * @throws PersistenceError if the commit fails (nothing is kept)
     */
    std::vector<Insight> generate(RecordStore& store) const;

    /**
     * @brief Evaluate the rules without writing
     */
    std::vector<Insight> evaluate(const RecordStore& store) const;

private:
    InsightMinerConfig config_;
    Clock clock_;

    void low_satisfaction(const std::vector<EvaluationText>& evaluations, Timestamp now,
                          std::vector<Insight>& out) const;
    void top_trainers(const std::vector<EvaluationText>& evaluations, Timestamp now,
                      std::vector<Insight>& out) const;
    void negative_shift(const std::vector<EvaluationText>& evaluations,
                        const std::vector<Analysis>& analyses, Timestamp now,
                        std::vector<Insight>& out) const;
};

} // namespace tfa
