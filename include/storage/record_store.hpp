#pragma once

#include "core/records.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace tfa {

/**
 * @brief Theme counts of one batch keyed by (name, language)
 */
using ThemeCounts = std::map<std::pair<std::string, LanguageLabel>, int64_t>;

// ============================================================================
// Record Store Interface
// ============================================================================

/**
 * @brief Persistence boundary for evaluations and everything derived from them
 *
 * Writes between begin() and commit() are applied together. rollback()
 * discards them. commit() that fails rolls back and throws PersistenceError.
 * A store has at most one open transaction; begin() on another thread waits
 * for it to end.
 */
class RecordStore {
public:
    virtual ~RecordStore() = default;

    // Evaluations (input, normally written by ingestion)
    virtual int64_t add_evaluation(EvaluationText evaluation) = 0;
    virtual std::vector<EvaluationText> evaluations() const = 0;
    virtual std::optional<EvaluationText> find_evaluation(int64_t id) const = 0;

    // Analyses
    virtual int64_t add_analysis(Analysis analysis) = 0;
    virtual std::vector<Analysis> analyses() const = 0;

    // Clusters
    virtual int64_t add_cluster(PersistedCluster cluster) = 0;
    virtual std::vector<PersistedCluster> clusters() const = 0;

    /**
     * @brief Add batch counts to the global themes, creating missing ones
     */
    virtual void merge_theme_counts(const ThemeCounts& counts, Timestamp now) = 0;

    /**
     * @brief Themes by decreasing frequency (ties by id)
     */
    virtual std::vector<GlobalTheme> top_themes(size_t limit) const = 0;

    // Insights
    virtual int64_t add_insight(Insight insight) = 0;
    virtual std::vector<Insight> insights() const = 0;

    // Transactions
    virtual void begin() = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;
};

/**
 * @brief Scoped transaction; rolls back unless committed
 */
class StoreTransaction {
public:
    explicit StoreTransaction(RecordStore& store);
    ~StoreTransaction();

    StoreTransaction(const StoreTransaction&) = delete;
    StoreTransaction& operator=(const StoreTransaction&) = delete;

    void commit();

private:
    RecordStore& store_;
    bool done_ = false;
};

// ============================================================================
// In-memory store
// ============================================================================

/**
 * @brief All records of a store
 */
struct StoreState {
    std::vector<EvaluationText> evaluations;
    std::vector<Analysis> analyses;
    std::vector<PersistedCluster> clusters;
    std::vector<GlobalTheme> themes;
    std::vector<Insight> insights;

    int64_t next_evaluation_id = 1;
    int64_t next_analysis_id = 1;
    int64_t next_cluster_id = 1;
    int64_t next_theme_id = 1;
    int64_t next_insight_id = 1;

    nlohmann::json to_json() const;
    static StoreState from_json(const nlohmann::json& j);
};

/**
 * @brief Store holding records in memory with snapshot transactions
 *
 * The thread that called begin() is the only writer until it commits or
 * rolls back. Writes from other threads, transactional or not, wait for the
 * transaction to end, so a rollback never discards them. Reads are not
 * blocked and may observe uncommitted writes.
 */
class InMemoryRecordStore : public RecordStore {
public:
    InMemoryRecordStore() = default;
    explicit InMemoryRecordStore(StoreState state);

    int64_t add_evaluation(EvaluationText evaluation) override;
    std::vector<EvaluationText> evaluations() const override;
    std::optional<EvaluationText> find_evaluation(int64_t id) const override;

    int64_t add_analysis(Analysis analysis) override;
    std::vector<Analysis> analyses() const override;

    int64_t add_cluster(PersistedCluster cluster) override;
    std::vector<PersistedCluster> clusters() const override;

    void merge_theme_counts(const ThemeCounts& counts, Timestamp now) override;
    std::vector<GlobalTheme> top_themes(size_t limit) const override;

    int64_t add_insight(Insight insight) override;
    std::vector<Insight> insights() const override;

    void begin() override;
    void commit() override;
    void rollback() override;

    bool in_transaction() const;
    StoreState snapshot() const;

protected:
    /**
     * @brief Make committed state durable (no-op in memory)
     *
     * @throws PersistenceError on failure
     */
    virtual void persist(const StoreState& state);

private:
    mutable std::mutex mutex_;              ///< Guards state_, saved_ and writer_
    StoreState state_;
    std::optional<StoreState> saved_;       ///< State at begin()

    std::mutex transaction_mutex_;          ///< Held from begin() to commit()/rollback()
    std::unique_lock<std::mutex> transaction_lock_;
    std::thread::id writer_;                ///< Thread owning the open transaction

    /**
     * @brief Wait for exclusive write access unless this thread owns the transaction
     */
    std::unique_lock<std::mutex> exclusive_write();

    bool owns_transaction() const;
    void end_transaction();
};

/**
 * @brief In-memory store loaded from and saved to a JSON document
 */
class JsonFileRecordStore : public InMemoryRecordStore {
public:
    /**
     * @brief Open the store at path; a missing file starts empty
     *
     * @throws PersistenceError if the file exists but cannot be parsed
     */
    explicit JsonFileRecordStore(const std::string& path);

    const std::string& path() const { return path_; }

protected:
    void persist(const StoreState& state) override;

private:
    std::string path_;

    static StoreState load(const std::string& path);
};

} // namespace tfa
