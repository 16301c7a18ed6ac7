#include "storage/record_store.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>

using json = nlohmann::json;

namespace tfa {

namespace {

template<typename Record>
json records_to_json(const std::vector<Record>& records) {
    json arr = json::array();
    for (const auto& record : records) {
        arr.push_back(record.to_json());
    }
    return arr;
}

template<typename Record>
std::vector<Record> records_from_json(const json& j, const std::string& key) {
    std::vector<Record> records;
    if (!j.contains(key) || !j[key].is_array()) {
        return records;
    }
    for (const auto& item : j[key]) {
        records.push_back(Record::from_json(item));
    }
    return records;
}

template<typename Record>
int64_t next_id_after(const std::vector<Record>& records) {
    int64_t max_id = 0;
    for (const auto& record : records) {
        max_id = std::max(max_id, record.id);
    }
    return max_id + 1;
}

} // anonymous namespace

// ============================================================================
// StoreTransaction
// ============================================================================

StoreTransaction::StoreTransaction(RecordStore& store) : store_(store) {
    store_.begin();
}

StoreTransaction::~StoreTransaction() {
    if (!done_) {
        store_.rollback();
    }
}

void StoreTransaction::commit() {
    // A failed commit has already rolled back
    done_ = true;
    store_.commit();
}

// ============================================================================
// StoreState
// ============================================================================

json StoreState::to_json() const {
    json j;
    j["evaluations"] = records_to_json(evaluations);
    j["analyses"] = records_to_json(analyses);
    j["clusters"] = records_to_json(clusters);
    j["themes"] = records_to_json(themes);
    j["insights"] = records_to_json(insights);
    return j;
}

StoreState StoreState::from_json(const json& j) {
    StoreState state;
    state.evaluations = records_from_json<EvaluationText>(j, "evaluations");
    state.analyses = records_from_json<Analysis>(j, "analyses");
    state.clusters = records_from_json<PersistedCluster>(j, "clusters");
    state.themes = records_from_json<GlobalTheme>(j, "themes");
    state.insights = records_from_json<Insight>(j, "insights");

    state.next_evaluation_id = next_id_after(state.evaluations);
    state.next_analysis_id = next_id_after(state.analyses);
    state.next_cluster_id = next_id_after(state.clusters);
    state.next_theme_id = next_id_after(state.themes);
    state.next_insight_id = next_id_after(state.insights);
    return state;
}

// ============================================================================
// InMemoryRecordStore
// ============================================================================

InMemoryRecordStore::InMemoryRecordStore(StoreState state) : state_(std::move(state)) {}

int64_t InMemoryRecordStore::add_evaluation(EvaluationText evaluation) {
    auto exclusive = exclusive_write();
    std::lock_guard<std::mutex> lock(mutex_);
    if (evaluation.id <= 0) {
        evaluation.id = state_.next_evaluation_id;
    }
    state_.next_evaluation_id = std::max(state_.next_evaluation_id, evaluation.id + 1);
    state_.evaluations.push_back(std::move(evaluation));
    return state_.evaluations.back().id;
}

std::vector<EvaluationText> InMemoryRecordStore::evaluations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.evaluations;
}

std::optional<EvaluationText> InMemoryRecordStore::find_evaluation(int64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& evaluation : state_.evaluations) {
        if (evaluation.id == id) {
            return evaluation;
        }
    }
    return std::nullopt;
}

int64_t InMemoryRecordStore::add_analysis(Analysis analysis) {
    auto exclusive = exclusive_write();
    std::lock_guard<std::mutex> lock(mutex_);
    analysis.id = state_.next_analysis_id++;
    state_.analyses.push_back(std::move(analysis));
    return state_.analyses.back().id;
}

std::vector<Analysis> InMemoryRecordStore::analyses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.analyses;
}

int64_t InMemoryRecordStore::add_cluster(PersistedCluster cluster) {
    auto exclusive = exclusive_write();
    std::lock_guard<std::mutex> lock(mutex_);
    cluster.id = state_.next_cluster_id++;
    state_.clusters.push_back(std::move(cluster));
    return state_.clusters.back().id;
}

std::vector<PersistedCluster> InMemoryRecordStore::clusters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.clusters;
}

void InMemoryRecordStore::merge_theme_counts(const ThemeCounts& counts, Timestamp now) {
    auto exclusive = exclusive_write();
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, count] : counts) {
        const std::string& name = key.first;
        LanguageLabel language = key.second;
        auto it = std::find_if(state_.themes.begin(), state_.themes.end(),
                               [&](const GlobalTheme& t) {
                                   return t.name == name && t.language == language;
                               });
        if (it != state_.themes.end()) {
            it->frequency += count;
            it->updated_at = now;
        } else {
            GlobalTheme theme;
            theme.id = state_.next_theme_id++;
            theme.name = name;
            theme.language = language;
            theme.frequency = count;
            theme.keywords = {name};
            theme.created_at = now;
            theme.updated_at = now;
            state_.themes.push_back(std::move(theme));
        }
    }
}

std::vector<GlobalTheme> InMemoryRecordStore::top_themes(size_t limit) const {
    std::vector<GlobalTheme> themes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        themes = state_.themes;
    }
    std::stable_sort(themes.begin(), themes.end(),
                     [](const GlobalTheme& a, const GlobalTheme& b) {
                         return a.frequency > b.frequency;
                     });
    if (themes.size() > limit) {
        themes.resize(limit);
    }
    return themes;
}

int64_t InMemoryRecordStore::add_insight(Insight insight) {
    auto exclusive = exclusive_write();
    std::lock_guard<std::mutex> lock(mutex_);
    insight.id = state_.next_insight_id++;
    state_.insights.push_back(std::move(insight));
    return state_.insights.back().id;
}

std::vector<Insight> InMemoryRecordStore::insights() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.insights;
}

std::unique_lock<std::mutex> InMemoryRecordStore::exclusive_write() {
    if (owns_transaction()) {
        return std::unique_lock<std::mutex>();
    }
    return std::unique_lock<std::mutex>(transaction_mutex_);
}

bool InMemoryRecordStore::owns_transaction() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return saved_.has_value() && writer_ == std::this_thread::get_id();
}

// Caller holds mutex_ and owns the transaction
void InMemoryRecordStore::end_transaction() {
    saved_.reset();
    writer_ = std::thread::id();
    transaction_lock_.unlock();
}

void InMemoryRecordStore::begin() {
    if (owns_transaction()) {
        throw PersistenceError("Transaction already in progress");
    }

    std::unique_lock<std::mutex> transaction(transaction_mutex_);
    std::lock_guard<std::mutex> lock(mutex_);
    saved_ = state_;
    writer_ = std::this_thread::get_id();
    transaction_lock_ = std::move(transaction);
}

void InMemoryRecordStore::commit() {
    if (!owns_transaction()) {
        throw PersistenceError("No transaction in progress");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    try {
        persist(state_);
    } catch (const std::exception& e) {
        state_ = std::move(*saved_);
        end_transaction();
        throw PersistenceError(std::string("Commit failed, rolled back: ") + e.what());
    }
    end_transaction();
}

void InMemoryRecordStore::rollback() {
    if (!owns_transaction()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    state_ = std::move(*saved_);
    end_transaction();
}

bool InMemoryRecordStore::in_transaction() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return saved_.has_value();
}

StoreState InMemoryRecordStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void InMemoryRecordStore::persist(const StoreState& /*state*/) {}

// ============================================================================
// JsonFileRecordStore
// ============================================================================

JsonFileRecordStore::JsonFileRecordStore(const std::string& path)
    : InMemoryRecordStore(load(path)), path_(path) {}

StoreState JsonFileRecordStore::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return StoreState{};
    }

    try {
        json j;
        file >> j;
        return StoreState::from_json(j);
    } catch (const json::exception& e) {
        throw PersistenceError("Cannot parse store " + path + ": " + e.what());
    }
}

void JsonFileRecordStore::persist(const StoreState& state) {
    // The committed file is only replaced once the new document is complete
    const std::string temp_path = path_ + ".tmp";
    {
        std::ofstream file(temp_path, std::ios::trunc);
        if (!file.is_open()) {
            throw PersistenceError("Cannot open store for writing: " + temp_path);
        }
        file << state.to_json().dump(2);
        file.close();
        if (file.fail()) {
            std::remove(temp_path.c_str());
            throw PersistenceError("Failed writing store: " + temp_path);
        }
    }

    if (std::rename(temp_path.c_str(), path_.c_str()) != 0) {
        std::remove(temp_path.c_str());
        throw PersistenceError("Cannot replace store " + path_ + ": " + std::strerror(errno));
    }
}

} // namespace tfa
