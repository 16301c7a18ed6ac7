#include "pipeline/analysis_pipeline.hpp"
#include "core/errors.hpp"
#include "core/text_utils.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <stdexcept>
#include <sys/stat.h>
#include <thread>

using json = nlohmann::json;

namespace tfa {

namespace {

template<typename T>
void read_if_present(const json& j, const char* key, T& target) {
    if (j.contains(key) && !j[key].is_null()) {
        target = j[key].get<T>();
    }
}

bool env_flag(const char* value) {
    std::string v = to_lower_utf8(value);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

double seconds_since(std::chrono::high_resolution_clock::time_point start) {
    return std::chrono::duration<double>(
        std::chrono::high_resolution_clock::now() - start
    ).count();
}

} // anonymous namespace

// ============================================================================
// PipelineConfig
// ============================================================================

PipelineConfig PipelineConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Failed to open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        throw ConfigError("Failed to parse config file " + path + ": " + e.what());
    }

    PipelineConfig config;
    try {
        // Sentiment config; "api_key" is accepted as a short form
        read_if_present(j, "remote_sentiment_enabled", config.remote_sentiment_enabled);
        read_if_present(j, "sentiment_api_url", config.sentiment_api_url);
        if (j.contains("sentiment_api_key")) {
            config.sentiment_api_key = j["sentiment_api_key"].get<std::string>();
        } else if (j.contains("api_key")) {
            config.sentiment_api_key = j["api_key"].get<std::string>();
        }
        read_if_present(j, "french_sentiment_model", config.french_sentiment_model);
        read_if_present(j, "arabic_sentiment_model", config.arabic_sentiment_model);
        read_if_present(j, "darija_sentiment_model", config.darija_sentiment_model);
        read_if_present(j, "sentiment_timeout_seconds", config.sentiment_timeout_seconds);
        read_if_present(j, "sentiment_max_chars", config.sentiment_max_chars);
        read_if_present(j, "sentiment_max_retries", config.sentiment_max_retries);
        read_if_present(j, "sentiment_confidence_threshold",
                        config.sentiment_confidence_threshold);

        // Embedding config; the sentiment key is reused when none is given
        read_if_present(j, "embedding_provider", config.embedding_provider);
        read_if_present(j, "embedding_api_url", config.embedding_api_url);
        if (j.contains("embedding_api_key")) {
            config.embedding_api_key = j["embedding_api_key"].get<std::string>();
        } else {
            config.embedding_api_key = config.sentiment_api_key;
        }
        read_if_present(j, "embedding_model", config.embedding_model);
        read_if_present(j, "embedding_batch_size", config.embedding_batch_size);
        read_if_present(j, "embedding_dimension", config.embedding_dimension);
        read_if_present(j, "embedding_timeout_seconds", config.embedding_timeout_seconds);

        // Clustering config
        read_if_present(j, "clustering_method", config.clustering_method);
        read_if_present(j, "max_clusters", config.max_clusters);
        if (j.contains("default_n_clusters") && !j["default_n_clusters"].is_null()) {
            config.default_n_clusters = j["default_n_clusters"].get<int>();
        }
        read_if_present(j, "kmeans_seed", config.kmeans_seed);
        read_if_present(j, "kmeans_n_init", config.kmeans_n_init);
        read_if_present(j, "elbow_n_init", config.elbow_n_init);
        read_if_present(j, "dbscan_eps", config.dbscan_eps);
        read_if_present(j, "dbscan_min_samples", config.dbscan_min_samples);

        read_if_present(j, "theme_top_n", config.theme_top_n);
        read_if_present(j, "max_workers", config.max_workers);

        read_if_present(j, "store_path", config.store_path);
        read_if_present(j, "model_version", config.model_version);
        read_if_present(j, "verbose", config.verbose);
    } catch (const json::exception& e) {
        throw ConfigError("Invalid value in config file " + path + ": " + e.what());
    }

    return config;
}

json PipelineConfig::to_json(bool redact_keys) const {
    auto key_value = [redact_keys](const std::string& key) -> json {
        if (key.empty()) return "";
        return redact_keys ? json("***REDACTED***") : json(key);
    };

    json j;

    // Sentiment config
    j["remote_sentiment_enabled"] = remote_sentiment_enabled;
    j["sentiment_api_url"] = sentiment_api_url;
    j["sentiment_api_key"] = key_value(sentiment_api_key);
    j["french_sentiment_model"] = french_sentiment_model;
    j["arabic_sentiment_model"] = arabic_sentiment_model;
    j["darija_sentiment_model"] = darija_sentiment_model;
    j["sentiment_timeout_seconds"] = sentiment_timeout_seconds;
    j["sentiment_max_chars"] = sentiment_max_chars;
    j["sentiment_max_retries"] = sentiment_max_retries;
    j["sentiment_confidence_threshold"] = sentiment_confidence_threshold;

    // Embedding config
    j["embedding_provider"] = embedding_provider;
    j["embedding_api_url"] = embedding_api_url;
    j["embedding_api_key"] = key_value(embedding_api_key);
    j["embedding_model"] = embedding_model;
    j["embedding_batch_size"] = embedding_batch_size;
    j["embedding_dimension"] = embedding_dimension;
    j["embedding_timeout_seconds"] = embedding_timeout_seconds;

    // Clustering config
    j["clustering_method"] = clustering_method;
    j["max_clusters"] = max_clusters;
    j["default_n_clusters"] = default_n_clusters ? json(*default_n_clusters) : json(nullptr);
    j["kmeans_seed"] = kmeans_seed;
    j["kmeans_n_init"] = kmeans_n_init;
    j["elbow_n_init"] = elbow_n_init;
    j["dbscan_eps"] = dbscan_eps;
    j["dbscan_min_samples"] = dbscan_min_samples;

    j["theme_top_n"] = theme_top_n;
    j["max_workers"] = max_workers;

    // Output config
    j["store_path"] = store_path;
    j["model_version"] = model_version;
    j["verbose"] = verbose;

    return j;
}

void PipelineConfig::to_json_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Failed to write config file: " + path);
    }
    file << to_json(true).dump(2);
}

PipelineConfig PipelineConfig::from_environment() {
    PipelineConfig config;

    const char* api_key = std::getenv("TFA_SENTIMENT_API_KEY");
    if (!api_key) api_key = std::getenv("HUGGINGFACE_API_KEY");
    if (api_key) {
        config.sentiment_api_key = api_key;
        config.embedding_api_key = api_key;
    }

    const char* api_url = std::getenv("TFA_SENTIMENT_API_URL");
    if (api_url) config.sentiment_api_url = api_url;

    const char* provider = std::getenv("TFA_EMBEDDING_PROVIDER");
    if (provider) config.embedding_provider = provider;

    const char* embedding_url = std::getenv("TFA_EMBEDDING_API_URL");
    if (embedding_url) config.embedding_api_url = embedding_url;

    const char* method = std::getenv("TFA_CLUSTERING_METHOD");
    if (method) config.clustering_method = method;

    const char* n_clusters = std::getenv("TFA_N_CLUSTERS");
    if (n_clusters) {
        try {
            config.default_n_clusters = std::stoi(n_clusters);
        } catch (const std::exception&) {
            throw ConfigError(std::string("TFA_N_CLUSTERS is not an integer: ") + n_clusters);
        }
    }

    const char* store_path = std::getenv("TFA_STORE_PATH");
    if (store_path) config.store_path = store_path;

    const char* verbose = std::getenv("TFA_VERBOSE");
    if (verbose) config.verbose = env_flag(verbose);

    return config;
}

bool PipelineConfig::validate(std::string& error_message) const {
    if (embedding_provider != "http" && embedding_provider != "hashing") {
        error_message = "Embedding provider must be 'http' or 'hashing'";
        return false;
    }

    if (clustering_method != "kmeans" && clustering_method != "dbscan") {
        error_message = "Invalid clustering method: " + clustering_method;
        return false;
    }

    if (max_clusters < 2) {
        error_message = "max_clusters must be at least 2";
        return false;
    }

    if (default_n_clusters && *default_n_clusters < 1) {
        error_message = "default_n_clusters must be positive";
        return false;
    }

    if (dbscan_eps <= 0.0 || dbscan_min_samples < 1) {
        error_message = "DBSCAN needs eps > 0 and min_samples >= 1";
        return false;
    }

    if (sentiment_confidence_threshold < 0.0 || sentiment_confidence_threshold > 1.0) {
        error_message = "Sentiment confidence threshold must be between 0.0 and 1.0";
        return false;
    }

    if (sentiment_timeout_seconds <= 0 || embedding_timeout_seconds <= 0) {
        error_message = "Timeouts must be positive";
        return false;
    }

    if (sentiment_max_chars <= 0 || embedding_batch_size <= 0 || embedding_dimension <= 0) {
        error_message = "Sizes must be positive";
        return false;
    }

    if (theme_top_n <= 0 || max_workers <= 0) {
        error_message = "theme_top_n and max_workers must be positive";
        return false;
    }

    return true;
}

RemoteSentimentConfig PipelineConfig::remote_sentiment_config() const {
    RemoteSentimentConfig remote;
    remote.api_url = sentiment_api_url;
    remote.api_key = sentiment_api_key;
    remote.french_model = french_sentiment_model;
    remote.arabic_model = arabic_sentiment_model;
    remote.darija_model = darija_sentiment_model;
    remote.timeout_seconds = sentiment_timeout_seconds;
    remote.max_chars = static_cast<size_t>(sentiment_max_chars);
    remote.max_retries = sentiment_max_retries;
    remote.confidence_threshold = sentiment_confidence_threshold;
    remote.verbose = verbose;
    return remote;
}

HttpEmbeddingConfig PipelineConfig::http_embedding_config() const {
    HttpEmbeddingConfig embedding;
    embedding.api_url = embedding_api_url;
    embedding.api_key = embedding_api_key;
    embedding.model = embedding_model;
    embedding.batch_size = static_cast<size_t>(embedding_batch_size);
    embedding.timeout_seconds = embedding_timeout_seconds;
    embedding.verbose = verbose;
    return embedding;
}

ClustererConfig PipelineConfig::clusterer_config() const {
    ClustererConfig clusterer;
    clusterer.method = clustering_method;
    clusterer.max_clusters = max_clusters;
    clusterer.default_n_clusters = default_n_clusters;
    clusterer.seed = static_cast<unsigned>(kmeans_seed);
    clusterer.n_init = kmeans_n_init;
    clusterer.elbow_n_init = elbow_n_init;
    clusterer.dbscan_eps = dbscan_eps;
    clusterer.dbscan_min_samples = dbscan_min_samples;
    clusterer.verbose = verbose;
    return clusterer;
}

// ============================================================================
// PipelineStatistics
// ============================================================================

void PipelineStatistics::print_summary() const {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << "Analysis Summary\n";
    std::cout << std::string(70, '=') << "\n\n";

    std::cout << "Batches:\n";
    std::cout << "  Processed: " << batches_processed << "\n";
    std::cout << "  Failed: " << batches_failed << "\n";
    std::cout << "  Evaluations: " << evaluations_processed << "\n";
    std::cout << "  Empty comments: " << empty_comments << "\n\n";

    std::cout << "Languages:\n";
    std::cout << "  FR: " << french << "\n";
    std::cout << "  AR: " << arabic << "\n";
    std::cout << "  DARIJA: " << darija << "\n";
    std::cout << "  Declared language used: " << declared_language_used << "\n\n";

    std::cout << "Sentiment:\n";
    std::cout << "  Remote model: " << remote_sentiment << "\n";
    std::cout << "  Rule-based: " << rule_based_sentiment << "\n";
    std::cout << "  Positive / negative / neutral: " << positive << " / "
              << negative << " / " << neutral << "\n\n";

    std::cout << "Themes:\n";
    std::cout << "  Vectorizer: " << vectorizer_themes << "\n";
    std::cout << "  Word frequency: " << frequency_themes << "\n";
    std::cout << "  Global themes updated: " << themes_merged << "\n\n";

    std::cout << "Clustering:\n";
    std::cout << "  Clusters created: " << clusters_created << "\n";
    std::cout << "  Noise points: " << noise_points << "\n";
    std::cout << "  Embedding failures: " << embedding_failures << "\n\n";

    std::cout << "Timing:\n";
    std::cout << "  Total time: " << total_time_seconds << " seconds\n";
    std::cout << "  Per-item analysis: " << per_item_time_seconds << " seconds\n";
    std::cout << "  Embedding + clustering: " << clustering_time_seconds << " seconds\n";
    std::cout << "  Persistence: " << persistence_time_seconds << " seconds\n";

    std::cout << "\n" << std::string(70, '=') << "\n\n";
}

json PipelineStatistics::to_json() const {
    json j;

    j["batches"] = {
        {"processed", batches_processed},
        {"failed", batches_failed},
        {"evaluations", evaluations_processed},
        {"empty_comments", empty_comments}
    };

    j["languages"] = {
        {"FR", french},
        {"AR", arabic},
        {"DARIJA", darija},
        {"declared_used", declared_language_used}
    };

    j["sentiment"] = {
        {"remote", remote_sentiment},
        {"rule_based", rule_based_sentiment},
        {"positive", positive},
        {"negative", negative},
        {"neutral", neutral}
    };

    j["themes"] = {
        {"vectorizer", vectorizer_themes},
        {"frequency", frequency_themes},
        {"merged", themes_merged}
    };

    j["clustering"] = {
        {"clusters_created", clusters_created},
        {"noise_points", noise_points},
        {"embedding_failures", embedding_failures}
    };

    j["timing"] = {
        {"total_seconds", total_time_seconds},
        {"per_item_seconds", per_item_time_seconds},
        {"clustering_seconds", clustering_time_seconds},
        {"persistence_seconds", persistence_time_seconds}
    };

    return j;
}

// ============================================================================
// AnalysisServices
// ============================================================================

AnalysisServices AnalysisServices::create(const PipelineConfig& config,
                                          std::shared_ptr<HttpClient> http,
                                          std::shared_ptr<EmbeddingProvider> embeddings) {
    AnalysisServices services;
    services.http = http ? std::move(http) : make_default_http_client();

    services.identifier = make_default_language_identifier();
    services.classifier = std::make_shared<LanguageClassifier>(services.identifier,
                                                               config.verbose);
    services.sentiment = make_sentiment_scorer(services.http,
                                               config.remote_sentiment_config(),
                                               config.remote_sentiment_enabled);
    services.themes = std::make_shared<ThemeExtractor>(config.verbose);

    if (!embeddings) {
        if (config.embedding_provider == "hashing") {
            embeddings = std::make_shared<HashingEmbeddingProvider>(
                static_cast<size_t>(config.embedding_dimension));
        } else {
            embeddings = std::make_shared<HttpEmbeddingProvider>(
                services.http, config.http_embedding_config());
        }
    }
    services.clusterer = std::make_shared<EmbeddingClusterer>(std::move(embeddings),
                                                              config.clusterer_config());
    services.categorizer = std::make_shared<ThemeCategorizer>();

    InsightMinerConfig miner_config;
    miner_config.verbose = config.verbose;
    services.insights = std::make_shared<InsightMiner>(miner_config);

    return services;
}

// ============================================================================
// AnalysisPipeline
// ============================================================================

AnalysisPipeline::AnalysisPipeline(const PipelineConfig& config, AnalysisServices services,
                                   RecordStore& store)
    : config_(config), services_(std::move(services)), store_(store) {
    std::string error;
    if (!config_.validate(error)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }
    if (!services_.classifier || !services_.sentiment || !services_.themes ||
        !services_.clusterer || !services_.categorizer || !services_.insights) {
        throw std::invalid_argument("Analysis services are incomplete");
    }
}

void AnalysisPipeline::set_progress_callback(ProgressCallback callback) {
    progress_callback_ = std::move(callback);
}

void AnalysisPipeline::reset_statistics() {
    stats_ = PipelineStatistics();
}

void AnalysisPipeline::report_progress(const std::string& stage, int current, int total,
                                       const std::string& message) {
    if (progress_callback_) {
        progress_callback_(stage, current, total, message);
    } else if (config_.verbose && total > 0) {
        std::cout << "[" << stage << "] " << current << "/" << total;
        if (!message.empty()) {
            std::cout << " - " << message;
        }
        std::cout << "\n";
    }
}

AnalysisPipeline::ItemResult AnalysisPipeline::analyze_item(
    const EvaluationText& evaluation
) const {
    ItemResult item;
    item.detection = services_.classifier->detect_with_confidence(evaluation.comment);
    item.language = evaluation.declared_language.value_or(item.detection.language);
    item.sentiment = services_.sentiment->analyze(evaluation.comment, item.language);
    item.themes = services_.themes->extract_one(evaluation.comment, item.language,
                                                static_cast<size_t>(config_.theme_top_n));
    return item;
}

std::vector<AnalysisPipeline::ItemResult> AnalysisPipeline::analyze_items(
    const std::vector<EvaluationText>& evaluations
) {
    std::vector<ItemResult> results(evaluations.size());
    const size_t n_workers = std::min<size_t>(
        static_cast<size_t>(std::max(1, config_.max_workers)), evaluations.size());

    std::atomic<size_t> next{0};
    std::atomic<int> completed{0};
    std::exception_ptr failure;
    std::mutex failure_mutex;

    auto worker = [&]() {
        for (size_t i = next++; i < evaluations.size(); i = next++) {
            try {
                results[i] = analyze_item(evaluations[i]);
            } catch (...) {
                std::lock_guard<std::mutex> lock(failure_mutex);
                if (!failure) {
                    failure = std::current_exception();
                }
            }
            completed++;
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(n_workers);
    for (size_t t = 0; t < n_workers; ++t) {
        threads.emplace_back(worker);
    }
    for (auto& thread : threads) {
        thread.join();
    }

    if (failure) {
        std::rethrow_exception(failure);
    }

    report_progress("Analyzing", completed.load(), static_cast<int>(evaluations.size()));
    return results;
}

std::vector<Analysis> AnalysisPipeline::process_batch(
    const std::vector<EvaluationText>& evaluations,
    const ClusteringParams& params
) {
    if (evaluations.empty()) {
        return {};
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    if (config_.verbose) {
        std::cout << "Processing batch of " << evaluations.size() << " evaluations\n";
    }

    // 1. Language, sentiment and themes per item
    auto item_start = std::chrono::high_resolution_clock::now();
    std::vector<ItemResult> items = analyze_items(evaluations);
    stats_.per_item_time_seconds += seconds_since(item_start);

    // 2. Embed the non-empty comments once and cluster them
    auto cluster_start = std::chrono::high_resolution_clock::now();
    std::vector<size_t> positions;
    std::vector<std::string> texts;
    for (size_t i = 0; i < evaluations.size(); ++i) {
        if (!is_blank(evaluations[i].comment)) {
            positions.push_back(i);
            texts.push_back(evaluations[i].comment);
        }
    }

    report_progress("Clustering", 0, 1, std::to_string(texts.size()) + " comments");
    ClusteringOutcome outcome = services_.clusterer->cluster(texts, params);
    if (!texts.empty() && outcome.embeddings.empty()) {
        stats_.embedding_failures++;
        if (config_.verbose) {
            std::cerr << "[AnalysisPipeline] No embeddings, batch left unclustered\n";
        }
    }

    std::vector<ClusterSummary> summaries;
    if (!outcome.embeddings.empty()) {
        std::vector<std::vector<std::string>> member_themes;
        std::vector<double> member_scores;
        for (size_t p : positions) {
            member_themes.push_back(items[p].themes.themes);
            member_scores.push_back(items[p].sentiment.result.score);
        }
        summaries = EmbeddingClusterer::summarize(outcome.assignment.labels,
                                                  outcome.embeddings,
                                                  member_themes, member_scores);
    }
    stats_.clustering_time_seconds += seconds_since(cluster_start);
    report_progress("Clustering", 1, 1, std::to_string(summaries.size()) + " clusters");

    // 3. Coalesce theme counts per (name, language)
    ThemeCounts theme_counts;
    for (const auto& item : items) {
        for (const auto& theme : item.themes.themes) {
            if (!theme.empty()) {
                theme_counts[{theme, item.language}]++;
            }
        }
    }

    // 4. Persist everything in one transaction
    auto persist_start = std::chrono::high_resolution_clock::now();
    Timestamp now = std::chrono::system_clock::now();
    std::vector<Analysis> analyses;

    try {
        StoreTransaction transaction(store_);

        std::map<int, int64_t> cluster_ids;
        for (const auto& summary : summaries) {
            PersistedCluster cluster;
            cluster.label = "Cluster " + std::to_string(summary.cluster_number);
            cluster.cluster_number = summary.cluster_number;
            cluster.size = summary.size;
            cluster.representative_themes = summary.representative_themes;
            cluster.avg_sentiment = summary.avg_sentiment;
            cluster.centroid = summary.centroid;
            cluster.created_at = now;
            cluster_ids[summary.cluster_number] = store_.add_cluster(std::move(cluster));
        }

        std::vector<int> labels(evaluations.size(), kNoise);
        std::vector<const EmbeddingVector*> vectors(evaluations.size(), nullptr);
        for (size_t k = 0; k < positions.size(); ++k) {
            if (k < outcome.assignment.labels.size()) {
                labels[positions[k]] = outcome.assignment.labels[k];
            }
            if (k < outcome.embeddings.size()) {
                vectors[positions[k]] = &outcome.embeddings[k];
            }
        }

        for (size_t i = 0; i < evaluations.size(); ++i) {
            const ItemResult& item = items[i];

            Analysis analysis;
            analysis.evaluation_id = evaluations[i].id;
            analysis.language = item.language;
            analysis.detected_language = item.detection.language;
            analysis.language_confidence = item.detection.confidence;
            analysis.sentiment = item.sentiment.result;
            analysis.sentiment_strategy = item.sentiment.strategy;
            analysis.themes = item.themes.themes;
            analysis.theme_strategy = item.themes.strategy;
            auto cluster = cluster_ids.find(labels[i]);
            if (cluster != cluster_ids.end()) {
                analysis.cluster_id = cluster->second;
            }
            if (vectors[i]) {
                analysis.embedding = *vectors[i];
            }
            analysis.model_version = config_.model_version;
            analysis.processed_at = now;

            analysis.id = store_.add_analysis(analysis);
            analyses.push_back(std::move(analysis));
        }

        store_.merge_theme_counts(theme_counts, now);
        transaction.commit();
    } catch (const PersistenceError& e) {
        stats_.batches_failed++;
        std::cerr << "[AnalysisPipeline] Error committing analyses: " << e.what() << "\n";
        throw;
    } catch (const std::exception& e) {
        stats_.batches_failed++;
        std::cerr << "[AnalysisPipeline] Error committing analyses: " << e.what() << "\n";
        throw PersistenceError(std::string("Batch rolled back: ") + e.what());
    }
    stats_.persistence_time_seconds += seconds_since(persist_start);

    // 5. Statistics
    stats_.batches_processed++;
    stats_.evaluations_processed += static_cast<int>(evaluations.size());
    stats_.themes_merged += static_cast<int>(theme_counts.size());
    stats_.clusters_created += static_cast<int>(summaries.size());
    stats_.noise_points += static_cast<int>(std::count(
        outcome.assignment.labels.begin(), outcome.assignment.labels.end(), kNoise));

    for (size_t i = 0; i < items.size(); ++i) {
        const ItemResult& item = items[i];
        if (is_blank(evaluations[i].comment)) stats_.empty_comments++;
        if (evaluations[i].declared_language) stats_.declared_language_used++;

        switch (item.language) {
            case LanguageLabel::FR: stats_.french++; break;
            case LanguageLabel::AR: stats_.arabic++; break;
            case LanguageLabel::DARIJA: stats_.darija++; break;
        }
        switch (item.sentiment.result.polarity) {
            case Polarity::Positive: stats_.positive++; break;
            case Polarity::Negative: stats_.negative++; break;
            case Polarity::Neutral: stats_.neutral++; break;
        }
        if (item.sentiment.strategy == "remote") stats_.remote_sentiment++;
        if (item.sentiment.strategy == "rule-based") stats_.rule_based_sentiment++;
        if (item.themes.strategy == "vectorizer") stats_.vectorizer_themes++;
        if (item.themes.strategy == "frequency") stats_.frequency_themes++;
    }

    stats_.total_time_seconds += seconds_since(start_time);

    if (config_.verbose) {
        std::cout << "Successfully processed " << analyses.size() << " evaluations\n";
    }

    return analyses;
}

std::vector<Insight> AnalysisPipeline::generate_insights() {
    return services_.insights->generate(store_);
}

CategoryBreakdown AnalysisPipeline::get_categorized_themes(size_t top_n) const {
    return services_.categorizer->get_categorized_themes(store_, top_n);
}

// ============================================================================
// Utility Functions
// ============================================================================

PipelineConfig create_default_config() {
    return PipelineConfig();
}

PipelineConfig load_config_with_fallback(const std::string& config_path) {
    std::vector<std::string> paths_to_try;

    // If specific path provided, try it first
    if (!config_path.empty()) {
        paths_to_try.push_back(config_path);
    }

    paths_to_try.push_back(".tfa_config.json");
    paths_to_try.push_back("../.tfa_config.json");
    paths_to_try.push_back("../../.tfa_config.json");

    for (const auto& path : paths_to_try) {
        struct stat st;
        if (stat(path.c_str(), &st) == 0) {
            try {
                return PipelineConfig::from_json_file(path);
            } catch (const ConfigError& e) {
                std::cerr << "Warning: " << e.what() << ", trying next location\n";
            }
        }
    }

    // Fallback to environment
    return PipelineConfig::from_environment();
}

} // namespace tfa
