#pragma once

#include "clustering/embedding_clusterer.hpp"
#include "core/records.hpp"
#include "http/http_client.hpp"
#include "insights/insight_miner.hpp"
#include "language/language_classifier.hpp"
#include "sentiment/sentiment_scorer.hpp"
#include "storage/record_store.hpp"
#include "themes/theme_categorizer.hpp"
#include "themes/theme_extractor.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tfa {

// ============================================================================
// Pipeline Configuration
// ============================================================================

/**
 * @brief Configuration for the analysis pipeline
 */
struct PipelineConfig {
    // Sentiment
    bool remote_sentiment_enabled = true;   ///< Try the hosted models first
    std::string sentiment_api_url = "https://api-inference.huggingface.co/models/";
    std::string sentiment_api_key;          ///< Bearer token (optional)
    std::string french_sentiment_model = "cmarkea/distilcamembert-base-sentiment";
    std::string arabic_sentiment_model = "CAMeL-Lab/bert-base-arabic-camelbert-msa-sentiment";
    std::string darija_sentiment_model = "SI2M-Lab/DarijaBERT";
    int sentiment_timeout_seconds = 10;
    int sentiment_max_chars = 512;
    int sentiment_max_retries = 1;
    double sentiment_confidence_threshold = 0.55;

    // Embeddings
    std::string embedding_provider = "http";  ///< "http" or "hashing"
    std::string embedding_api_url = "https://api-inference.huggingface.co/models/";
    std::string embedding_api_key;
    std::string embedding_model = "sentence-transformers/paraphrase-multilingual-MiniLM-L12-v2";
    int embedding_batch_size = 32;
    int embedding_dimension = 384;          ///< Hashing provider only
    int embedding_timeout_seconds = 30;

    // Clustering
    std::string clustering_method = "kmeans";  ///< "kmeans" or "dbscan"
    int max_clusters = 10;
    std::optional<int> default_n_clusters;  ///< Unset: elbow selection
    int kmeans_seed = 42;
    int kmeans_n_init = 10;
    int elbow_n_init = 5;
    double dbscan_eps = 0.5;
    int dbscan_min_samples = 5;

    // Themes
    int theme_top_n = 5;

    // Processing
    int max_workers = 4;                    ///< Per-item worker threads

    // Output
    std::string store_path = "tfa_store.json";
    std::string model_version = "1.0";
    bool verbose = false;

    /**
     * @brief Load configuration from JSON file
     *
     * @throws ConfigError if the file cannot be opened or parsed
     */
    static PipelineConfig from_json_file(const std::string& path);

    /**
     * @brief Save configuration to JSON file (API keys redacted)
     */
    void to_json_file(const std::string& path) const;

    nlohmann::json to_json(bool redact_keys = true) const;

    /**
     * @brief Load from environment variables
     */
    static PipelineConfig from_environment();

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;

    RemoteSentimentConfig remote_sentiment_config() const;
    HttpEmbeddingConfig http_embedding_config() const;
    ClustererConfig clusterer_config() const;
};

// ============================================================================
// Pipeline Statistics
// ============================================================================

/**
 * @brief Statistics from pipeline execution
 */
struct PipelineStatistics {
    // Batches
    int batches_processed = 0;
    int batches_failed = 0;
    int evaluations_processed = 0;
    int empty_comments = 0;

    // Languages (final label)
    int french = 0;
    int arabic = 0;
    int darija = 0;
    int declared_language_used = 0;

    // Sentiment
    int remote_sentiment = 0;
    int rule_based_sentiment = 0;
    int positive = 0;
    int negative = 0;
    int neutral = 0;

    // Themes
    int vectorizer_themes = 0;
    int frequency_themes = 0;
    int themes_merged = 0;                  ///< Distinct (name, language) pairs merged

    // Clustering
    int embedding_failures = 0;
    int clusters_created = 0;
    int noise_points = 0;

    // Timing
    double total_time_seconds = 0.0;
    double per_item_time_seconds = 0.0;
    double clustering_time_seconds = 0.0;
    double persistence_time_seconds = 0.0;

    /**
     * @brief Print summary to stdout
     */
    void print_summary() const;

    /**
     * @brief Export to JSON
     */
    nlohmann::json to_json() const;
};

// ============================================================================
// Progress Callbacks
// ============================================================================

using ProgressCallback = std::function<void(
    const std::string& stage,
    int current,
    int total,
    const std::string& message
)>;

// ============================================================================
// Composition Root
// ============================================================================

/**
 * @brief Long-lived analysis services shared across batches
 */
struct AnalysisServices {
    std::shared_ptr<HttpClient> http;
    std::shared_ptr<LanguageIdentifier> identifier;
    std::shared_ptr<LanguageClassifier> classifier;
    std::shared_ptr<SentimentScorer> sentiment;
    std::shared_ptr<ThemeExtractor> themes;
    std::shared_ptr<EmbeddingClusterer> clusterer;
    std::shared_ptr<ThemeCategorizer> categorizer;
    std::shared_ptr<InsightMiner> insights;

    /**
     * @brief Build every service from the configuration
     *
     * @param http Transport override (defaults to libcurl)
     * @param embeddings Embedding provider override (defaults per config)
     */
    static AnalysisServices create(const PipelineConfig& config,
                                   std::shared_ptr<HttpClient> http = nullptr,
                                   std::shared_ptr<EmbeddingProvider> embeddings = nullptr);
};

// ============================================================================
// Analysis Pipeline
// ============================================================================

/**
 * @brief Batch analysis of evaluation comments
 *
 * Per comment: language, sentiment and themes (on a worker pool). Per
 * batch: one embedding pass and one clustering. All analyses, clusters and
 * theme counts of a batch are committed together.
 */
class AnalysisPipeline {
public:
    AnalysisPipeline(const PipelineConfig& config, AnalysisServices services,
                     RecordStore& store);

    /**
     * @brief Analyze and persist a batch
     *
     * @throws PersistenceError if the batch cannot be committed
     */
    std::vector<Analysis> process_batch(const std::vector<EvaluationText>& evaluations,
                                        const ClusteringParams& params = {});

    /**
     * @brief Run the insight rules over the store and persist the results
     */
    std::vector<Insight> generate_insights();

    CategoryBreakdown get_categorized_themes(size_t top_n = 50) const;

    void set_progress_callback(ProgressCallback callback);

    PipelineStatistics get_statistics() const { return stats_; }

    void reset_statistics();

    const PipelineConfig& get_config() const { return config_; }

    const AnalysisServices& services() const { return services_; }

private:
    /**
     * @brief Per-item result slot filled by the workers
     */
    struct ItemResult {
        LanguageDetection detection;
        LanguageLabel language = LanguageLabel::FR;
        ScoredSentiment sentiment;
        ThemeExtraction themes;
    };

    PipelineConfig config_;
    AnalysisServices services_;
    RecordStore& store_;
    PipelineStatistics stats_;
    ProgressCallback progress_callback_;

    ItemResult analyze_item(const EvaluationText& evaluation) const;

    std::vector<ItemResult> analyze_items(const std::vector<EvaluationText>& evaluations);

    void report_progress(const std::string& stage, int current, int total,
                         const std::string& message = "");
};

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * @brief Create default pipeline configuration
 */
PipelineConfig create_default_config();

/**
 * @brief Load configuration from file with fallback to environment
 *
 * Tries config_path, then .tfa_config.json in ., .. and ../..
 */
PipelineConfig load_config_with_fallback(const std::string& config_path = "");

} // namespace tfa
