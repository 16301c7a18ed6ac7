#pragma once

#include "clustering/clustering_algorithms.hpp"
#include "clustering/embedding_provider.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tfa {

/**
 * @brief Defaults of the clusterer (from PipelineConfig)
 */
struct ClustererConfig {
    std::string method = "kmeans";          ///< "kmeans" or "dbscan"
    int max_clusters = 10;                  ///< Upper bound of the elbow scan
    std::optional<int> default_n_clusters;  ///< Used when no k is requested
    unsigned seed = 42;
    int n_init = 10;
    int elbow_n_init = 5;
    double dbscan_eps = 0.5;
    int dbscan_min_samples = 5;
    bool verbose = false;
};

/**
 * @brief Per-call overrides
 */
struct ClusteringParams {
    std::optional<std::string> method;
    std::optional<int> n_clusters;
    std::optional<double> eps;
    std::optional<int> min_samples;
};

/**
 * @brief Labels of one batch plus fit information
 *
 * info is empty when fitting failed and degraded labels were produced.
 */
struct ClusterAssignment {
    std::vector<int> labels;                ///< Cluster index or kNoise
    nlohmann::json info = nlohmann::json::object();
};

/**
 * @brief Embeddings and labels of a clustered batch
 */
struct ClusteringOutcome {
    std::vector<EmbeddingVector> embeddings;
    ClusterAssignment assignment;
};

/**
 * @brief Summary of one non-noise cluster
 */
struct ClusterSummary {
    int cluster_number = 0;
    size_t size = 0;
    std::vector<std::string> representative_themes;  ///< Top 5 by frequency
    double avg_sentiment = 0.0;
    EmbeddingVector centroid;                         ///< Mean raw embedding
};

/**
 * @brief Embeds a batch once and partitions it with K-Means or DBSCAN
 */
class EmbeddingClusterer {
public:
    EmbeddingClusterer(std::shared_ptr<EmbeddingProvider> provider, ClustererConfig config);

    std::vector<EmbeddingVector> embed(const std::vector<std::string>& texts) const;

    ClusteringOutcome cluster(const std::vector<std::string>& texts,
                              const ClusteringParams& params = {}) const;

    /**
     * @brief Partition precomputed embeddings; never throws on fit failure
     */
    ClusterAssignment cluster_embeddings(const std::vector<EmbeddingVector>& embeddings,
                                         const ClusteringParams& params = {}) const;

    /**
     * @brief Cluster summaries in increasing cluster number, noise excluded
     */
    static std::vector<ClusterSummary> summarize(
        const std::vector<int>& labels,
        const std::vector<EmbeddingVector>& embeddings,
        const std::vector<std::vector<std::string>>& themes,
        const std::vector<double>& sentiment_scores
    );

    const ClustererConfig& config() const { return config_; }

private:
    std::shared_ptr<EmbeddingProvider> provider_;
    ClustererConfig config_;

    ClusterAssignment cluster_kmeans(const Matrix& data, std::optional<int> n_clusters) const;
    ClusterAssignment cluster_dbscan(const Matrix& data, double eps, int min_samples) const;
};

} // namespace tfa
