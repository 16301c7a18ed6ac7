#include "clustering/embedding_clusterer.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <iostream>
#include <map>
#include <unordered_map>

using json = nlohmann::json;

namespace tfa {

EmbeddingClusterer::EmbeddingClusterer(std::shared_ptr<EmbeddingProvider> provider,
                                       ClustererConfig config)
    : provider_(std::move(provider)), config_(std::move(config)) {}

std::vector<EmbeddingVector> EmbeddingClusterer::embed(
    const std::vector<std::string>& texts
) const {
    if (texts.empty() || !provider_) {
        return {};
    }
    return provider_->embed(texts);
}

ClusteringOutcome EmbeddingClusterer::cluster(const std::vector<std::string>& texts,
                                              const ClusteringParams& params) const {
    ClusteringOutcome outcome;
    outcome.embeddings = embed(texts);
    if (outcome.embeddings.empty()) {
        return outcome;
    }
    outcome.assignment = cluster_embeddings(outcome.embeddings, params);
    return outcome;
}

ClusterAssignment EmbeddingClusterer::cluster_embeddings(
    const std::vector<EmbeddingVector>& embeddings,
    const ClusteringParams& params
) const {
    if (embeddings.empty()) {
        return {};
    }

    std::string method = params.method.value_or(config_.method);
    bool dbscan = (method == "dbscan");
    if (!dbscan && method != "kmeans" && config_.verbose) {
        std::cerr << "[EmbeddingClusterer] Unknown clustering method: " << method
                  << ", using K-Means" << std::endl;
    }

    try {
        Matrix data = to_matrix(embeddings);
        if (dbscan) {
            return cluster_dbscan(data,
                                  params.eps.value_or(config_.dbscan_eps),
                                  params.min_samples.value_or(config_.dbscan_min_samples));
        }
        return cluster_kmeans(data, params.n_clusters);
    } catch (const std::exception& e) {
        if (config_.verbose) {
            std::cerr << "[EmbeddingClusterer] Error in "
                      << (dbscan ? "DBSCAN" : "K-Means") << " clustering: "
                      << e.what() << std::endl;
        }
        ClusterAssignment degraded;
        degraded.labels.assign(embeddings.size(), dbscan ? kNoise : 0);
        return degraded;
    }
}

ClusterAssignment EmbeddingClusterer::cluster_kmeans(const Matrix& data,
                                                     std::optional<int> n_clusters) const {
    Matrix scaled = standardize(data);

    std::string k_source;
    int k = 0;
    if (n_clusters) {
        k = *n_clusters;
        k_source = "explicit";
    } else if (config_.default_n_clusters) {
        k = *config_.default_n_clusters;
        k_source = "configured";
    } else {
        k = elbow_cluster_count(scaled, config_.max_clusters, config_.elbow_n_init,
                                config_.seed);
        k_source = "elbow";
    }

    if (config_.verbose) {
        std::cout << "[EmbeddingClusterer] K-Means with k=" << k
                  << " (" << k_source << ")" << std::endl;
    }

    KMeansConfig kmeans_config;
    kmeans_config.n_init = config_.n_init;
    kmeans_config.seed = config_.seed;
    KMeansResult fit = kmeans_fit(scaled, k, kmeans_config);

    ClusterAssignment assignment;
    assignment.labels = fit.labels;

    json sizes = json::object();
    for (int c = 0; c < k; ++c) {
        sizes[std::to_string(c)] = std::count(fit.labels.begin(), fit.labels.end(), c);
    }

    assignment.info["method"] = "kmeans";
    assignment.info["n_clusters"] = k;
    assignment.info["inertia"] = fit.inertia;
    assignment.info["cluster_sizes"] = sizes;
    assignment.info["n_noise"] = 0;
    assignment.info["k_source"] = k_source;
    assignment.info["iterations"] = fit.iterations;
    return assignment;
}

ClusterAssignment EmbeddingClusterer::cluster_dbscan(const Matrix& data, double eps,
                                                     int min_samples) const {
    DbscanResult fit = dbscan_fit(data, eps, min_samples);

    ClusterAssignment assignment;
    assignment.labels = fit.labels;

    json sizes = json::object();
    for (int c = 0; c < fit.n_clusters; ++c) {
        sizes[std::to_string(c)] = std::count(fit.labels.begin(), fit.labels.end(), c);
    }

    assignment.info["method"] = "dbscan";
    assignment.info["n_clusters"] = fit.n_clusters;
    assignment.info["n_noise"] = fit.n_noise;
    assignment.info["cluster_sizes"] = sizes;
    assignment.info["eps"] = eps;
    assignment.info["min_samples"] = min_samples;
    return assignment;
}

std::vector<ClusterSummary> EmbeddingClusterer::summarize(
    const std::vector<int>& labels,
    const std::vector<EmbeddingVector>& embeddings,
    const std::vector<std::vector<std::string>>& themes,
    const std::vector<double>& sentiment_scores
) {
    std::map<int, std::vector<size_t>> members;
    for (size_t i = 0; i < labels.size(); ++i) {
        if (labels[i] != kNoise) {
            members[labels[i]].push_back(i);
        }
    }

    std::vector<ClusterSummary> summaries;
    for (const auto& [cluster, indices] : members) {
        ClusterSummary summary;
        summary.cluster_number = cluster;
        summary.size = indices.size();

        // Theme frequency in first-appearance order
        std::vector<std::pair<std::string, size_t>> theme_counts;
        std::unordered_map<std::string, size_t> position;
        double score_sum = 0.0;
        size_t scored = 0;

        for (size_t i : indices) {
            if (i < themes.size()) {
                for (const auto& theme : themes[i]) {
                    auto it = position.find(theme);
                    if (it == position.end()) {
                        position[theme] = theme_counts.size();
                        theme_counts.emplace_back(theme, 1);
                    } else {
                        theme_counts[it->second].second++;
                    }
                }
            }
            if (i < sentiment_scores.size()) {
                score_sum += sentiment_scores[i];
                scored++;
            }
            if (i < embeddings.size()) {
                const auto& e = embeddings[i];
                if (summary.centroid.empty()) {
                    summary.centroid.assign(e.size(), 0.0f);
                }
                for (size_t d = 0; d < e.size() && d < summary.centroid.size(); ++d) {
                    summary.centroid[d] += e[d];
                }
            }
        }

        std::stable_sort(theme_counts.begin(), theme_counts.end(),
                         [](const auto& a, const auto& b) { return a.second > b.second; });
        for (size_t t = 0; t < theme_counts.size() && t < 5; ++t) {
            summary.representative_themes.push_back(theme_counts[t].first);
        }

        summary.avg_sentiment = scored > 0 ? score_sum / static_cast<double>(scored) : 0.0;
        for (auto& x : summary.centroid) {
            x /= static_cast<float>(indices.size());
        }

        summaries.push_back(std::move(summary));
    }
    return summaries;
}

} // namespace tfa
