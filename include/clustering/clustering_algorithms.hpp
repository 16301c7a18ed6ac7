#pragma once

#include <cstddef>
#include <vector>

namespace tfa {

/**
 * @brief Row-major point set, one row per sample
 */
using Matrix = std::vector<std::vector<double>>;

/// Label of points DBSCAN leaves unassigned
constexpr int kNoise = -1;

/**
 * @brief Copy float embeddings into a double matrix
 *
 * @throws ClusteringError if rows differ in dimension
 */
Matrix to_matrix(const std::vector<std::vector<float>>& embeddings);

/**
 * @brief Zero mean and unit variance per column
 *
 * Zero-variance columns are only centered.
 */
Matrix standardize(const Matrix& data);

double squared_distance(const std::vector<double>& a, const std::vector<double>& b);

// ============================================================================
// K-Means
// ============================================================================

struct KMeansConfig {
    int n_init = 10;                        ///< Restarts, lowest inertia kept
    int max_iter = 300;
    double tol = 1e-4;                      ///< Stop when centroids move less than this
    unsigned seed = 42;
};

struct KMeansResult {
    std::vector<int> labels;
    Matrix centroids;
    double inertia = 0.0;                   ///< Sum of squared distances to centroids
    int iterations = 0;
};

/**
 * @brief Lloyd's algorithm with k-means++ seeding
 *
 * @throws ClusteringError if data is empty or k is outside [1, n]
 */
KMeansResult kmeans_fit(const Matrix& data, int k, const KMeansConfig& config = {});

/**
 * @brief k = argmax |inertia[i+1] - inertia[i]| + 2 for a scan starting at k=2
 *
 * Returns 0 when fewer than two inertias are given.
 */
int select_elbow_k(const std::vector<double>& inertias);

/**
 * @brief Cluster count chosen by the elbow heuristic on already standardized data
 *
 * Fewer than 10 points (or a scan with fewer than two fits) gives min(3, n).
 */
int elbow_cluster_count(const Matrix& standardized, int max_clusters,
                        int n_init, unsigned seed);

// ============================================================================
// DBSCAN
// ============================================================================

struct DbscanResult {
    std::vector<int> labels;                ///< Cluster index or kNoise
    int n_clusters = 0;
    size_t n_noise = 0;
};

/**
 * @brief Density clustering with Euclidean distance
 *
 * min_samples counts the point itself.
 *
 * @throws ClusteringError if eps <= 0 or min_samples < 1
 */
DbscanResult dbscan_fit(const Matrix& data, double eps, int min_samples);

} // namespace tfa
