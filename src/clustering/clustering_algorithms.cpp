#include "clustering/clustering_algorithms.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <string>

namespace tfa {

namespace {

Matrix kmeans_plus_plus(const Matrix& data, int k, std::mt19937& rng) {
    const size_t n = data.size();
    Matrix centroids;
    centroids.reserve(k);

    std::uniform_int_distribution<size_t> pick(0, n - 1);
    centroids.push_back(data[pick(rng)]);

    std::vector<double> min_dist(n, std::numeric_limits<double>::max());
    while (static_cast<int>(centroids.size()) < k) {
        double total = 0.0;
        for (size_t i = 0; i < n; ++i) {
            min_dist[i] = std::min(min_dist[i], squared_distance(data[i], centroids.back()));
            total += min_dist[i];
        }

        size_t chosen = 0;
        if (total <= 0.0) {
            chosen = pick(rng);
        } else {
            std::uniform_real_distribution<double> uniform(0.0, total);
            double target = uniform(rng);
            double cumulative = 0.0;
            chosen = n - 1;
            for (size_t i = 0; i < n; ++i) {
                cumulative += min_dist[i];
                if (cumulative >= target) {
                    chosen = i;
                    break;
                }
            }
        }
        centroids.push_back(data[chosen]);
    }
    return centroids;
}

double assign_labels(const Matrix& data, const Matrix& centroids, std::vector<int>& labels) {
    double inertia = 0.0;
    for (size_t i = 0; i < data.size(); ++i) {
        double best = std::numeric_limits<double>::max();
        int best_c = 0;
        for (size_t c = 0; c < centroids.size(); ++c) {
            double d = squared_distance(data[i], centroids[c]);
            if (d < best) {
                best = d;
                best_c = static_cast<int>(c);
            }
        }
        labels[i] = best_c;
        inertia += best;
    }
    return inertia;
}

KMeansResult lloyd(const Matrix& data, int k, const KMeansConfig& config, std::mt19937& rng) {
    const size_t n = data.size();
    const size_t dim = data[0].size();

    KMeansResult result;
    result.centroids = kmeans_plus_plus(data, k, rng);
    result.labels.assign(n, 0);

    for (int iter = 0; iter < config.max_iter; ++iter) {
        assign_labels(data, result.centroids, result.labels);
        result.iterations = iter + 1;

        Matrix sums(k, std::vector<double>(dim, 0.0));
        std::vector<size_t> counts(k, 0);
        for (size_t i = 0; i < n; ++i) {
            int c = result.labels[i];
            counts[c]++;
            for (size_t d = 0; d < dim; ++d) {
                sums[c][d] += data[i][d];
            }
        }

        double shift = 0.0;
        for (int c = 0; c < k; ++c) {
            std::vector<double> updated(dim, 0.0);
            if (counts[c] == 0) {
                // Reseed an empty cluster on the point farthest from its centroid
                size_t farthest = 0;
                double worst = -1.0;
                for (size_t i = 0; i < n; ++i) {
                    double d = squared_distance(data[i], result.centroids[result.labels[i]]);
                    if (d > worst) {
                        worst = d;
                        farthest = i;
                    }
                }
                updated = data[farthest];
            } else {
                for (size_t d = 0; d < dim; ++d) {
                    updated[d] = sums[c][d] / static_cast<double>(counts[c]);
                }
            }
            shift += squared_distance(updated, result.centroids[c]);
            result.centroids[c] = std::move(updated);
        }

        if (shift <= config.tol * config.tol) {
            break;
        }
    }

    result.inertia = assign_labels(data, result.centroids, result.labels);
    return result;
}

void region_query(const Matrix& data, size_t index, double eps_sq, std::vector<size_t>& out) {
    out.clear();
    for (size_t j = 0; j < data.size(); ++j) {
        if (squared_distance(data[index], data[j]) <= eps_sq) {
            out.push_back(j);
        }
    }
}

} // anonymous namespace

Matrix to_matrix(const std::vector<std::vector<float>>& embeddings) {
    Matrix data;
    data.reserve(embeddings.size());
    for (const auto& row : embeddings) {
        if (!data.empty() && row.size() != data[0].size()) {
            throw ClusteringError("Embeddings have inconsistent dimensions");
        }
        data.emplace_back(row.begin(), row.end());
    }
    return data;
}

Matrix standardize(const Matrix& data) {
    if (data.empty()) {
        return data;
    }

    const size_t n = data.size();
    const size_t dim = data[0].size();
    std::vector<double> mean(dim, 0.0);
    std::vector<double> stddev(dim, 0.0);

    for (const auto& row : data) {
        for (size_t d = 0; d < dim; ++d) {
            mean[d] += row[d];
        }
    }
    for (size_t d = 0; d < dim; ++d) {
        mean[d] /= static_cast<double>(n);
    }
    for (const auto& row : data) {
        for (size_t d = 0; d < dim; ++d) {
            double diff = row[d] - mean[d];
            stddev[d] += diff * diff;
        }
    }
    for (size_t d = 0; d < dim; ++d) {
        stddev[d] = std::sqrt(stddev[d] / static_cast<double>(n));
    }

    Matrix scaled(n, std::vector<double>(dim, 0.0));
    for (size_t i = 0; i < n; ++i) {
        for (size_t d = 0; d < dim; ++d) {
            double centered = data[i][d] - mean[d];
            scaled[i][d] = (stddev[d] > 0.0) ? centered / stddev[d] : centered;
        }
    }
    return scaled;
}

double squared_distance(const std::vector<double>& a, const std::vector<double>& b) {
    double sum = 0.0;
    for (size_t d = 0; d < a.size() && d < b.size(); ++d) {
        double diff = a[d] - b[d];
        sum += diff * diff;
    }
    return sum;
}

KMeansResult kmeans_fit(const Matrix& data, int k, const KMeansConfig& config) {
    if (data.empty()) {
        throw ClusteringError("Cannot fit K-Means on an empty set");
    }
    if (k < 1 || static_cast<size_t>(k) > data.size()) {
        throw ClusteringError("n_clusters=" + std::to_string(k) + " must be in [1, " +
                              std::to_string(data.size()) + "]");
    }

    std::mt19937 rng(config.seed);
    KMeansResult best;
    bool have_best = false;

    for (int run = 0; run < std::max(1, config.n_init); ++run) {
        KMeansResult candidate = lloyd(data, k, config, rng);
        if (!have_best || candidate.inertia < best.inertia) {
            best = std::move(candidate);
            have_best = true;
        }
    }
    return best;
}

int select_elbow_k(const std::vector<double>& inertias) {
    if (inertias.size() < 2) {
        return 0;
    }
    size_t best = 0;
    double best_delta = -1.0;
    for (size_t i = 0; i + 1 < inertias.size(); ++i) {
        double delta = std::fabs(inertias[i + 1] - inertias[i]);
        if (delta > best_delta) {
            best_delta = delta;
            best = i;
        }
    }
    return static_cast<int>(best) + 2;
}

int elbow_cluster_count(const Matrix& standardized, int max_clusters,
                        int n_init, unsigned seed) {
    const int n = static_cast<int>(standardized.size());
    if (n < 10) {
        return std::min(3, n);
    }

    int max_k = std::min(max_clusters, n / 2);

    KMeansConfig config;
    config.n_init = n_init;
    config.seed = seed;

    std::vector<double> inertias;
    for (int k = 2; k <= max_k; ++k) {
        inertias.push_back(kmeans_fit(standardized, k, config).inertia);
    }

    int k = select_elbow_k(inertias);
    return k > 0 ? k : std::min(3, n);
}

DbscanResult dbscan_fit(const Matrix& data, double eps, int min_samples) {
    if (eps <= 0.0) {
        throw ClusteringError("eps must be positive");
    }
    if (min_samples < 1) {
        throw ClusteringError("min_samples must be at least 1");
    }

    constexpr int kUnvisited = -2;
    const size_t n = data.size();
    const double eps_sq = eps * eps;

    DbscanResult result;
    result.labels.assign(n, kUnvisited);

    std::vector<size_t> neighbors;
    std::vector<size_t> expansion;
    int cluster = 0;

    for (size_t i = 0; i < n; ++i) {
        if (result.labels[i] != kUnvisited) continue;

        region_query(data, i, eps_sq, neighbors);
        if (static_cast<int>(neighbors.size()) < min_samples) {
            result.labels[i] = kNoise;
            continue;
        }

        result.labels[i] = cluster;
        std::vector<size_t> queue(neighbors.begin(), neighbors.end());
        for (size_t q = 0; q < queue.size(); ++q) {
            size_t j = queue[q];
            if (result.labels[j] == kNoise) {
                result.labels[j] = cluster;  // border point
            }
            if (result.labels[j] != kUnvisited) continue;

            result.labels[j] = cluster;
            region_query(data, j, eps_sq, expansion);
            if (static_cast<int>(expansion.size()) >= min_samples) {
                queue.insert(queue.end(), expansion.begin(), expansion.end());
            }
        }
        cluster++;
    }

    result.n_clusters = cluster;
    result.n_noise = static_cast<size_t>(
        std::count(result.labels.begin(), result.labels.end(), kNoise));
    return result;
}

} // namespace tfa
