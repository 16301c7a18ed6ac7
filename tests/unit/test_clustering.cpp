#include <gtest/gtest.h>
#include "clustering/clustering_algorithms.hpp"
#include "clustering/embedding_clusterer.hpp"
#include "clustering/embedding_provider.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <set>

using namespace tfa;

namespace {

// Three tight clouds of `per_cloud` points around (0,0), (10,0) and (0,10)
std::vector<EmbeddingVector> three_clouds(size_t per_cloud = 10) {
    const float centers[3][2] = {{0.0f, 0.0f}, {10.0f, 0.0f}, {0.0f, 10.0f}};
    std::vector<EmbeddingVector> points;
    for (const auto& center : centers) {
        for (size_t i = 0; i < per_cloud; ++i) {
            float dx = 0.05f * static_cast<float>(i % 4);
            float dy = 0.05f * static_cast<float>(i / 4);
            points.push_back({center[0] + dx, center[1] + dy});
        }
    }
    return points;
}

// Returns fixed vectors regardless of the texts
class FixedEmbeddingProvider : public EmbeddingProvider {
public:
    explicit FixedEmbeddingProvider(std::vector<EmbeddingVector> vectors)
        : vectors_(std::move(vectors)) {}

    std::vector<EmbeddingVector> embed(const std::vector<std::string>& texts) override {
        if (texts.size() != vectors_.size()) {
            return {};
        }
        return vectors_;
    }

    std::string model_name() const override { return "fixed"; }

private:
    std::vector<EmbeddingVector> vectors_;
};

std::vector<std::string> placeholder_texts(size_t n) {
    std::vector<std::string> texts;
    for (size_t i = 0; i < n; ++i) {
        texts.push_back("comment " + std::to_string(i));
    }
    return texts;
}

} // namespace

// ==========================================
// Matrix Helper Tests
// ==========================================

TEST(ClusteringAlgorithmsTest, StandardizeColumns) {
    Matrix data = {{1.0, 5.0}, {3.0, 5.0}};
    Matrix scaled = standardize(data);

    EXPECT_DOUBLE_EQ(scaled[0][0], -1.0);
    EXPECT_DOUBLE_EQ(scaled[1][0], 1.0);
    // Constant column is only centered
    EXPECT_DOUBLE_EQ(scaled[0][1], 0.0);
    EXPECT_DOUBLE_EQ(scaled[1][1], 0.0);
}

TEST(ClusteringAlgorithmsTest, InconsistentDimensionsThrow) {
    EXPECT_THROW(to_matrix({{1.0f, 2.0f}, {1.0f}}), ClusteringError);
}

// ==========================================
// K-Means Tests
// ==========================================

TEST(ClusteringAlgorithmsTest, KMeansSeparatesClouds) {
    Matrix data = to_matrix(three_clouds());
    KMeansResult fit = kmeans_fit(data, 3);

    ASSERT_EQ(fit.labels.size(), 30u);
    std::set<int> distinct;
    for (int cloud = 0; cloud < 3; ++cloud) {
        int label = fit.labels[cloud * 10];
        for (int i = 0; i < 10; ++i) {
            EXPECT_EQ(fit.labels[cloud * 10 + i], label);
        }
        distinct.insert(label);
    }
    EXPECT_EQ(distinct.size(), 3u);
    EXPECT_LT(fit.inertia, 1.0);
}

TEST(ClusteringAlgorithmsTest, KMeansIsDeterministicForSeed) {
    Matrix data = standardize(to_matrix(three_clouds()));
    KMeansConfig config;
    config.seed = 7;
    EXPECT_EQ(kmeans_fit(data, 4, config).labels, kmeans_fit(data, 4, config).labels);
}

TEST(ClusteringAlgorithmsTest, KMeansRejectsBadK) {
    Matrix data = to_matrix(three_clouds(2));
    EXPECT_THROW(kmeans_fit(data, 0), ClusteringError);
    EXPECT_THROW(kmeans_fit(data, 7), ClusteringError);
    EXPECT_THROW(kmeans_fit(Matrix{}, 1), ClusteringError);
}

// ==========================================
// Elbow Tests
// ==========================================

TEST(ClusteringAlgorithmsTest, ElbowFormula) {
    // Largest drop between k=2 and k=3
    EXPECT_EQ(select_elbow_k({100.0, 40.0, 35.0, 33.0}), 2);
    // Largest drop between k=3 and k=4
    EXPECT_EQ(select_elbow_k({100.0, 90.0, 20.0, 18.0}), 3);
    EXPECT_EQ(select_elbow_k({100.0}), 0);
    EXPECT_EQ(select_elbow_k({}), 0);
}

TEST(ClusteringAlgorithmsTest, ElbowOnThreeClouds) {
    Matrix data = standardize(to_matrix(three_clouds()));
    int k = elbow_cluster_count(data, 10, 5, 42);
    EXPECT_GE(k, 2);
    EXPECT_LE(k, 4);
}

TEST(ClusteringAlgorithmsTest, ElbowOnSmallSets) {
    Matrix data = standardize(to_matrix(three_clouds(3)));  // 9 points
    EXPECT_EQ(elbow_cluster_count(data, 10, 5, 42), 3);

    Matrix two = {{0.0}, {1.0}};
    EXPECT_EQ(elbow_cluster_count(two, 10, 5, 42), 2);
}

// ==========================================
// DBSCAN Tests
// ==========================================

TEST(ClusteringAlgorithmsTest, DbscanFindsCloudsAndNoise) {
    auto points = three_clouds();
    points.push_back({50.0f, 50.0f});
    points.push_back({-50.0f, 30.0f});
    Matrix data = to_matrix(points);

    DbscanResult fit = dbscan_fit(data, 1.0, 3);
    EXPECT_EQ(fit.n_clusters, 3);
    EXPECT_EQ(fit.n_noise, 2u);
    EXPECT_EQ(fit.labels[30], kNoise);
    EXPECT_EQ(fit.labels[31], kNoise);

    size_t clustered = 0;
    for (int c = 0; c < fit.n_clusters; ++c) {
        clustered += static_cast<size_t>(std::count(fit.labels.begin(), fit.labels.end(), c));
    }
    EXPECT_EQ(clustered + fit.n_noise, points.size());
}

TEST(ClusteringAlgorithmsTest, DbscanMinSamplesCountsThePoint) {
    Matrix data = {{0.0}, {0.5}, {10.0}};
    DbscanResult fit = dbscan_fit(data, 1.0, 2);
    EXPECT_EQ(fit.n_clusters, 1);
    EXPECT_EQ(fit.labels[0], 0);
    EXPECT_EQ(fit.labels[1], 0);
    EXPECT_EQ(fit.labels[2], kNoise);

    EXPECT_EQ(dbscan_fit(data, 1.0, 1).n_noise, 0u);
}

TEST(ClusteringAlgorithmsTest, DbscanRejectsBadParameters) {
    Matrix data = {{0.0}};
    EXPECT_THROW(dbscan_fit(data, 0.0, 3), ClusteringError);
    EXPECT_THROW(dbscan_fit(data, 0.5, 0), ClusteringError);
}

// ==========================================
// Embedding Provider Tests
// ==========================================

TEST(HashingEmbeddingProviderTest, NormalizedAndDeterministic) {
    HashingEmbeddingProvider provider(64);
    EmbeddingVector a = provider.embed_one("La formation était très utile");
    EmbeddingVector b = provider.embed_one("La formation était très utile");

    ASSERT_EQ(a.size(), 64u);
    EXPECT_EQ(a, b);

    double norm = 0.0;
    for (float x : a) norm += static_cast<double>(x) * x;
    EXPECT_NEAR(std::sqrt(norm), 1.0, 1e-5);
}

TEST(HashingEmbeddingProviderTest, SimilarTextsAreCloser) {
    HashingEmbeddingProvider provider;
    auto v = provider.embed({"salle trop petite", "salle petite", "التدريب مفيد"});
    ASSERT_EQ(v.size(), 3u);

    auto dot = [](const EmbeddingVector& x, const EmbeddingVector& y) {
        double s = 0.0;
        for (size_t i = 0; i < x.size(); ++i) s += static_cast<double>(x[i]) * y[i];
        return s;
    };
    EXPECT_GT(dot(v[0], v[1]), dot(v[0], v[2]));
}

TEST(HashingEmbeddingProviderTest, EmptyTextIsZeroVector) {
    HashingEmbeddingProvider provider(16);
    EmbeddingVector v = provider.embed_one("");
    EXPECT_EQ(v, EmbeddingVector(16, 0.0f));
}

// ==========================================
// Clusterer Tests
// ==========================================

class EmbeddingClustererTest : public ::testing::Test {
protected:
    std::vector<EmbeddingVector> points = three_clouds();
    std::shared_ptr<FixedEmbeddingProvider> provider =
        std::make_shared<FixedEmbeddingProvider>(points);
};

TEST_F(EmbeddingClustererTest, ExplicitClusterCount) {
    EmbeddingClusterer clusterer(provider, ClustererConfig{});
    ClusteringParams params;
    params.n_clusters = 3;

    ClusteringOutcome outcome = clusterer.cluster(placeholder_texts(30), params);
    ASSERT_EQ(outcome.embeddings.size(), 30u);
    ASSERT_EQ(outcome.assignment.labels.size(), 30u);

    const auto& info = outcome.assignment.info;
    EXPECT_EQ(info["method"], "kmeans");
    EXPECT_EQ(info["n_clusters"], 3);
    EXPECT_EQ(info["k_source"], "explicit");
    EXPECT_EQ(info["n_noise"], 0);

    int total = 0;
    for (const auto& [cluster, size] : info["cluster_sizes"].items()) {
        total += size.get<int>();
    }
    EXPECT_EQ(total, 30);
}

TEST_F(EmbeddingClustererTest, ConfiguredAndElbowClusterCount) {
    ClustererConfig config;
    config.default_n_clusters = 2;
    EmbeddingClusterer configured(provider, config);
    EXPECT_EQ(configured.cluster_embeddings(points).info["k_source"], "configured");

    EmbeddingClusterer elbow(provider, ClustererConfig{});
    auto info = elbow.cluster_embeddings(points).info;
    EXPECT_EQ(info["k_source"], "elbow");
    EXPECT_GE(info["n_clusters"].get<int>(), 2);
}

TEST_F(EmbeddingClustererTest, DbscanByParams) {
    EmbeddingClusterer clusterer(provider, ClustererConfig{});
    ClusteringParams params;
    params.method = "dbscan";
    params.eps = 1.0;
    params.min_samples = 3;

    ClusterAssignment assignment = clusterer.cluster_embeddings(points, params);
    EXPECT_EQ(assignment.info["method"], "dbscan");
    EXPECT_EQ(assignment.info["n_clusters"], 3);
    EXPECT_EQ(assignment.info["n_noise"], 0);
}

TEST_F(EmbeddingClustererTest, KMeansFailureDegradesToSingleCluster) {
    EmbeddingClusterer clusterer(provider, ClustererConfig{});
    ClusteringParams params;
    params.n_clusters = 100;

    ClusterAssignment assignment = clusterer.cluster_embeddings(points, params);
    EXPECT_EQ(assignment.labels, std::vector<int>(30, 0));
    EXPECT_TRUE(assignment.info.empty());
}

TEST_F(EmbeddingClustererTest, DbscanFailureDegradesToNoise) {
    EmbeddingClusterer clusterer(provider, ClustererConfig{});
    ClusteringParams params;
    params.method = "dbscan";
    params.eps = -1.0;

    ClusterAssignment assignment = clusterer.cluster_embeddings(points, params);
    EXPECT_EQ(assignment.labels, std::vector<int>(30, kNoise));
    EXPECT_TRUE(assignment.info.empty());
}

TEST_F(EmbeddingClustererTest, NoEmbeddingsSkipsClustering) {
    EmbeddingClusterer clusterer(provider, ClustererConfig{});
    ClusteringOutcome outcome = clusterer.cluster(placeholder_texts(5));
    EXPECT_TRUE(outcome.embeddings.empty());
    EXPECT_TRUE(outcome.assignment.labels.empty());
}

TEST(ClusterSummaryTest, SummarizeSkipsNoise) {
    std::vector<int> labels = {0, 0, 1, kNoise};
    std::vector<EmbeddingVector> embeddings = {{1.0f, 0.0f}, {3.0f, 2.0f}, {5.0f, 5.0f},
                                               {9.0f, 9.0f}};
    std::vector<std::vector<std::string>> themes = {
        {"salle", "pause"}, {"pause"}, {"formateur"}, {"bruit"}
    };
    std::vector<double> scores = {0.8, -0.4, 0.6, -0.9};

    auto summaries = EmbeddingClusterer::summarize(labels, embeddings, themes, scores);
    ASSERT_EQ(summaries.size(), 2u);

    EXPECT_EQ(summaries[0].cluster_number, 0);
    EXPECT_EQ(summaries[0].size, 2u);
    ASSERT_EQ(summaries[0].representative_themes.size(), 2u);
    EXPECT_EQ(summaries[0].representative_themes[0], "pause");
    EXPECT_EQ(summaries[0].representative_themes[1], "salle");
    EXPECT_NEAR(summaries[0].avg_sentiment, 0.2, 1e-12);
    EXPECT_FLOAT_EQ(summaries[0].centroid[0], 2.0f);
    EXPECT_FLOAT_EQ(summaries[0].centroid[1], 1.0f);

    EXPECT_EQ(summaries[1].cluster_number, 1);
    EXPECT_EQ(summaries[1].size, 1u);
    EXPECT_NEAR(summaries[1].avg_sentiment, 0.6, 1e-12);
}
