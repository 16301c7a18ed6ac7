#pragma once

#include "http/http_client.hpp"
#include <memory>
#include <string>
#include <vector>

namespace tfa {

using EmbeddingVector = std::vector<float>;

// ============================================================================
// Embedding Provider Interface
// ============================================================================

/**
 * @brief Produces one fixed-dimension vector per text
 *
 * Returns an empty list on failure; callers then skip clustering.
 */
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual std::vector<EmbeddingVector> embed(const std::vector<std::string>& texts) = 0;

    virtual std::string model_name() const = 0;
};

struct HttpEmbeddingConfig {
    std::string api_url = "https://api-inference.huggingface.co/models/";
    std::string api_key;
    std::string model = "sentence-transformers/paraphrase-multilingual-MiniLM-L12-v2";
    size_t batch_size = 32;
    int timeout_seconds = 30;
    bool verbose = false;
};

/**
 * @brief Sentence embeddings from a hosted feature-extraction endpoint
 *
 * Token-level responses (one vector per token) are mean-pooled.
 */
class HttpEmbeddingProvider : public EmbeddingProvider {
public:
    HttpEmbeddingProvider(std::shared_ptr<HttpClient> http, HttpEmbeddingConfig config);

    std::vector<EmbeddingVector> embed(const std::vector<std::string>& texts) override;

    std::string model_name() const override { return config_.model; }

private:
    std::shared_ptr<HttpClient> http_;
    HttpEmbeddingConfig config_;

    std::vector<EmbeddingVector> embed_chunk(const std::vector<std::string>& texts);
};

/**
 * @brief Local feature-hashing embeddings over character trigrams and words
 *
 * Deterministic across runs and platforms; vectors are L2-normalized.
 */
class HashingEmbeddingProvider : public EmbeddingProvider {
public:
    explicit HashingEmbeddingProvider(size_t dimension = 384);

    std::vector<EmbeddingVector> embed(const std::vector<std::string>& texts) override;

    std::string model_name() const override;

    EmbeddingVector embed_one(const std::string& text) const;

    size_t dimension() const { return dimension_; }

private:
    size_t dimension_;
};

} // namespace tfa
