#include "clustering/embedding_provider.hpp"
#include "core/errors.hpp"
#include "core/text_utils.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace tfa {

namespace {

// 64-bit FNV-1a, stable across standard library implementations
uint64_t fnv1a(const std::string& s) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : s) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

EmbeddingVector parse_vector(const json& value) {
    EmbeddingVector out;
    if (!value.is_array() || value.empty()) {
        throw std::runtime_error("Embedding is not a non-empty array");
    }

    if (value[0].is_number()) {
        out.reserve(value.size());
        for (const auto& x : value) {
            out.push_back(x.get<float>());
        }
        return out;
    }

    // Token embeddings: mean-pool
    size_t tokens = 0;
    for (const auto& token : value) {
        EmbeddingVector v = parse_vector(token);
        if (out.empty()) {
            out.assign(v.size(), 0.0f);
        }
        if (v.size() != out.size()) {
            throw std::runtime_error("Token embeddings differ in dimension");
        }
        for (size_t d = 0; d < v.size(); ++d) {
            out[d] += v[d];
        }
        tokens++;
    }
    for (auto& x : out) {
        x /= static_cast<float>(tokens);
    }
    return out;
}

} // anonymous namespace

// ============================================================================
// HttpEmbeddingProvider
// ============================================================================

HttpEmbeddingProvider::HttpEmbeddingProvider(std::shared_ptr<HttpClient> http,
                                             HttpEmbeddingConfig config)
    : http_(std::move(http)), config_(std::move(config)) {
    if (config_.batch_size == 0) {
        config_.batch_size = 32;
    }
}

std::vector<EmbeddingVector> HttpEmbeddingProvider::embed_chunk(
    const std::vector<std::string>& texts
) {
    json payload;
    payload["inputs"] = texts;

    std::vector<std::string> headers = {"Content-Type: application/json"};
    if (!config_.api_key.empty()) {
        headers.push_back("Authorization: Bearer " + config_.api_key);
    }

    HttpResponse response = http_->post(config_.api_url + config_.model, payload.dump(),
                                        headers, config_.timeout_seconds);
    if (!response.ok()) {
        throw HttpError("Embedding API returned status " + std::to_string(response.status));
    }

    json body = json::parse(response.body);
    if (!body.is_array() || body.size() != texts.size()) {
        throw std::runtime_error("Embedding response does not match the request size");
    }

    std::vector<EmbeddingVector> vectors;
    vectors.reserve(texts.size());
    for (const auto& item : body) {
        vectors.push_back(parse_vector(item));
    }
    return vectors;
}

std::vector<EmbeddingVector> HttpEmbeddingProvider::embed(
    const std::vector<std::string>& texts
) {
    std::vector<EmbeddingVector> vectors;
    if (texts.empty()) {
        return vectors;
    }

    try {
        for (size_t start = 0; start < texts.size(); start += config_.batch_size) {
            size_t end = std::min(texts.size(), start + config_.batch_size);
            std::vector<std::string> chunk(texts.begin() + start, texts.begin() + end);
            auto part = embed_chunk(chunk);
            vectors.insert(vectors.end(), part.begin(), part.end());
        }

        for (const auto& v : vectors) {
            if (v.size() != vectors.front().size()) {
                throw std::runtime_error("Embeddings differ in dimension");
            }
        }
    } catch (const std::exception& e) {
        if (config_.verbose) {
            std::cerr << "[HttpEmbeddingProvider] Error generating embeddings: "
                      << e.what() << std::endl;
        }
        return {};
    }

    return vectors;
}

// ============================================================================
// HashingEmbeddingProvider
// ============================================================================

HashingEmbeddingProvider::HashingEmbeddingProvider(size_t dimension)
    : dimension_(dimension == 0 ? 384 : dimension) {}

std::string HashingEmbeddingProvider::model_name() const {
    return "hashing-trigram-" + std::to_string(dimension_);
}

EmbeddingVector HashingEmbeddingProvider::embed_one(const std::string& text) const {
    EmbeddingVector v(dimension_, 0.0f);

    auto add_feature = [&](const std::string& feature, float weight) {
        uint64_t h = fnv1a(feature);
        size_t bucket = static_cast<size_t>(h % dimension_);
        float sign = ((h >> 63) & 1ULL) ? -1.0f : 1.0f;
        v[bucket] += sign * weight;
    };

    for (const auto& word : word_tokens(to_lower_utf8(text))) {
        add_feature("w:" + word, 1.0f);

        std::vector<char32_t> cps = decode_utf8(" " + word + " ");
        for (size_t i = 0; i + 3 <= cps.size(); ++i) {
            add_feature("c:" + encode_utf8({cps[i], cps[i + 1], cps[i + 2]}), 0.5f);
        }
    }

    double norm = 0.0;
    for (float x : v) {
        norm += static_cast<double>(x) * x;
    }
    norm = std::sqrt(norm);
    if (norm > 0.0) {
        for (auto& x : v) {
            x = static_cast<float>(x / norm);
        }
    }
    return v;
}

std::vector<EmbeddingVector> HashingEmbeddingProvider::embed(
    const std::vector<std::string>& texts
) {
    std::vector<EmbeddingVector> vectors;
    vectors.reserve(texts.size());
    for (const auto& text : texts) {
        vectors.push_back(embed_one(text));
    }
    return vectors;
}

} // namespace tfa
