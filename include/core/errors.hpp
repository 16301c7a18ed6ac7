#pragma once

#include <stdexcept>
#include <string>

namespace tfa {

/**
 * @brief Transport-level failure of an HTTP request (connection, timeout, TLS)
 */
class HttpError : public std::runtime_error {
public:
    explicit HttpError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Statistical language identifier could not produce a guess
 */
class LanguageIdentificationError : public std::runtime_error {
public:
    explicit LanguageIdentificationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Term vectorization produced an empty vocabulary
 */
class VectorizerError : public std::runtime_error {
public:
    explicit VectorizerError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Clustering could not be fitted on the given embeddings
 */
class ClusteringError : public std::runtime_error {
public:
    explicit ClusteringError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Record store failed to commit; the pending writes were rolled back
 */
class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Invalid or unreadable configuration
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace tfa
