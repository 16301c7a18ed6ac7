#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

namespace tfa {

/**
 * @brief Settings of a count vectorizer
 */
struct VectorizerConfig {
    std::set<std::string> stop_words;
    size_t ngram_min = 1;
    size_t ngram_max = 1;
    size_t min_count = 1;                   ///< Terms counted fewer times are pruned
};

/**
 * @brief Term and its count in the fitted text
 */
struct TermCount {
    std::string term;
    size_t count = 0;
};

/**
 * @brief Bag-of-n-grams counter over a single text
 *
 * Tokens are lower-cased runs of at least two word characters (Latin or
 * Arabic). Stop words are removed before n-grams are formed; n-gram terms
 * join their tokens with a single space.
 */
class TermVectorizer {
public:
    TermVectorizer() = default;
    explicit TermVectorizer(VectorizerConfig config);

    /**
     * @brief Count terms of text, vocabulary in lexicographic order
     *
     * @throws VectorizerError if no term survives pruning
     */
    std::vector<TermCount> fit_transform(const std::string& text) const;

    /**
     * @brief Tokens after lower-casing and stop word removal
     */
    std::vector<std::string> tokenize(const std::string& text) const;

    const VectorizerConfig& config() const { return config_; }

private:
    VectorizerConfig config_;
};

} // namespace tfa
