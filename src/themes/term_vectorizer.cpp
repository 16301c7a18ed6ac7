#include "themes/term_vectorizer.hpp"
#include "core/errors.hpp"
#include "core/text_utils.hpp"

namespace tfa {

TermVectorizer::TermVectorizer(VectorizerConfig config) : config_(std::move(config)) {
    if (config_.ngram_min == 0) {
        config_.ngram_min = 1;
    }
    if (config_.ngram_max < config_.ngram_min) {
        config_.ngram_max = config_.ngram_min;
    }
}

std::vector<std::string> TermVectorizer::tokenize(const std::string& text) const {
    std::vector<std::string> tokens;
    for (auto& token : word_tokens(to_lower_utf8(text))) {
        if (utf8_length(token) < 2) continue;
        if (config_.stop_words.count(token)) continue;
        tokens.push_back(std::move(token));
    }
    return tokens;
}

std::vector<TermCount> TermVectorizer::fit_transform(const std::string& text) const {
    auto tokens = tokenize(text);

    std::map<std::string, size_t> counts;
    for (size_t n = config_.ngram_min; n <= config_.ngram_max; ++n) {
        if (tokens.size() < n) break;
        for (size_t i = 0; i + n <= tokens.size(); ++i) {
            std::string term = tokens[i];
            for (size_t k = 1; k < n; ++k) {
                term += ' ';
                term += tokens[i + k];
            }
            counts[term]++;
        }
    }

    std::vector<TermCount> vocabulary;
    for (const auto& [term, count] : counts) {
        if (count >= config_.min_count) {
            vocabulary.push_back({term, count});
        }
    }

    if (vocabulary.empty()) {
        throw VectorizerError("After pruning, no terms remain");
    }
    return vocabulary;
}

} // namespace tfa
