#pragma once

#include "core/records.hpp"
#include "themes/term_vectorizer.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace tfa {

/**
 * @brief Themes of one text and the strategy that found them
 */
struct ThemeExtraction {
    std::vector<std::string> themes;        ///< Rank order, at most top_n
    std::string strategy;                   ///< "vectorizer", "frequency" or "empty"
};

/**
 * @brief Theme counted across a corpus
 */
struct RankedTheme {
    std::string theme;
    LanguageLabel language = LanguageLabel::FR;
    int64_t frequency = 0;
    std::vector<std::string> keywords;

    nlohmann::json to_json() const;
};

/**
 * @brief Per-language keyword extraction
 *
 * Each language has its own stop words and n-gram range. A text whose
 * vectorization leaves no term falls back to plain word frequency.
 */
class ThemeExtractor {
public:
    explicit ThemeExtractor(bool verbose = false);

    ThemeExtraction extract_one(const std::string& text,
                                LanguageLabel language,
                                size_t top_n = 5) const;

    /**
     * @brief Extract per text; info carries method and text count
     */
    std::vector<ThemeExtraction> extract_batch(const std::vector<std::string>& texts,
                                               const std::vector<LanguageLabel>& languages,
                                               size_t top_n,
                                               nlohmann::json& info) const;

    /**
     * @brief Most frequent (theme, language) pairs over a corpus
     */
    std::vector<RankedTheme> global_themes(const std::vector<std::string>& texts,
                                           const std::vector<LanguageLabel>& languages,
                                           size_t top_n = 20) const;

    /**
     * @brief Word-frequency keywords (tokens over three characters)
     */
    static std::vector<std::string> frequency_keywords(const std::string& text, size_t top_n);

    const TermVectorizer& vectorizer_for(LanguageLabel language) const;

private:
    std::map<LanguageLabel, TermVectorizer> vectorizers_;
    bool verbose_;
};

} // namespace tfa
