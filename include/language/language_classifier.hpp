#pragma once

#include "core/records.hpp"
#include "language/language_identifier.hpp"
#include <memory>
#include <string>
#include <vector>

namespace tfa {

/**
 * @brief Darija evidence found in a lower-cased text
 */
struct DarijaFeatures {
    int markers = 0;                        ///< Distinct marker words/phrases present
    int patterns = 0;                       ///< Distinct word patterns that matched

    bool is_darija() const { return markers >= 2 || patterns >= 1; }
    bool has_any_marker() const { return markers >= 1; }
};

/**
 * @brief Detected language with its confidence
 */
struct LanguageDetection {
    LanguageLabel language = LanguageLabel::FR;
    double confidence = 0.5;
};

/**
 * @brief Classifies comments into FR, AR or DARIJA
 *
 * Darija is checked first with lexical markers and patterns, then the
 * statistical identifier is consulted. Identifier failure falls back to a
 * script count (Arabic vs Latin letters). Classification never throws.
 */
class LanguageClassifier {
public:
    explicit LanguageClassifier(std::shared_ptr<LanguageIdentifier> identifier,
                                bool verbose = false);

    LanguageLabel detect(const std::string& text) const;

    /**
     * @brief Confidence in [0, 1] that text is in the given language
     */
    double confidence(const std::string& text, LanguageLabel language) const;

    LanguageDetection detect_with_confidence(const std::string& text) const;

    std::vector<LanguageLabel> detect_batch(const std::vector<std::string>& texts) const;

    DarijaFeatures darija_features(const std::string& lowered_text) const;

private:
    std::shared_ptr<LanguageIdentifier> identifier_;
    bool verbose_;

    LanguageLabel detect_by_script(const std::string& text,
                                   const DarijaFeatures& features) const;
};

} // namespace tfa
