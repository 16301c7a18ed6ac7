#pragma once

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace tfa {

/**
 * @brief One ranked guess of a statistical language identifier
 */
struct LanguageGuess {
    std::string code;                       ///< ISO 639-1 code ("fr", "ar", ...)
    double probability = 0.0;               ///< In [0, 1], guesses sum to 1
};

// ============================================================================
// Language Identifier Interface
// ============================================================================

/**
 * @brief Statistical language identification
 *
 * Implementations return guesses sorted by decreasing probability. They
 * throw LanguageIdentificationError when the text carries no usable signal.
 */
class LanguageIdentifier {
public:
    virtual ~LanguageIdentifier() = default;

    virtual std::vector<LanguageGuess> identify(const std::string& text) const = 0;

    /**
     * @brief Most probable language code
     */
    std::string detect(const std::string& text) const;
};

/**
 * @brief Profile for one language: common words and frequent trigrams
 */
struct LanguageProfile {
    std::string code;
    std::set<std::string> common_words;
    std::set<std::string> trigrams;
};

/**
 * @brief Common-word and character-trigram identifier for fr, en, es, it, ar
 *
 * Latin-script probability mass is split between the Latin profiles by
 * their hit scores; the Arabic-script share of letters goes to "ar".
 */
class NgramLanguageIdentifier : public LanguageIdentifier {
public:
    NgramLanguageIdentifier();

    std::vector<LanguageGuess> identify(const std::string& text) const override;

    const std::vector<LanguageProfile>& profiles() const { return profiles_; }

private:
    std::vector<LanguageProfile> profiles_;

    double score_profile(const LanguageProfile& profile,
                         const std::vector<std::string>& tokens) const;
};

std::shared_ptr<LanguageIdentifier> make_default_language_identifier();

} // namespace tfa
