#include "language/language_classifier.hpp"
#include "core/errors.hpp"
#include "core/text_utils.hpp"
#include <algorithm>
#include <initializer_list>
#include <iostream>
#include <set>

namespace tfa {

namespace {

const std::set<std::string>& darija_marker_words() {
    static const std::set<std::string> words = {
        "daba", "bezzaf", "mezyan", "mzyan", "dyal", "kayn", "makaynch",
        "wakha", "ach", "chno", "kifach", "fach", "wach", "smiya",
        "kheddam", "khdam", "bach", "hna", "nta", "ntina",
        "ghir", "bghit", "bgha", "machi", "yallah", "safi",
        "dial", "rah", "ghi", "bhal", "u"
    };
    return words;
}

/**
 * @brief A word of the lowered text and how it is joined to the previous one
 */
struct ScannedWord {
    std::string text;
    bool spaced = false;                    ///< Only whitespace since the previous word
};

// Single linear pass; input length is unbounded (pasted URLs, long runs).
std::vector<ScannedWord> scan_words(const std::string& lowered_text) {
    std::vector<ScannedWord> words;
    std::string current;
    bool gap_has_space = false;
    bool gap_has_other = false;

    for (char32_t cp : decode_utf8(lowered_text)) {
        if (is_word_code_point(cp)) {
            if (current.empty()) {
                ScannedWord word;
                word.spaced = !words.empty() && gap_has_space && !gap_has_other;
                words.push_back(word);
                gap_has_space = false;
                gap_has_other = false;
            }
            append_utf8(current, cp);
            continue;
        }
        if (!current.empty()) {
            words.back().text = current;
            current.clear();
        }
        if (cp == U' ' || cp == U'\t' || cp == U'\n' || cp == U'\r' ||
            cp == U'\f' || cp == U'\v' || cp == 0x00A0) {
            gap_has_space = true;
        } else {
            gap_has_other = true;
        }
    }
    if (!current.empty()) {
        words.back().text = current;
    }
    return words;
}

bool is_one_of(const std::string& word, std::initializer_list<const char*> options) {
    for (const char* option : options) {
        if (word == option) return true;
    }
    return false;
}

bool contains_word(const std::vector<ScannedWord>& words,
                   std::initializer_list<const char*> options) {
    for (const auto& word : words) {
        if (is_one_of(word.text, options)) return true;
    }
    return false;
}

// "<head> <word>", the next word separated by whitespace only
bool head_then_word(const std::vector<ScannedWord>& words,
                    std::initializer_list<const char*> heads) {
    for (size_t i = 0; i + 1 < words.size(); ++i) {
        if (is_one_of(words[i].text, heads) && words[i + 1].spaced) return true;
    }
    return false;
}

// "<word> dyal <word>"
bool possessive_construct(const std::vector<ScannedWord>& words) {
    for (size_t i = 1; i + 1 < words.size(); ++i) {
        if (is_one_of(words[i].text, {"dyal", "dial"}) &&
            words[i].spaced && words[i + 1].spaced) {
            return true;
        }
    }
    return false;
}

int count_darija_patterns(const std::string& lowered_text) {
    std::vector<ScannedWord> words = scan_words(lowered_text);
    int patterns = 0;
    if (contains_word(words, {"ach", "chno", "kifach", "fach", "wach"})) patterns++;
    if (contains_word(words, {"daba", "bezzaf", "mezyan", "mzyan"})) patterns++;
    if (head_then_word(words, {"dyal", "dial"})) patterns++;
    if (contains_word(words, {"kayn", "makaynch"})) patterns++;
    if (head_then_word(words, {"ghir", "ghi"})) patterns++;
    if (possessive_construct(words)) patterns++;
    return patterns;
}

} // anonymous namespace

LanguageClassifier::LanguageClassifier(std::shared_ptr<LanguageIdentifier> identifier,
                                       bool verbose)
    : identifier_(std::move(identifier)),
      verbose_(verbose) {}

DarijaFeatures LanguageClassifier::darija_features(const std::string& lowered_text) const {
    DarijaFeatures features;

    auto tokens = word_tokens(lowered_text);
    std::set<std::string> present(tokens.begin(), tokens.end());
    for (const auto& marker : darija_marker_words()) {
        if (present.count(marker)) {
            features.markers++;
        }
    }

    // Multi-token markers
    for (size_t i = 0; i + 1 < tokens.size(); ++i) {
        if (tokens[i] == "had" && tokens[i + 1] == "chi") {
            features.markers++;
            break;
        }
    }
    for (const auto& word : split_whitespace(lowered_text)) {
        if (word.size() > 2 && word.compare(0, 2, "w-") == 0) {
            features.markers++;
            break;
        }
    }

    features.patterns = count_darija_patterns(lowered_text);

    return features;
}

LanguageLabel LanguageClassifier::detect_by_script(
    const std::string& text,
    const DarijaFeatures& features
) const {
    size_t arabic = 0;
    size_t latin = 0;
    for (char32_t cp : decode_utf8(text)) {
        if (is_arabic_code_point(cp)) {
            ++arabic;
        } else if (cp < 0x0600 && is_alpha_code_point(cp)) {
            ++latin;
        }
    }

    if (arabic > latin) {
        return features.has_any_marker() ? LanguageLabel::DARIJA : LanguageLabel::AR;
    }
    return LanguageLabel::FR;
}

LanguageLabel LanguageClassifier::detect(const std::string& text) const {
    if (is_blank(text)) {
        return LanguageLabel::FR;
    }

    std::string lowered = to_lower_utf8(text);
    DarijaFeatures features = darija_features(lowered);
    if (features.is_darija()) {
        return LanguageLabel::DARIJA;
    }

    try {
        std::string code = identifier_->detect(text);
        if (code == "fr") {
            return LanguageLabel::FR;
        }
        if (code == "ar") {
            return features.has_any_marker() ? LanguageLabel::DARIJA : LanguageLabel::AR;
        }
        // Latin-family and unknown codes default to French
        return LanguageLabel::FR;
    } catch (const std::exception& e) {
        if (verbose_) {
            std::cerr << "[LanguageClassifier] Identifier failed (" << e.what()
                      << "), using script heuristic" << std::endl;
        }
        return detect_by_script(text, features);
    }
}

double LanguageClassifier::confidence(const std::string& text, LanguageLabel language) const {
    if (is_blank(text)) {
        return 0.5;
    }

    switch (language) {
        case LanguageLabel::DARIJA: {
            DarijaFeatures features = darija_features(to_lower_utf8(text));
            double score = std::min(1.0, (features.markers + features.patterns) / 5.0);
            return std::max(0.6, score);
        }
        case LanguageLabel::AR: {
            size_t arabic = 0;
            size_t alphabetic = 0;
            for (char32_t cp : decode_utf8(text)) {
                if (!is_alpha_code_point(cp)) continue;
                ++alphabetic;
                if (is_arabic_code_point(cp)) ++arabic;
            }
            if (alphabetic == 0) {
                return 0.5;
            }
            return std::min(1.0, static_cast<double>(arabic) / alphabetic);
        }
        case LanguageLabel::FR:
        default: {
            try {
                for (const auto& guess : identifier_->identify(text)) {
                    if (guess.code == "fr") {
                        return guess.probability;
                    }
                }
            } catch (const LanguageIdentificationError& e) {
                if (verbose_) {
                    std::cerr << "[LanguageClassifier] " << e.what() << std::endl;
                }
            }
            return 0.7;
        }
    }
}

LanguageDetection LanguageClassifier::detect_with_confidence(const std::string& text) const {
    LanguageDetection detection;
    detection.language = detect(text);
    detection.confidence = confidence(text, detection.language);
    return detection;
}

std::vector<LanguageLabel> LanguageClassifier::detect_batch(
    const std::vector<std::string>& texts
) const {
    std::vector<LanguageLabel> labels;
    labels.reserve(texts.size());
    for (const auto& text : texts) {
        labels.push_back(detect(text));
    }
    return labels;
}

} // namespace tfa
