#include "language/language_identifier.hpp"
#include "core/errors.hpp"
#include "core/text_utils.hpp"
#include <algorithm>

namespace tfa {

namespace {

LanguageProfile french_profile() {
    return {
        "fr",
        {"le", "la", "les", "des", "une", "est", "et", "très", "pour", "dans",
         "avec", "pas", "sur", "mais", "était", "été", "nous", "vous", "formation",
         "formateur", "cette", "ce", "qui", "que", "du", "au", "aux", "plus",
         "trop", "bien", "peu", "être", "avoir", "sont", "leur", "mal"},
        {"ent", "ion", "les", "our", "que", "tio", "eme", "ait", "ais", "éta",
         "eur", "ett", "ell", "oir", "ées", "rès"}
    };
}

LanguageProfile english_profile() {
    return {
        "en",
        {"the", "and", "is", "was", "were", "very", "of", "to", "in", "it",
         "for", "with", "this", "that", "not", "but", "are", "be", "have", "training",
         "trainer", "good", "bad", "great", "we", "they", "too", "much"},
        {"the", "ing", "and", "hat", "tha", "ere", "was", "his", "for", "ith",
         "wit", "ver", "all", "oul"}
    };
}

LanguageProfile spanish_profile() {
    return {
        "es",
        {"el", "los", "las", "es", "muy", "y", "con", "para", "por", "una",
         "fue", "pero", "del", "lo", "como", "más", "curso", "bueno", "malo",
         "nosotros", "está", "estaba"},
        {"ado", "ión", "los", "las", "que", "ent", "est", "con", "par", "muy",
         "ció", "ida"}
    };
}

LanguageProfile italian_profile() {
    return {
        "it",
        {"il", "gli", "della", "molto", "e", "è", "con", "per", "non", "una",
         "che", "sono", "stato", "stata", "ma", "corso", "buono", "anche",
         "nella", "questo", "questa"},
        {"che", "ell", "lla", "ato", "ata", "one", "zio", "per", "con", "olt",
         "ent", "gli"}
    };
}

LanguageProfile arabic_profile() {
    return {
        "ar",
        {"في", "من", "على", "إلى", "عن", "هذا", "هذه", "كان", "كانت", "مع",
         "التدريب", "المدرب", "جدا", "جيد", "ممتاز", "لا", "غير", "التي", "الذي"},
        {"ال", "الت", "الم", "ية", "ات"}
    };
}

std::vector<std::string> trigrams_of(const std::string& token) {
    std::vector<std::string> out;
    auto cps = decode_utf8(token);
    if (cps.size() < 3) {
        return out;
    }
    for (size_t i = 0; i + 3 <= cps.size(); ++i) {
        out.push_back(encode_utf8({cps[i], cps[i + 1], cps[i + 2]}));
    }
    return out;
}

} // anonymous namespace

std::string LanguageIdentifier::detect(const std::string& text) const {
    auto guesses = identify(text);
    if (guesses.empty()) {
        throw LanguageIdentificationError("No language guess available");
    }
    return guesses.front().code;
}

NgramLanguageIdentifier::NgramLanguageIdentifier() {
    profiles_.push_back(french_profile());
    profiles_.push_back(english_profile());
    profiles_.push_back(spanish_profile());
    profiles_.push_back(italian_profile());
    profiles_.push_back(arabic_profile());
}

double NgramLanguageIdentifier::score_profile(
    const LanguageProfile& profile,
    const std::vector<std::string>& tokens
) const {
    double score = 1.0;  // smoothing
    for (const auto& token : tokens) {
        if (profile.common_words.count(token)) {
            score += 2.0;
        }
        for (const auto& tri : trigrams_of(token)) {
            if (profile.trigrams.count(tri)) {
                score += 0.25;
            }
        }
    }
    return score;
}

std::vector<LanguageGuess> NgramLanguageIdentifier::identify(const std::string& text) const {
    size_t arabic_letters = 0;
    size_t latin_letters = 0;
    for (char32_t cp : decode_utf8(text)) {
        if (!is_alpha_code_point(cp)) continue;
        if (is_arabic_code_point(cp)) {
            ++arabic_letters;
        } else {
            ++latin_letters;
        }
    }

    size_t total_letters = arabic_letters + latin_letters;
    if (total_letters == 0) {
        throw LanguageIdentificationError("No features in text");
    }

    double arabic_share = static_cast<double>(arabic_letters) / total_letters;
    double latin_share = 1.0 - arabic_share;

    auto tokens = word_tokens(to_lower_utf8(text));

    std::vector<LanguageGuess> guesses;
    double latin_total = 0.0;
    std::map<std::string, double> latin_scores;
    for (const auto& profile : profiles_) {
        if (profile.code == "ar") continue;
        double s = score_profile(profile, tokens);
        latin_scores[profile.code] = s;
        latin_total += s;
    }

    for (const auto& profile : profiles_) {
        LanguageGuess guess;
        guess.code = profile.code;
        if (profile.code == "ar") {
            guess.probability = arabic_share;
        } else {
            guess.probability = latin_share * latin_scores[profile.code] / latin_total;
        }
        if (guess.probability > 0.0) {
            guesses.push_back(guess);
        }
    }

    std::stable_sort(guesses.begin(), guesses.end(),
                     [](const LanguageGuess& a, const LanguageGuess& b) {
                         return a.probability > b.probability;
                     });
    return guesses;
}

std::shared_ptr<LanguageIdentifier> make_default_language_identifier() {
    return std::make_shared<NgramLanguageIdentifier>();
}

} // namespace tfa
