#include "themes/theme_extractor.hpp"
#include "core/errors.hpp"
#include "core/text_utils.hpp"
#include <algorithm>
#include <iostream>
#include <set>
#include <unordered_map>

using json = nlohmann::json;

namespace tfa {

namespace {

VectorizerConfig french_profile() {
    VectorizerConfig config;
    config.stop_words = {
        "le", "la", "les", "un", "une", "des", "de", "du", "à", "au",
        "et", "ou", "mais", "donc", "or", "ni", "car", "que", "qui",
        "est", "sont", "était", "ont", "a", "as", "avez", "ai",
        "ce", "cet", "cette", "ces", "mon", "ma", "mes", "ton", "ta", "tes",
        "son", "sa", "ses", "notre", "nos", "votre", "vos", "leur", "leurs",
        "je", "tu", "il", "elle", "nous", "vous", "ils", "elles",
        "pour", "par", "avec", "sans", "sur", "sous", "dans", "en",
        // Too generic to be a theme
        "tous", "tout", "toute", "toutes", "bien", "très", "plus", "moins",
        "comme", "aucun", "aucune", "beaucoup", "peu", "assez", "trop",
        "même", "aussi", "encore", "déjà", "jamais", "toujours", "souvent",
        "rien", "quelque", "plusieurs", "quelques", "certains", "certaines",
        "pas", "non", "oui", "si", "ne", "n", "y", "d"
    };
    config.ngram_min = 1;
    config.ngram_max = 3;
    config.min_count = 2;
    return config;
}

VectorizerConfig arabic_profile() {
    VectorizerConfig config;
    config.stop_words = {
        "في", "من", "إلى", "على", "عن", "هذا", "ذلك", "التي", "الذي",
        "هو", "هي", "أن", "كان", "لم", "لن", "قد", "لكن", "أو", "و"
    };
    config.ngram_min = 1;
    config.ngram_max = 2;
    config.min_count = 2;
    return config;
}

VectorizerConfig darija_profile() {
    VectorizerConfig config;
    config.stop_words = {
        "dyal", "dial", "w", "wla", "ola", "bach", "bla",
        "hadi", "hadak", "hadik", "hna", "nta", "nti", "howa", "hia"
    };
    config.ngram_min = 1;
    config.ngram_max = 3;
    config.min_count = 2;
    return config;
}

} // anonymous namespace

json RankedTheme::to_json() const {
    json j;
    j["theme"] = theme;
    j["language"] = language_to_string(language);
    j["frequency"] = frequency;
    j["keywords"] = keywords;
    return j;
}

ThemeExtractor::ThemeExtractor(bool verbose) : verbose_(verbose) {
    vectorizers_.emplace(LanguageLabel::FR, TermVectorizer(french_profile()));
    vectorizers_.emplace(LanguageLabel::AR, TermVectorizer(arabic_profile()));
    vectorizers_.emplace(LanguageLabel::DARIJA, TermVectorizer(darija_profile()));
}

const TermVectorizer& ThemeExtractor::vectorizer_for(LanguageLabel language) const {
    auto it = vectorizers_.find(language);
    if (it == vectorizers_.end()) {
        return vectorizers_.at(LanguageLabel::FR);
    }
    return it->second;
}

std::vector<std::string> ThemeExtractor::frequency_keywords(const std::string& text,
                                                            size_t top_n) {
    static const std::set<std::string> stop_words = {
        "le", "la", "les", "un", "une", "de", "du", "et", "ou", "à", "au", "en", "pour"
    };

    // Counts in first-occurrence order
    std::vector<std::pair<std::string, size_t>> counts;
    std::unordered_map<std::string, size_t> index;
    for (const auto& word : split_whitespace(to_lower_utf8(text))) {
        if (utf8_length(word) <= 3 || stop_words.count(word)) {
            continue;
        }
        auto it = index.find(word);
        if (it == index.end()) {
            index[word] = counts.size();
            counts.emplace_back(word, 1);
        } else {
            counts[it->second].second++;
        }
    }

    std::stable_sort(counts.begin(), counts.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    std::vector<std::string> keywords;
    for (size_t i = 0; i < counts.size() && i < top_n; ++i) {
        keywords.push_back(counts[i].first);
    }
    return keywords;
}

ThemeExtraction ThemeExtractor::extract_one(const std::string& text,
                                            LanguageLabel language,
                                            size_t top_n) const {
    ThemeExtraction extraction;
    if (is_blank(text)) {
        extraction.strategy = "empty";
        return extraction;
    }

    try {
        auto terms = vectorizer_for(language).fit_transform(text);

        // Vocabulary is lexicographic; stable sort keeps that order for ties
        std::stable_sort(terms.begin(), terms.end(),
                         [](const TermCount& a, const TermCount& b) {
                             return a.count > b.count;
                         });

        for (size_t i = 0; i < terms.size() && extraction.themes.size() < top_n; ++i) {
            if (terms[i].count > 0) {
                extraction.themes.push_back(terms[i].term);
            }
        }
        extraction.strategy = "vectorizer";
    } catch (const VectorizerError& e) {
        if (verbose_) {
            std::cerr << "[ThemeExtractor] " << e.what()
                      << ", using word frequency" << std::endl;
        }
        extraction.themes = frequency_keywords(text, top_n);
        extraction.strategy = "frequency";
    }

    return extraction;
}

std::vector<ThemeExtraction> ThemeExtractor::extract_batch(
    const std::vector<std::string>& texts,
    const std::vector<LanguageLabel>& languages,
    size_t top_n,
    json& info
) const {
    std::vector<ThemeExtraction> results;
    info = json::object();
    if (texts.empty()) {
        return results;
    }

    results.reserve(texts.size());
    for (size_t i = 0; i < texts.size(); ++i) {
        LanguageLabel language = (i < languages.size()) ? languages[i] : LanguageLabel::FR;
        results.push_back(extract_one(texts[i], language, top_n));
    }

    info["method"] = "count";
    info["n_texts"] = texts.size();
    return results;
}

std::vector<RankedTheme> ThemeExtractor::global_themes(
    const std::vector<std::string>& texts,
    const std::vector<LanguageLabel>& languages,
    size_t top_n
) const {
    json info;
    auto extractions = extract_batch(texts, languages, 5, info);

    std::vector<RankedTheme> ranked;
    std::map<std::pair<std::string, LanguageLabel>, size_t> index;
    for (size_t i = 0; i < extractions.size(); ++i) {
        LanguageLabel language = (i < languages.size()) ? languages[i] : LanguageLabel::FR;
        for (const auto& theme : extractions[i].themes) {
            auto key = std::make_pair(theme, language);
            auto it = index.find(key);
            if (it == index.end()) {
                index[key] = ranked.size();
                ranked.push_back({theme, language, 1, {theme}});
            } else {
                ranked[it->second].frequency++;
            }
        }
    }

    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const RankedTheme& a, const RankedTheme& b) {
                         return a.frequency > b.frequency;
                     });
    if (ranked.size() > top_n) {
        ranked.resize(top_n);
    }
    return ranked;
}

} // namespace tfa
