#include "themes/theme_categorizer.hpp"
#include "core/text_utils.hpp"
#include <cmath>
#include <map>
#include <stdexcept>

using json = nlohmann::json;

namespace tfa {

namespace {

using KeywordTable = std::map<LanguageLabel, std::vector<std::string>>;

const std::map<ThemeCategory, KeywordTable>& category_keywords() {
    static const std::map<ThemeCategory, KeywordTable> table = {
        {ThemeCategory::FormationQuality, {
            {LanguageLabel::FR, {"formation", "contenu", "qualité", "niveau", "profondeur",
                                 "structuré", "organisé", "excellent", "bon", "mauvais", "nul",
                                 "obsolète", "périmé", "nouveau", "clair", "théorique",
                                 "pratique", "exemples", "exercices", "cas"}},
            {LanguageLabel::AR, {"تدريب", "محتوى", "المحتوى", "جودة", "ممتاز", "جيد", "سيء",
                                 "قديم", "جداً", "واضح", "مفيد", "نظري", "عملي", "أمثلة"}},
            {LanguageLabel::DARIJA, {"formation", "contenu", "niveau", "mezyana", "mzyana",
                                     "khayba", "top", "zina", "practique", "exemples"}},
        }},
        {ThemeCategory::TrainerCompetence, {
            {LanguageLabel::FR, {"formateur", "instructeur", "prof", "enseignant", "compétent",
                                 "incompétent", "préparé", "professionnel", "dynamique",
                                 "passionné", "engageant", "monotone", "maîtrise", "expert",
                                 "expérience", "pédagogique", "communication"}},
            {LanguageLabel::AR, {"مدرب", "المدرب", "معلم", "محترف", "مؤهل", "خبرة", "شرح",
                                 "يشرح", "تفسير", "مستعد", "جاهز"}},
            {LanguageLabel::DARIJA, {"formateur", "prof", "instructor", "maalem",
                                     "professionnel", "kamel", "ma3arafch", "khatar"}},
        }},
        {ThemeCategory::LogisticsOrganization, {
            {LanguageLabel::FR, {"logistique", "organisation", "organisé", "salle", "équipement",
                                 "matériel", "supports", "horaire", "temps", "durée", "pause",
                                 "accueil", "réservation", "planification", "coordination",
                                 "infrastructure"}},
            {LanguageLabel::AR, {"تنظيم", "قاعة", "القاعة", "مكان", "وقت", "الوقت", "ساعات",
                                 "مدة", "مرافق", "معدات", "صوت"}},
            {LanguageLabel::DARIJA, {"organisation", "qa3a", "blassa", "waqt", "lwaqt",
                                     "ma9an"}},
        }},
        {ThemeCategory::ApplicabilityUsefulness, {
            {LanguageLabel::FR, {"applicable", "applicabilité", "utile", "pratique", "concret",
                                 "réaliste", "pertinent", "efficace", "recommande", "valeur",
                                 "bénéfice", "impact", "résultat", "amélioration",
                                 "compétences", "apprises", "acquérir"}},
            {LanguageLabel::AR, {"تطبيق", "التطبيق", "عملي", "مفيد", "فائدة", "نتيجة", "تحسين",
                                 "مهارات", "استفدت", "استفادة", "واقعي"}},
            {LanguageLabel::DARIJA, {"practique", "fayda", "nafed", "ستفدت", "3jbni", "mazyan",
                                     "t3allemt", "استفدت"}},
        }},
    };
    return table;
}

double round_one_decimal(double value) {
    return std::round(value * 10.0) / 10.0;
}

} // anonymous namespace

std::string category_to_string(ThemeCategory category) {
    switch (category) {
        case ThemeCategory::FormationQuality: return "Formation Quality";
        case ThemeCategory::TrainerCompetence: return "Trainer Competence";
        case ThemeCategory::LogisticsOrganization: return "Logistics & Organization";
        case ThemeCategory::ApplicabilityUsefulness: return "Applicability & Usefulness";
        default: return "Formation Quality";
    }
}

// ============================================================================
// CategoryBreakdown
// ============================================================================

const CategoryStats& CategoryBreakdown::get(ThemeCategory category) const {
    for (const auto& stats : categories) {
        if (stats.category == category) {
            return stats;
        }
    }
    throw std::out_of_range("Category not present: " + category_to_string(category));
}

json CategoryBreakdown::to_json() const {
    json j = json::object();
    for (const auto& stats : categories) {
        json themes = json::array();
        for (const auto& theme : stats.themes) {
            themes.push_back({
                {"name", theme.name},
                {"frequency", theme.frequency},
                {"language", language_to_string(theme.language)}
            });
        }
        j[category_to_string(stats.category)] = {
            {"count", stats.count},
            {"total_frequency", stats.total_frequency},
            {"themes", themes},
            {"percentage", stats.percentage}
        };
    }
    return j;
}

// ============================================================================
// ThemeCategorizer
// ============================================================================

const std::vector<std::string>& ThemeCategorizer::keywords(ThemeCategory category,
                                                           LanguageLabel language) {
    const KeywordTable& table = category_keywords().at(category);
    auto it = table.find(language);
    if (it == table.end()) {
        return table.at(LanguageLabel::FR);
    }
    return it->second;
}

ThemeCategory ThemeCategorizer::categorize(const std::string& theme_name,
                                           LanguageLabel language) {
    std::string theme = to_lower_utf8(theme_name);

    for (ThemeCategory category : kThemeCategories) {
        for (const auto& keyword : keywords(category, language)) {
            if (theme.find(keyword) != std::string::npos ||
                keyword.find(theme) != std::string::npos) {
                return category;
            }
        }
    }
    return ThemeCategory::FormationQuality;
}

CategoryBreakdown ThemeCategorizer::categorize_themes(
    const std::vector<GlobalTheme>& themes
) const {
    CategoryBreakdown breakdown;
    for (ThemeCategory category : kThemeCategories) {
        CategoryStats stats;
        stats.category = category;
        breakdown.categories.push_back(stats);
    }

    for (const auto& theme : themes) {
        ThemeCategory category = categorize(theme.name, theme.language);
        CategoryStats& stats = breakdown.categories[static_cast<size_t>(category)];
        stats.count++;
        stats.total_frequency += theme.frequency;
        stats.themes.push_back({theme.name, theme.frequency, theme.language});
    }

    int64_t grand_total = 0;
    for (const auto& stats : breakdown.categories) {
        grand_total += stats.total_frequency;
    }

    for (auto& stats : breakdown.categories) {
        if (grand_total > 0) {
            stats.percentage = round_one_decimal(
                static_cast<double>(stats.total_frequency) / grand_total * 100.0);
        } else {
            stats.percentage = 0.0;
        }
    }

    return breakdown;
}

CategoryBreakdown ThemeCategorizer::get_categorized_themes(const RecordStore& store,
                                                           size_t top_n) const {
    return categorize_themes(store.top_themes(top_n));
}

} // namespace tfa
