#pragma once

#include "core/records.hpp"
#include "storage/record_store.hpp"
#include <nlohmann/json.hpp>
#include <array>
#include <string>
#include <vector>

namespace tfa {

/**
 * @brief The four fixed theme buckets, in matching order
 */
enum class ThemeCategory {
    FormationQuality,
    TrainerCompetence,
    LogisticsOrganization,
    ApplicabilityUsefulness
};

constexpr std::array<ThemeCategory, 4> kThemeCategories = {
    ThemeCategory::FormationQuality,
    ThemeCategory::TrainerCompetence,
    ThemeCategory::LogisticsOrganization,
    ThemeCategory::ApplicabilityUsefulness
};

std::string category_to_string(ThemeCategory category);

struct CategorizedTheme {
    std::string name;
    int64_t frequency = 0;
    LanguageLabel language = LanguageLabel::FR;
};

/**
 * @brief Aggregate of the themes that fell into one category
 */
struct CategoryStats {
    ThemeCategory category = ThemeCategory::FormationQuality;
    size_t count = 0;
    int64_t total_frequency = 0;
    std::vector<CategorizedTheme> themes;
    double percentage = 0.0;                ///< Share of all frequency, 1 decimal
};

/**
 * @brief Categorization result, one entry per category in fixed order
 */
struct CategoryBreakdown {
    std::vector<CategoryStats> categories;

    const CategoryStats& get(ThemeCategory category) const;
    nlohmann::json to_json() const;
};

/**
 * @brief Maps theme names onto the four categories by keyword lists
 */
class ThemeCategorizer {
public:
    ThemeCategorizer() = default;

    /**
     * @brief First category whose keyword list matches the theme
     *
     * A keyword matches when it contains the lower-cased theme or the theme
     * contains it. Unmatched themes go to FormationQuality.
     */
    static ThemeCategory categorize(const std::string& theme_name, LanguageLabel language);

    static const std::vector<std::string>& keywords(ThemeCategory category,
                                                    LanguageLabel language);

    CategoryBreakdown categorize_themes(const std::vector<GlobalTheme>& themes) const;

    /**
     * @brief Categorize the top_n most frequent themes of the store
     */
    CategoryBreakdown get_categorized_themes(const RecordStore& store,
                                             size_t top_n = 50) const;
};

} // namespace tfa
