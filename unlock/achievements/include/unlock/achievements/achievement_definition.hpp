#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace unlock::achievements {

// ============================================================================
// Achievement Category
// ============================================================================

enum class AchievementCategory : uint8_t {
    Exploration,    // Visiting sites
    Knowledge,      // Completing stories
    Mastery         // Quizzes and completion
};

const char* category_name(AchievementCategory category);
bool parse_category(const std::string& name, AchievementCategory& out);

// ============================================================================
// Achievement Requirement
// ============================================================================

enum class Counter : uint8_t {
    FullyCompletedSites,    // Discovery key plus every knowledge key of the site
    ScholarBadges,
    CorrectQuizzes
};

// Simple threshold against a counter
struct CountRequirement {
    Counter counter = Counter::FullyCompletedSites;
    int target = 1;
};

// Every site in the catalog fully completed
struct AllSitesRequirement {};

// Every site of at least one city fully completed
struct CityCompleteRequirement {};

// Every site of at least one era fully completed
struct EraCompleteRequirement {};

// 100% completion of the catalog
struct FullCompletionRequirement {};

using AchievementRequirement = std::variant<
    CountRequirement,
    AllSitesRequirement,
    CityCompleteRequirement,
    EraCompleteRequirement,
    FullCompletionRequirement
>;

// ============================================================================
// Achievement Definition
// ============================================================================

struct AchievementDefinition {
    std::string achievement_id;     // Stable across releases; persisted
    std::string display_name;
    std::string description;
    std::string icon;

    AchievementCategory category = AchievementCategory::Exploration;
    AchievementRequirement requirement = CountRequirement{};
    int reward_points = 0;

    int display_order = 0;

    std::string unlocked_description() const { return "You've unlocked: " + display_name + "!"; }
};

// ============================================================================
// Achievement Catalog
// ============================================================================

class AchievementCatalog {
public:
    AchievementCatalog() = default;

    // Returns false (and keeps the existing entry) for a duplicate id
    bool add(AchievementDefinition def);

    const AchievementDefinition* get(const std::string& achievement_id) const;
    bool exists(const std::string& achievement_id) const;

    // Ordered by display_order, then registration order
    const std::vector<AchievementDefinition>& all() const { return m_achievements; }
    std::vector<const AchievementDefinition*> by_category(AchievementCategory category) const;

    size_t size() const { return m_achievements.size(); }
    int total_reward_points() const;

    void clear();

    // Add definitions from JSON:
    // { "achievements": [ { "id", "name", "description", "icon", "category",
    //   "points", "order", "requirement": { "kind": "count", "counter", "target" }
    //                                   | { "kind": "all_sites" | "city" | "era" | "full" } } ] }
    // Returns the number added; malformed entries are logged and skipped.
    int load_from_string(const std::string& text);
    int load_from_file(const std::string& path);

private:
    std::vector<AchievementDefinition> m_achievements;
    std::unordered_map<std::string, size_t> m_index;
};

// The catalog shipped with the app
AchievementCatalog default_catalog();

// ============================================================================
// Achievement Builder
// ============================================================================

class AchievementBuilder {
public:
    AchievementBuilder& id(const std::string& achievement_id);
    AchievementBuilder& name(const std::string& display_name);
    AchievementBuilder& description(const std::string& desc);
    AchievementBuilder& icon(const std::string& icon_name);
    AchievementBuilder& category(AchievementCategory cat);
    AchievementBuilder& count(Counter counter, int target);
    AchievementBuilder& requires_all_sites();
    AchievementBuilder& requires_city_complete();
    AchievementBuilder& requires_era_complete();
    AchievementBuilder& requires_full_completion();
    AchievementBuilder& points(int pts);
    AchievementBuilder& order(int display_order);

    AchievementDefinition build() const;
    bool add_to(AchievementCatalog& catalog) const;

private:
    AchievementDefinition m_def;
};

inline AchievementBuilder achievement() { return AchievementBuilder{}; }

} // namespace unlock::achievements
