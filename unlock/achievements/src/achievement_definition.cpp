#include <unlock/achievements/achievement_definition.hpp>
#include <unlock/core/log.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <sstream>
#include <nlohmann/json.hpp>

namespace unlock::achievements {

using json = nlohmann::json;

// ============================================================================
// Names
// ============================================================================

const char* category_name(AchievementCategory category) {
    switch (category) {
        case AchievementCategory::Exploration: return "Exploration";
        case AchievementCategory::Knowledge:   return "Knowledge";
        case AchievementCategory::Mastery:     return "Mastery";
        default:                               return "Unknown";
    }
}

bool parse_category(const std::string& name, AchievementCategory& out) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "exploration") { out = AchievementCategory::Exploration; return true; }
    if (lower == "knowledge")   { out = AchievementCategory::Knowledge; return true; }
    if (lower == "mastery")     { out = AchievementCategory::Mastery; return true; }
    return false;
}

// ============================================================================
// JSON Deserialization
// ============================================================================

namespace {

bool parse_counter(const std::string& name, Counter& out) {
    if (name == "fullyCompletedSites") { out = Counter::FullyCompletedSites; return true; }
    if (name == "scholarBadges")       { out = Counter::ScholarBadges; return true; }
    if (name == "correctQuizzes")      { out = Counter::CorrectQuizzes; return true; }
    return false;
}

std::optional<AchievementRequirement> parse_requirement(const json& j, std::string& error) {
    std::string kind = j.value("kind", "count");

    if (kind == "count") {
        CountRequirement req;
        if (!parse_counter(j.value("counter", "fullyCompletedSites"), req.counter)) {
            error = "unknown counter";
            return std::nullopt;
        }
        req.target = j.value("target", 1);
        if (req.target <= 0) {
            error = "count target must be positive";
            return std::nullopt;
        }
        return req;
    }
    if (kind == "all_sites") return AllSitesRequirement{};
    if (kind == "city")      return CityCompleteRequirement{};
    if (kind == "era")       return EraCompleteRequirement{};
    if (kind == "full")      return FullCompletionRequirement{};

    error = "unknown requirement kind '" + kind + "'";
    return std::nullopt;
}

std::optional<AchievementDefinition> deserialize_achievement(const json& j, std::string& error) {
    if (!j.is_object() || !j.contains("id") || !j["id"].is_string()) {
        error = "missing string 'id'";
        return std::nullopt;
    }

    AchievementDefinition def;
    def.achievement_id = j["id"].get<std::string>();
    def.display_name = j.value("name", def.achievement_id);
    def.description = j.value("description", "");
    def.icon = j.value("icon", "");
    def.reward_points = j.value("points", 0);
    def.display_order = j.value("order", 0);

    if (def.reward_points < 0) {
        error = "points must not be negative";
        return std::nullopt;
    }

    if (j.contains("category") && !parse_category(j["category"].get<std::string>(), def.category)) {
        error = "unknown category";
        return std::nullopt;
    }

    if (j.contains("requirement")) {
        auto req = parse_requirement(j["requirement"], error);
        if (!req) {
            return std::nullopt;
        }
        def.requirement = *req;
    }

    return def;
}

} // anonymous namespace

// ============================================================================
// AchievementCatalog
// ============================================================================

bool AchievementCatalog::add(AchievementDefinition def) {
    if (def.achievement_id.empty()) {
        core::log_error("achievements", "Cannot register achievement with empty ID");
        return false;
    }

    if (m_index.contains(def.achievement_id)) {
        core::log_warning("achievements", "Duplicate achievement ignored: {}", def.achievement_id);
        return false;
    }

    // Rewards only ever add to the point total
    if (def.reward_points < 0) {
        core::log_error("achievements", "Achievement '{}' has negative reward {}", def.achievement_id, def.reward_points);
        return false;
    }

    auto pos = std::upper_bound(m_achievements.begin(), m_achievements.end(), def.display_order,
        [](int order, const AchievementDefinition& a) { return order < a.display_order; });
    m_achievements.insert(pos, std::move(def));

    m_index.clear();
    for (size_t i = 0; i < m_achievements.size(); ++i) {
        m_index[m_achievements[i].achievement_id] = i;
    }
    return true;
}

const AchievementDefinition* AchievementCatalog::get(const std::string& achievement_id) const {
    auto it = m_index.find(achievement_id);
    if (it != m_index.end()) {
        return &m_achievements[it->second];
    }
    return nullptr;
}

bool AchievementCatalog::exists(const std::string& achievement_id) const {
    return m_index.contains(achievement_id);
}

std::vector<const AchievementDefinition*> AchievementCatalog::by_category(AchievementCategory category) const {
    std::vector<const AchievementDefinition*> result;
    for (const auto& def : m_achievements) {
        if (def.category == category) {
            result.push_back(&def);
        }
    }
    return result;
}

int AchievementCatalog::total_reward_points() const {
    int total = 0;
    for (const auto& def : m_achievements) {
        total += def.reward_points;
    }
    return total;
}

void AchievementCatalog::clear() {
    m_achievements.clear();
    m_index.clear();
}

int AchievementCatalog::load_from_string(const std::string& text) {
    int added = 0;
    try {
        json j = json::parse(text);
        for (const auto& entry : j.at("achievements")) {
            std::string error;
            auto def = deserialize_achievement(entry, error);
            if (!def) {
                core::log_warning("achievements", "Skipping achievement: {}", error);
                continue;
            }
            if (add(std::move(*def))) {
                ++added;
            }
        }
    } catch (const std::exception& e) {
        core::log_error("achievements", "Failed to parse achievements: {}", e.what());
    }
    return added;
}

int AchievementCatalog::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        core::log_warning("achievements", "Could not open achievements file: {}", path);
        return 0;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    int added = load_from_string(buffer.str());
    core::log_info("achievements", "Loaded {} achievements from: {}", added, path);
    return added;
}

// ============================================================================
// Default Catalog
// ============================================================================

AchievementCatalog default_catalog() {
    AchievementCatalog catalog;
    int order = 0;

    // Exploration
    achievement().id("first_discovery").name("First Discovery").description("Unlock your first site")
        .icon("key.fill").category(AchievementCategory::Exploration)
        .count(Counter::FullyCompletedSites, 1).points(10).order(order++).add_to(catalog);
    achievement().id("curious_traveler").name("Curious Traveler").description("Unlock 3 sites")
        .icon("map.fill").category(AchievementCategory::Exploration)
        .count(Counter::FullyCompletedSites, 3).points(25).order(order++).add_to(catalog);
    achievement().id("dedicated_explorer").name("Dedicated Explorer").description("Unlock 5 sites")
        .icon("safari.fill").category(AchievementCategory::Exploration)
        .count(Counter::FullyCompletedSites, 5).points(50).order(order++).add_to(catalog);
    achievement().id("master_explorer").name("Master Explorer").description("Unlock all sites")
        .icon("globe.americas.fill").category(AchievementCategory::Exploration)
        .requires_all_sites().points(100).order(order++).add_to(catalog);

    // Knowledge
    achievement().id("first_secret").name("First Secret").description("Unlock your first Knowledge Key")
        .icon("book.fill").category(AchievementCategory::Knowledge)
        .count(Counter::ScholarBadges, 1).points(10).order(order++).add_to(catalog);
    achievement().id("eager_learner").name("Eager Learner").description("Earn 5 Knowledge Keys")
        .icon("books.vertical.fill").category(AchievementCategory::Knowledge)
        .count(Counter::ScholarBadges, 5).points(25).order(order++).add_to(catalog);
    achievement().id("knowledge_seeker").name("Knowledge Seeker").description("Earn 10 Knowledge Keys")
        .icon("text.book.closed.fill").category(AchievementCategory::Knowledge)
        .count(Counter::ScholarBadges, 10).points(50).order(order++).add_to(catalog);

    // Mastery
    achievement().id("quiz_starter").name("Quiz Starter").description("Answer your first quiz correctly")
        .icon("questionmark.circle.fill").category(AchievementCategory::Mastery)
        .count(Counter::CorrectQuizzes, 1).points(10).order(order++).add_to(catalog);
    achievement().id("quiz_apprentice").name("Quiz Apprentice").description("Answer 5 quizzes correctly")
        .icon("brain.head.profile").category(AchievementCategory::Mastery)
        .count(Counter::CorrectQuizzes, 5).points(25).order(order++).add_to(catalog);
    achievement().id("quiz_master").name("Quiz Master").description("Answer 10 quizzes correctly")
        .icon("graduationcap.fill").category(AchievementCategory::Mastery)
        .count(Counter::CorrectQuizzes, 10).points(50).order(order++).add_to(catalog);
    achievement().id("city_champion").name("City Champion").description("Fully unlock all sites in one city")
        .icon("building.2.fill").category(AchievementCategory::Mastery)
        .requires_city_complete().points(75).order(order++).add_to(catalog);
    achievement().id("era_expert").name("Era Expert").description("Unlock all sites from one historical period")
        .icon("clock.fill").category(AchievementCategory::Mastery)
        .requires_era_complete().points(75).order(order++).add_to(catalog);
    achievement().id("true_pharaoh").name("True Pharaoh").description("Achieve 100% completion")
        .icon("crown.fill").category(AchievementCategory::Mastery)
        .requires_full_completion().points(200).order(order++).add_to(catalog);

    return catalog;
}

// ============================================================================
// AchievementBuilder
// ============================================================================

AchievementBuilder& AchievementBuilder::id(const std::string& achievement_id) {
    m_def.achievement_id = achievement_id;
    return *this;
}

AchievementBuilder& AchievementBuilder::name(const std::string& display_name) {
    m_def.display_name = display_name;
    return *this;
}

AchievementBuilder& AchievementBuilder::description(const std::string& desc) {
    m_def.description = desc;
    return *this;
}

AchievementBuilder& AchievementBuilder::icon(const std::string& icon_name) {
    m_def.icon = icon_name;
    return *this;
}

AchievementBuilder& AchievementBuilder::category(AchievementCategory cat) {
    m_def.category = cat;
    return *this;
}

AchievementBuilder& AchievementBuilder::count(Counter counter, int target) {
    m_def.requirement = CountRequirement{counter, target};
    return *this;
}

AchievementBuilder& AchievementBuilder::requires_all_sites() {
    m_def.requirement = AllSitesRequirement{};
    return *this;
}

AchievementBuilder& AchievementBuilder::requires_city_complete() {
    m_def.requirement = CityCompleteRequirement{};
    return *this;
}

AchievementBuilder& AchievementBuilder::requires_era_complete() {
    m_def.requirement = EraCompleteRequirement{};
    return *this;
}

AchievementBuilder& AchievementBuilder::requires_full_completion() {
    m_def.requirement = FullCompletionRequirement{};
    return *this;
}

AchievementBuilder& AchievementBuilder::points(int pts) {
    m_def.reward_points = pts;
    return *this;
}

AchievementBuilder& AchievementBuilder::order(int display_order) {
    m_def.display_order = display_order;
    return *this;
}

AchievementDefinition AchievementBuilder::build() const {
    return m_def;
}

bool AchievementBuilder::add_to(AchievementCatalog& catalog) const {
    return catalog.add(m_def);
}

} // namespace unlock::achievements
