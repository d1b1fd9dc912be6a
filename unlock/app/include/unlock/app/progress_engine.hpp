#pragma once

#include <unlock/achievements/achievements.hpp>
#include <unlock/badges/badge_engine.hpp>
#include <unlock/config/engine_config.hpp>
#include <unlock/content/content_provider.hpp>
#include <unlock/progress/progress_store.hpp>
#include <unlock/rank/rank.hpp>
#include <unlock/core/clock.hpp>
#include <unlock/core/event_dispatcher.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace unlock::app {

// ============================================================================
// Progress Engine
// ============================================================================
//
// Composition root: owns the dispatcher, the store and both engines, wired
// against the caller's storage, site catalog and clock. The collaborators
// passed in must outlive the engine.

class ProgressEngine {
public:
    ProgressEngine(progress::IKeyValueStore& storage,
                   const content::IContentProvider& content,
                   const core::IClock& clock,
                   config::EngineConfig config = {},
                   achievements::AchievementCatalog catalog = achievements::default_catalog());

    ProgressEngine(const ProgressEngine&) = delete;
    ProgressEngine& operator=(const ProgressEngine&) = delete;

    // Load saved progress and catch up on achievements it already satisfies
    bool load();

    // ========================================================================
    // Components
    // ========================================================================

    badges::BadgeEngine& badges() { return m_badges; }
    achievements::AchievementEngine& achievements() { return m_achievements; }
    const achievements::AchievementEngine& achievements() const { return m_achievements; }
    progress::ProgressStore& store() { return m_store; }
    const progress::ProgressStore& store() const { return m_store; }
    core::EventDispatcher& events() { return m_events; }
    const config::EngineConfig& config() const { return m_config; }

    // ========================================================================
    // Points & rank
    // ========================================================================

    int total_points() const;
    rank::Rank current_rank() const;
    std::optional<int> points_to_next_rank() const;
    float rank_progress() const;

    // ========================================================================
    // Badges
    // ========================================================================

    bool has_scholar_badge(const std::string& sub_location_id) const;
    bool has_explorer_badge(const std::string& site_id) const;
    bool is_self_reported(const std::string& site_id) const;

    int scholar_badge_count() const;
    int explorer_badge_count() const;
    int completed_quiz_count() const;
    int fully_completed_site_count() const;

    // ========================================================================
    // Achievements
    // ========================================================================

    std::vector<std::string> unlocked_achievements() const;
    std::vector<std::string> locked_achievements() const;
    std::optional<std::string> next_achievement() const;

    std::optional<achievements::AchievementNotification> current_notification() const;
    void dismiss_notification();

    // ========================================================================
    // Favorites
    // ========================================================================

    bool toggle_favorite(const std::string& site_id);
    bool is_favorite(const std::string& site_id) const;
    std::set<std::string> favorite_sites() const;

    // Clear all progress, pending notifications and caches
    void reset_progress();

private:
    config::EngineConfig m_config;
    core::EventDispatcher m_events;
    achievements::AchievementCatalog m_catalog;
    progress::ProgressStore m_store;
    achievements::AchievementEngine m_achievements;
    badges::BadgeEngine m_badges;
};

} // namespace unlock::app
