#pragma once

#include <unlock/achievements/achievement_definition.hpp>
#include <unlock/content/content_provider.hpp>
#include <unlock/progress/progress_store.hpp>
#include <unlock/core/clock.hpp>
#include <unlock/core/event_dispatcher.hpp>
#include <unlock/core/memoized.hpp>
#include <atomic>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace unlock::achievements {

// ============================================================================
// Achievement Progress
// ============================================================================

struct AchievementProgress {
    int current = 0;
    int required = 1;

    bool is_complete() const { return current >= required; }
    float fraction() const;
};

// ============================================================================
// Achievement Notification
// ============================================================================

struct AchievementNotification {
    std::string achievement_id;
    std::string display_name;
    std::string message;            // "You've unlocked: <name>!"
    std::string icon;
    int points = 0;
    core::Timestamp timestamp{};
};

// ============================================================================
// Site Completion
// ============================================================================

// Discovery key plus a knowledge key for every sub-location
bool is_site_fully_completed(const progress::ProgressState& state, const content::Site& site);
int count_fully_completed(const progress::ProgressState& state, const std::vector<content::Site>& sites);

// True if every site sharing some city (or era) value is fully completed
bool any_city_complete(const progress::ProgressState& state, const std::vector<content::Site>& sites);
bool any_era_complete(const progress::ProgressState& state, const std::vector<content::Site>& sites);

AchievementProgress evaluate_requirement(const AchievementRequirement& requirement,
                                         const progress::ProgressState& state,
                                         const std::vector<content::Site>& sites);

// ============================================================================
// Achievement Engine
// ============================================================================
//
// Derives achievement unlocks from the progress state. Unlocks are written
// into the state inside the caller's transaction (evaluate_in), so the badge
// and the achievement reward it triggers commit together. announce() then
// queues notifications and fires the unlock hooks once the transaction has
// committed.

class AchievementEngine {
public:
    AchievementEngine(progress::ProgressStore& store,
                      const AchievementCatalog& catalog,
                      const content::IContentProvider& content,
                      const core::IClock& clock,
                      core::EventDispatcher* events = nullptr);

    AchievementEngine(const AchievementEngine&) = delete;
    AchievementEngine& operator=(const AchievementEngine&) = delete;

    // ========================================================================
    // Evaluation
    // ========================================================================

    // Unlock every locked achievement whose requirement is met, crediting its
    // reward into `state`. Must run inside ProgressStore::transact.
    // Returns the newly unlocked ids in catalog order.
    std::vector<std::string> evaluate_in(progress::ProgressState& state, core::Timestamp now) const;

    // Notify about unlocks that have been committed
    void announce(const std::vector<std::string>& unlocked_ids);

    // evaluate_in in its own transaction, then announce
    std::vector<std::string> evaluate();

    // ========================================================================
    // Queries
    // ========================================================================

    AchievementProgress progress(const std::string& achievement_id) const;
    float progress_percent(const std::string& achievement_id) const;
    bool is_unlocked(const std::string& achievement_id) const;
    std::optional<core::Timestamp> unlock_date(const std::string& achievement_id) const;

    std::vector<std::string> unlocked_ids() const;
    std::vector<std::string> locked_ids() const;
    int unlocked_count() const;
    int total_count() const { return static_cast<int>(m_catalog.size()); }
    std::vector<std::string> by_category(AchievementCategory category) const;
    int unlocked_in_category(AchievementCategory category) const;
    int earned_reward_points() const;

    // Cached against the store generation
    int fully_completed_sites_count() const;

    // Locked achievement closest to completion; ties go to display order
    std::optional<std::string> next_achievement() const;

    // Drop cached values computed against an older site catalog
    void invalidate_cache();

    const AchievementCatalog& catalog() const { return m_catalog; }

    // ========================================================================
    // Notifications
    // ========================================================================

    std::optional<AchievementNotification> current_notification() const;
    void dismiss_notification();
    bool has_pending_notification() const;
    size_t pending_notification_count() const;
    void clear_notifications();

    // ========================================================================
    // Callbacks
    // ========================================================================

    using UnlockCallback = std::function<void(const AchievementDefinition&)>;
    void set_on_unlock(UnlockCallback callback);

private:
    void sync_content_revision() const;

    progress::ProgressStore& m_store;
    const AchievementCatalog& m_catalog;
    const content::IContentProvider& m_content;
    const core::IClock& m_clock;
    core::EventDispatcher* m_events;

    mutable core::Memoized<int> m_completed_cache;
    mutable core::Memoized<std::optional<std::string>> m_next_cache;
    mutable std::atomic<uint64_t> m_content_revision;

    mutable std::mutex m_notify_mutex;
    std::deque<AchievementNotification> m_notifications;
    UnlockCallback m_on_unlock;
};

} // namespace unlock::achievements
