#pragma once

#include <unlock/badges/badge_policy.hpp>
#include <unlock/badges/visit_result.hpp>
#include <unlock/achievements/achievement_engine.hpp>
#include <unlock/content/content_provider.hpp>
#include <unlock/location/location_port.hpp>
#include <unlock/progress/progress_store.hpp>
#include <unlock/core/clock.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace unlock::badges {

// Outcome of the simple awards (scholar, quiz, discovery)
struct AwardResult {
    bool awarded = false;
    int points_awarded = 0;
    int achievement_points = 0;
    std::vector<std::string> unlocked_achievements;
};

// ============================================================================
// Badge Engine
// ============================================================================
//
// Applies the badge rules. Each public operation is one ProgressStore
// transaction covering the badge change, its points and the achievement
// re-evaluation it triggers. Domain outcomes are returned, never thrown.

class BadgeEngine {
public:
    BadgeEngine(progress::ProgressStore& store,
                achievements::AchievementEngine& achievements,
                const content::IContentProvider& content,
                const core::IClock& clock,
                BadgePolicy policy = {});

    // Cancels outstanding position requests and waits for a verification
    // already running on a location thread
    ~BadgeEngine();

    BadgeEngine(const BadgeEngine&) = delete;
    BadgeEngine& operator=(const BadgeEngine&) = delete;

    // Knowledge key; idempotent
    AwardResult award_scholar_badge(const std::string& sub_location_id);

    // Discovery key from an on-site position
    VisitResult verify_visit(const content::Site& site, const std::optional<location::Position>& position);
    VisitResult verify_visit(const std::string& site_id, const std::optional<location::Position>& position);

    // Discovery key on the user's word
    VisitResult self_report_visit(const std::string& site_id);

    // Rewarded once per cooldown window
    AwardResult discover_place(const std::string& place_id);

    // Idempotent per quiz
    AwardResult record_correct_quiz(const std::string& quiz_id);

    // Checks the cooldown first, then asks `port` for a position and verifies
    // against it. `on_result` runs once on the thread that resolved the
    // position (or inline for an immediate outcome), and never after this
    // engine is destroyed. The returned request is null when no position
    // was needed.
    using VisitCallback = std::function<void(const VisitResult&)>;
    std::shared_ptr<location::PositionRequest> request_and_verify(
        const std::string& site_id, location::ILocationPort& port,
        std::chrono::milliseconds timeout, VisitCallback on_result);

    // Blocked result if `site_id` is fully verified and inside the cooldown
    std::optional<VisitResult> check_cooldown(const std::string& site_id) const;

    const BadgePolicy& policy() const { return m_policy; }

    // Requests handed out by request_and_verify that are still unresolved
    size_t pending_requests() const;

private:
    // Shared with position callbacks; cleared when the engine goes away
    struct Lifetime {
        std::mutex mutex;
        bool alive = true;
    };

    VisitResult blocked_result(int days) const;
    VisitResult unknown_site_result() const;
    void finish(VisitResult& result);
    AwardResult finish(AwardResult result);

    progress::ProgressStore& m_store;
    achievements::AchievementEngine& m_achievements;
    const content::IContentProvider& m_content;
    const core::IClock& m_clock;
    BadgePolicy m_policy;

    std::shared_ptr<Lifetime> m_lifetime = std::make_shared<Lifetime>();
    mutable std::mutex m_requests_mutex;
    std::vector<std::weak_ptr<location::PositionRequest>> m_requests;
};

} // namespace unlock::badges
