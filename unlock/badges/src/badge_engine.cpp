#include <unlock/badges/badge_engine.hpp>
#include <unlock/core/geo.hpp>
#include <unlock/core/log.hpp>
#include <algorithm>
#include <format>

namespace unlock::badges {

using progress::ProgressState;

const char* visit_outcome_name(VisitOutcome outcome) {
    switch (outcome) {
        case VisitOutcome::Verified:            return "Verified";
        case VisitOutcome::Upgraded:            return "Upgraded";
        case VisitOutcome::SelfReported:        return "SelfReported";
        case VisitOutcome::AlreadySelfReported: return "AlreadySelfReported";
        case VisitOutcome::Blocked:             return "Blocked";
        case VisitOutcome::NoLocation:          return "NoLocation";
        case VisitOutcome::TooFar:              return "TooFar";
        case VisitOutcome::UnknownSite:         return "UnknownSite";
        default:                                return "Unknown";
    }
}

BadgeEngine::BadgeEngine(progress::ProgressStore& store,
                         achievements::AchievementEngine& achievements,
                         const content::IContentProvider& content,
                         const core::IClock& clock,
                         BadgePolicy policy)
    : m_store(store)
    , m_achievements(achievements)
    , m_content(content)
    , m_clock(clock)
    , m_policy(policy) {}

BadgeEngine::~BadgeEngine() {
    std::vector<std::weak_ptr<location::PositionRequest>> requests;
    {
        std::lock_guard<std::mutex> lock(m_requests_mutex);
        requests.swap(m_requests);
    }
    for (auto& weak : requests) {
        if (auto request = weak.lock()) {
            request->cancel();
        }
    }

    // Blocks until a callback that already won its request has finished
    std::lock_guard<std::mutex> lock(m_lifetime->mutex);
    m_lifetime->alive = false;
}

// ============================================================================
// Knowledge, quizzes, discoveries
// ============================================================================

AwardResult BadgeEngine::award_scholar_badge(const std::string& sub_location_id) {
    auto now = m_clock.now();
    return finish(m_store.transact([&](ProgressState& s) {
        AwardResult result;
        if (!s.scholar_badges.insert(sub_location_id).second) {
            return result;
        }
        s.total_points += m_policy.scholar_points;
        result.awarded = true;
        result.points_awarded = m_policy.scholar_points;
        result.unlocked_achievements = m_achievements.evaluate_in(s, now);
        return result;
    }));
}

AwardResult BadgeEngine::record_correct_quiz(const std::string& quiz_id) {
    auto now = m_clock.now();
    return finish(m_store.transact([&](ProgressState& s) {
        AwardResult result;
        if (!s.completed_quizzes.insert(quiz_id).second) {
            return result;
        }
        s.total_points += m_policy.quiz_points;
        result.awarded = true;
        result.points_awarded = m_policy.quiz_points;
        result.unlocked_achievements = m_achievements.evaluate_in(s, now);
        return result;
    }));
}

AwardResult BadgeEngine::discover_place(const std::string& place_id) {
    auto now = m_clock.now();
    return finish(m_store.transact([&](ProgressState& s) {
        AwardResult result;
        auto it = s.discovered_places.find(place_id);
        if (it != s.discovered_places.end() &&
            core::days_remaining(it->second, m_policy.discovery_cooldown, now) > 0) {
            return result;
        }
        s.discovered_places[place_id] = now;
        s.total_points += m_policy.discovery_points;
        result.awarded = true;
        result.points_awarded = m_policy.discovery_points;
        result.unlocked_achievements = m_achievements.evaluate_in(s, now);
        return result;
    }));
}

// ============================================================================
// Discovery keys
// ============================================================================

VisitResult BadgeEngine::verify_visit(const content::Site& site,
                                      const std::optional<location::Position>& position) {
    auto now = m_clock.now();
    VisitResult result = m_store.transact([&](ProgressState& s) {
        if (s.is_fully_verified(site.id)) {
            auto last = s.verified_visits.find(site.id);
            if (last != s.verified_visits.end()) {
                int days = core::days_remaining(last->second, m_policy.visit_cooldown, now);
                if (days > 0) {
                    return blocked_result(days);
                }
            }
        }

        VisitResult r;
        if (!position) {
            r.outcome = VisitOutcome::NoLocation;
            r.message = "Could not determine your location. You can self-report your visit instead.";
            return r;
        }

        double distance_m = core::distance_meters(position->coordinate, site.coordinate);
        if (distance_m > m_policy.verification_radius_m) {
            r.outcome = VisitOutcome::TooFar;
            r.distance_km = distance_m / 1000.0;
            r.message = std::format("You're {:.1f} km away from {}. Get closer to verify your visit.",
                                    r.distance_km, site.name.empty() ? site.id : site.name);
            return r;
        }

        s.verified_visits[site.id] = now;
        if (s.self_reported_sites.erase(site.id) > 0) {
            s.total_points += m_policy.upgrade_points;
            r.outcome = VisitOutcome::Upgraded;
            r.points_awarded = m_policy.upgrade_points;
            r.message = std::format("Visit verified! Your discovery key is upgraded. +{} points", r.points_awarded);
        } else {
            s.explorer_badges.insert(site.id);
            s.total_points += m_policy.verified_visit_points;
            r.outcome = VisitOutcome::Verified;
            r.points_awarded = m_policy.verified_visit_points;
            r.message = std::format("Discovery key unlocked! +{} points", r.points_awarded);
        }

        r.unlocked_achievements = m_achievements.evaluate_in(s, now);
        return r;
    });

    if (result.is_success()) {
        core::log_info("badges", "Visit to '{}' {} (+{} points)",
                       site.id, visit_outcome_name(result.outcome), result.points_awarded);
    }
    finish(result);
    return result;
}

VisitResult BadgeEngine::verify_visit(const std::string& site_id,
                                      const std::optional<location::Position>& position) {
    auto site = m_content.find_site(site_id);
    if (!site) {
        core::log_warning("badges", "Verify requested for unknown site '{}'", site_id);
        return unknown_site_result();
    }
    return verify_visit(*site, position);
}

VisitResult BadgeEngine::self_report_visit(const std::string& site_id) {
    if (!m_content.find_site(site_id)) {
        core::log_warning("badges", "Self-report for unknown site '{}'", site_id);
        return unknown_site_result();
    }

    auto now = m_clock.now();
    VisitResult result = m_store.transact([&](ProgressState& s) {
        VisitResult r;
        if (s.has_explorer_badge(site_id) && s.is_self_reported(site_id)) {
            r.outcome = VisitOutcome::AlreadySelfReported;
            r.message = "Already self-reported. Verify on site to upgrade your discovery key.";
            return r;
        }

        if (s.is_fully_verified(site_id)) {
            auto last = s.verified_visits.find(site_id);
            if (last != s.verified_visits.end()) {
                int days = core::days_remaining(last->second, m_policy.visit_cooldown, now);
                if (days > 0) {
                    return blocked_result(days);
                }
            }
        }

        s.explorer_badges.insert(site_id);
        s.self_reported_sites.insert(site_id);
        s.verified_visits[site_id] = now;
        s.total_points += m_policy.self_report_points;

        r.outcome = VisitOutcome::SelfReported;
        r.points_awarded = m_policy.self_report_points;
        r.message = std::format("Visit recorded! +{} points. Verify on site for +{} more.",
                                r.points_awarded, m_policy.upgrade_points);
        r.unlocked_achievements = m_achievements.evaluate_in(s, now);
        return r;
    });

    if (result.is_success()) {
        core::log_info("badges", "Self-reported visit to '{}' (+{} points)", site_id, result.points_awarded);
    }
    finish(result);
    return result;
}

std::optional<VisitResult> BadgeEngine::check_cooldown(const std::string& site_id) const {
    auto now = m_clock.now();
    return m_store.read([&](const ProgressState& s) -> std::optional<VisitResult> {
        if (!s.is_fully_verified(site_id)) {
            return std::nullopt;
        }
        auto last = s.verified_visits.find(site_id);
        if (last == s.verified_visits.end()) {
            return std::nullopt;
        }
        int days = core::days_remaining(last->second, m_policy.visit_cooldown, now);
        if (days <= 0) {
            return std::nullopt;
        }
        return blocked_result(days);
    });
}

std::shared_ptr<location::PositionRequest> BadgeEngine::request_and_verify(
    const std::string& site_id, location::ILocationPort& port,
    std::chrono::milliseconds timeout, VisitCallback on_result) {

    auto site = m_content.find_site(site_id);
    if (!site) {
        if (on_result) {
            on_result(verify_visit(site_id, std::nullopt));
        }
        return nullptr;
    }

    // No point waiting for a fix the cooldown would discard
    if (auto blocked = check_cooldown(site_id)) {
        if (on_result) {
            on_result(*blocked);
        }
        return nullptr;
    }

    std::weak_ptr<Lifetime> lifetime = m_lifetime;
    auto request = port.request_position(timeout,
        [this, lifetime, site = std::move(*site), on_result = std::move(on_result)](const std::optional<location::Position>& position) {
            auto owner = lifetime.lock();
            if (!owner) {
                return;
            }
            std::lock_guard<std::mutex> lock(owner->mutex);
            if (!owner->alive) {
                return;
            }
            VisitResult result = verify_visit(site, position);
            if (on_result) {
                on_result(result);
            }
        });

    if (request && !request->ready()) {
        std::lock_guard<std::mutex> lock(m_requests_mutex);
        std::erase_if(m_requests, [](const auto& weak) {
            auto pending = weak.lock();
            return !pending || pending->ready();
        });
        m_requests.push_back(request);
    }
    return request;
}

size_t BadgeEngine::pending_requests() const {
    std::lock_guard<std::mutex> lock(m_requests_mutex);
    return static_cast<size_t>(std::count_if(m_requests.begin(), m_requests.end(), [](const auto& weak) {
        auto request = weak.lock();
        return request && !request->ready();
    }));
}

// ============================================================================
// Helpers
// ============================================================================

VisitResult BadgeEngine::blocked_result(int days) const {
    VisitResult r;
    r.outcome = VisitOutcome::Blocked;
    r.days_remaining = days;
    r.message = std::format("You've already verified this site. Visit again in {} day{} to earn more points.",
                            days, days == 1 ? "" : "s");
    return r;
}

VisitResult BadgeEngine::unknown_site_result() const {
    VisitResult r;
    r.outcome = VisitOutcome::UnknownSite;
    r.message = "This site is not in the catalog.";
    return r;
}

void BadgeEngine::finish(VisitResult& result) {
    for (const auto& id : result.unlocked_achievements) {
        if (const auto* def = m_achievements.catalog().get(id)) {
            result.achievement_points += def->reward_points;
        }
    }
    m_achievements.announce(result.unlocked_achievements);
}

AwardResult BadgeEngine::finish(AwardResult result) {
    for (const auto& id : result.unlocked_achievements) {
        if (const auto* def = m_achievements.catalog().get(id)) {
            result.achievement_points += def->reward_points;
        }
    }
    m_achievements.announce(result.unlocked_achievements);
    return result;
}

} // namespace unlock::badges
