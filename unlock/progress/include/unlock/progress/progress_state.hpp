#pragma once

#include <unlock/core/clock.hpp>
#include <map>
#include <set>
#include <string>

namespace unlock::progress {

using core::Timestamp;

// ============================================================================
// Progress State
// ============================================================================
//
// Everything the engine persists for the user. Only ProgressStore hands out
// a mutable reference, and only inside a transaction.
//
// Invariant: self_reported_sites is a subset of explorer_badges.

struct ProgressState {
    int total_points = 0;

    std::set<std::string> scholar_badges;           // Sub-location ids (knowledge keys)
    std::set<std::string> explorer_badges;          // Site ids (discovery keys)
    std::set<std::string> self_reported_sites;      // Explorer badges without a verified visit
    std::map<std::string, Timestamp> verified_visits;   // Last visit of either kind
    std::set<std::string> completed_quizzes;
    std::map<std::string, Timestamp> discovered_places; // Last rewarded discovery
    std::map<std::string, Timestamp> unlocked_achievements;
    std::set<std::string> favorite_sites;

    bool has_scholar_badge(const std::string& sub_location_id) const {
        return scholar_badges.contains(sub_location_id);
    }

    bool has_explorer_badge(const std::string& site_id) const {
        return explorer_badges.contains(site_id);
    }

    bool is_self_reported(const std::string& site_id) const {
        return self_reported_sites.contains(site_id);
    }

    bool is_fully_verified(const std::string& site_id) const {
        return has_explorer_badge(site_id) && !is_self_reported(site_id);
    }

    bool is_achievement_unlocked(const std::string& achievement_id) const {
        return unlocked_achievements.contains(achievement_id);
    }

    bool is_empty() const { return *this == ProgressState{}; }

    bool operator==(const ProgressState&) const = default;
};

} // namespace unlock::progress
