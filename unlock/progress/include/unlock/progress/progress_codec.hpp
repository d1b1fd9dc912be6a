#pragma once

#include <unlock/progress/progress_state.hpp>
#include <array>
#include <map>
#include <string>
#include <string_view>

namespace unlock::progress {

// Storage keys, one per field group
namespace keys {
    inline constexpr std::string_view total_points = "totalPoints";
    inline constexpr std::string_view scholar_badges = "scholarBadges";
    inline constexpr std::string_view explorer_badges = "explorerBadges";
    inline constexpr std::string_view self_reported_sites = "selfReportedSites";
    inline constexpr std::string_view verified_visits = "verifiedVisits";
    inline constexpr std::string_view completed_quizzes = "completedQuizzes";
    inline constexpr std::string_view discovered_places = "discoveredPlaces";
    inline constexpr std::string_view achievement_progress = "achievementProgress";
    inline constexpr std::string_view favorite_sites = "favoriteSites";

    inline constexpr std::array<std::string_view, 9> all = {
        total_points, scholar_badges, explorer_badges, self_reported_sites,
        verified_visits, completed_quizzes, discovered_places,
        achievement_progress, favorite_sites
    };
}

using EncodedProgress = std::map<std::string, std::string, std::less<>>;

// The single serialization boundary for ProgressState. Every group is a JSON
// document; timestamps are milliseconds since the Unix epoch.
EncodedProgress encode_progress(const ProgressState& state);

struct DecodeReport {
    int groups_loaded = 0;
    int groups_missing = 0;
    int groups_malformed = 0;
};

// Missing groups stay at their defaults; malformed groups are logged and skipped
ProgressState decode_progress(const EncodedProgress& encoded, DecodeReport* report = nullptr);

} // namespace unlock::progress
