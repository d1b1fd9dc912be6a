#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace unlock::badges {

enum class VisitOutcome : uint8_t {
    Verified,               // First on-site visit, or re-visit after the cooldown
    Upgraded,               // Self-reported site confirmed on site
    SelfReported,
    AlreadySelfReported,
    Blocked,                // Cooldown still running
    NoLocation,
    TooFar,
    UnknownSite
};

const char* visit_outcome_name(VisitOutcome outcome);

struct VisitResult {
    VisitOutcome outcome = VisitOutcome::NoLocation;
    int points_awarded = 0;             // Badge points only
    int achievement_points = 0;         // Rewards of achievements this visit unlocked
    int days_remaining = 0;             // Blocked only
    double distance_km = 0.0;           // TooFar only
    std::vector<std::string> unlocked_achievements;
    std::string message;

    bool is_success() const {
        return outcome == VisitOutcome::Verified ||
               outcome == VisitOutcome::Upgraded ||
               outcome == VisitOutcome::SelfReported;
    }
};

} // namespace unlock::badges
