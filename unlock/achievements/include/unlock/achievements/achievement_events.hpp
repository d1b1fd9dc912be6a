#pragma once

#include <unlock/core/clock.hpp>
#include <string>

namespace unlock::achievements {

// ============================================================================
// Achievement Unlocked Event
// ============================================================================

struct AchievementUnlockedEvent {
    std::string achievement_id;
    std::string display_name;
    std::string icon;
    int points = 0;
    core::Timestamp timestamp{};
};

} // namespace unlock::achievements
