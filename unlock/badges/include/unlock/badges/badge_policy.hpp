#pragma once

#include <unlock/core/clock.hpp>

namespace unlock::badges {

// Reward and verification constants. Every badge rule reads its numbers
// from here; the defaults are the shipped values.
struct BadgePolicy {
    double verification_radius_m = 200.0;
    core::Days visit_cooldown{30};
    core::Days discovery_cooldown{30};

    int scholar_points = 1;
    int verified_visit_points = 50;
    int upgrade_points = 20;            // Self-reported -> verified
    int self_report_points = 30;
    int discovery_points = 1;
    int quiz_points = 10;
};

} // namespace unlock::badges
