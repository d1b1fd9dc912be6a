#pragma once

#include <cstdint>
#include <optional>
#include <span>

namespace unlock::rank {

// ============================================================================
// Rank
// ============================================================================

enum class Rank : uint8_t {
    Tourist,
    Traveler,
    Explorer,
    Historian,
    Archaeologist,
    Pharaoh
};

struct RankTier {
    Rank rank;
    const char* name;
    const char* icon;
    int min_points;
    std::optional<int> max_points;  // nullopt for the terminal tier
};

// Ordered by min_points, ascending
std::span<const RankTier> rank_tiers();

const RankTier& tier_of(Rank rank);
const char* rank_name(Rank rank);
const char* rank_icon(Rank rank);

// Tier whose range contains `points`; negative totals map to the first tier
Rank rank_for(int points);

std::optional<Rank> next_rank(Rank current);

// Points still needed to reach the next tier, nullopt at the top
std::optional<int> points_to_next(Rank current, int points);

// Position inside the current tier in [0, 1]; 1.0 for the terminal tier
float progress_fraction(Rank current, int points);

} // namespace unlock::rank
