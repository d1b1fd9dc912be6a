#include <unlock/rank/rank.hpp>
#include <algorithm>
#include <array>

namespace unlock::rank {

namespace {

constexpr std::array<RankTier, 6> k_tiers = {{
    {Rank::Tourist,       "Tourist",       "figure.walk", 0,   50},
    {Rank::Traveler,      "Traveler",      "airplane",    51,  150},
    {Rank::Explorer,      "Explorer",      "binoculars",  151, 300},
    {Rank::Historian,     "Historian",     "scroll",      301, 500},
    {Rank::Archaeologist, "Archaeologist", "hammer",      501, 800},
    {Rank::Pharaoh,       "Pharaoh",       "crown.fill",  801, std::nullopt},
}};

} // namespace

std::span<const RankTier> rank_tiers() {
    return k_tiers;
}

const RankTier& tier_of(Rank rank) {
    return k_tiers[static_cast<size_t>(rank)];
}

const char* rank_name(Rank rank) {
    return tier_of(rank).name;
}

const char* rank_icon(Rank rank) {
    return tier_of(rank).icon;
}

Rank rank_for(int points) {
    for (auto it = k_tiers.rbegin(); it != k_tiers.rend(); ++it) {
        if (points >= it->min_points) {
            return it->rank;
        }
    }
    return Rank::Tourist;
}

std::optional<Rank> next_rank(Rank current) {
    size_t index = static_cast<size_t>(current) + 1;
    if (index >= k_tiers.size()) {
        return std::nullopt;
    }
    return k_tiers[index].rank;
}

std::optional<int> points_to_next(Rank current, int points) {
    auto next = next_rank(current);
    if (!next) {
        return std::nullopt;
    }
    return tier_of(*next).min_points - points;
}

float progress_fraction(Rank current, int points) {
    auto next = next_rank(current);
    if (!next) {
        return 1.0f;
    }

    int floor = tier_of(current).min_points;
    int span = tier_of(*next).min_points - floor;
    if (span <= 0) {
        return 1.0f;
    }

    float fraction = static_cast<float>(points - floor) / static_cast<float>(span);
    return std::clamp(fraction, 0.0f, 1.0f);
}

} // namespace unlock::rank
