#pragma once

#include <unlock/core/geo.hpp>
#include <string>
#include <vector>

namespace unlock::content {

using SiteId = std::string;
using SubLocationId = std::string;

// A point of interest inside a site; each one is a knowledge unit
struct SubLocation {
    SubLocationId id;
    std::string name;
};

struct Site {
    SiteId id;
    std::string name;
    std::string city;
    std::string era;
    core::Coordinate coordinate;
    std::vector<SubLocation> sub_locations;    // Ordered as presented

    bool has_sub_location(const SubLocationId& sub_id) const {
        for (const auto& sub : sub_locations) {
            if (sub.id == sub_id) return true;
        }
        return false;
    }
};

} // namespace unlock::content
