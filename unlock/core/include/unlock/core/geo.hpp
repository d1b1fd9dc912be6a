#pragma once

#include <glm/glm.hpp>

namespace unlock::core {

// Mean Earth radius used for great-circle distances
constexpr double EARTH_RADIUS_METERS = 6371008.8;

// Geographic coordinate in degrees
struct Coordinate {
    double latitude = 0.0;
    double longitude = 0.0;

    glm::dvec2 radians() const { return glm::radians(glm::dvec2(latitude, longitude)); }

    bool is_valid() const {
        return latitude >= -90.0 && latitude <= 90.0 &&
               longitude >= -180.0 && longitude <= 180.0;
    }

    bool operator==(const Coordinate&) const = default;
};

// Haversine distance in meters
double distance_meters(const Coordinate& a, const Coordinate& b);

inline double distance_km(const Coordinate& a, const Coordinate& b) {
    return distance_meters(a, b) / 1000.0;
}

// Point `meters` away from `origin` along `bearing_degrees` (0 = north)
Coordinate offset_by(const Coordinate& origin, double meters, double bearing_degrees);

} // namespace unlock::core
