#include <unlock/core/geo.hpp>
#include <algorithm>
#include <cmath>

namespace unlock::core {

double distance_meters(const Coordinate& a, const Coordinate& b) {
    glm::dvec2 ra = a.radians();
    glm::dvec2 rb = b.radians();
    glm::dvec2 delta = rb - ra;

    double sin_lat = std::sin(delta.x * 0.5);
    double sin_lon = std::sin(delta.y * 0.5);
    double h = sin_lat * sin_lat + std::cos(ra.x) * std::cos(rb.x) * sin_lon * sin_lon;

    // Rounding can push h slightly past 1 for antipodal points
    h = std::clamp(h, 0.0, 1.0);
    return 2.0 * EARTH_RADIUS_METERS * std::asin(std::sqrt(h));
}

Coordinate offset_by(const Coordinate& origin, double meters, double bearing_degrees) {
    glm::dvec2 r = origin.radians();
    double bearing = glm::radians(bearing_degrees);
    double angular = meters / EARTH_RADIUS_METERS;

    double lat = std::asin(std::sin(r.x) * std::cos(angular) +
                           std::cos(r.x) * std::sin(angular) * std::cos(bearing));
    double lon = r.y + std::atan2(std::sin(bearing) * std::sin(angular) * std::cos(r.x),
                                  std::cos(angular) - std::sin(r.x) * std::sin(lat));

    return Coordinate{glm::degrees(lat), glm::degrees(lon)};
}

} // namespace unlock::core
