#include "store_locator/geo_distance.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace store_locator {

double sphere_radius(UnitSystem units) noexcept {
    return units == UnitSystem::Kilometers ? k_earth_radius_km : k_earth_radius_mi;
}

double great_circle_circumference(UnitSystem units) noexcept {
    return 2.0 * std::numbers::pi * sphere_radius(units);
}

double distance_between(const GeoPoint& point_a, const GeoPoint& point_b, UnitSystem units) noexcept {
    const double lat_a = point_a.latitude_radians();
    const double lat_b = point_b.latitude_radians();
    const double delta_lat = lat_b - lat_a;
    const double delta_lon = point_b.longitude_radians() - point_a.longitude_radians();

    const double a = std::pow(std::sin(delta_lat / 2.0), 2)
        + std::cos(lat_a) * std::cos(lat_b) * std::pow(std::sin(delta_lon / 2.0), 2);
    // Rounding can push a marginally past 1 for near-antipodal pairs.
    const double root_a = std::min(1.0, std::sqrt(a));
    return 2.0 * sphere_radius(units) * std::asin(root_a);
}

}  // namespace store_locator
