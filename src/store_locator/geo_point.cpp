#include "store_locator/geo_point.hpp"

#include <cmath>

#include <fmt/format.h>

#include "store_locator/errors.hpp"

namespace store_locator {

namespace {
bool in_range(double value, double lower, double upper) noexcept {
    return std::isfinite(value) && value >= lower && value <= upper;
}
}  // namespace

bool is_valid_geo_point(double latitude_deg, double longitude_deg) noexcept {
    return in_range(latitude_deg, k_min_latitude_deg, k_max_latitude_deg)
        && in_range(longitude_deg, k_min_longitude_deg, k_max_longitude_deg);
}

GeoPoint make_geo_point(double latitude_deg, double longitude_deg) {
    if (!in_range(latitude_deg, k_min_latitude_deg, k_max_latitude_deg)) {
        throw InvalidGeometryError(fmt::format("Latitude {} is outside [{}, {}]", latitude_deg, k_min_latitude_deg, k_max_latitude_deg));
    }
    if (!in_range(longitude_deg, k_min_longitude_deg, k_max_longitude_deg)) {
        throw InvalidGeometryError(fmt::format("Longitude {} is outside [{}, {}]", longitude_deg, k_min_longitude_deg, k_max_longitude_deg));
    }
    return GeoPoint{latitude_deg, longitude_deg};
}

}  // namespace store_locator
