// === Geo Point ===============================================================
//
// Immutable latitude/longitude pair expressed in decimal degrees. Radian values
// are derived on demand. The raw constructor performs no range checks so the
// distance math can be exercised on arbitrary inputs; data entering from the
// outside world (CSV rows, geocoder responses) goes through `make_geo_point`,
// which rejects anything outside [-90, 90] x [-180, 180].

#pragma once

#include <numbers>

namespace store_locator {

inline constexpr double k_min_latitude_deg{-90.0};
inline constexpr double k_max_latitude_deg{90.0};
inline constexpr double k_min_longitude_deg{-180.0};
inline constexpr double k_max_longitude_deg{180.0};

/**
 * @brief Convert degrees to radians.
 */
constexpr double degrees_to_radians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}

/** @brief Geographic position in decimal degrees. */
class GeoPoint final {
  public:
    constexpr GeoPoint(double latitude_deg, double longitude_deg) noexcept
        : latitude_deg_(latitude_deg),
          longitude_deg_(longitude_deg) {}

    [[nodiscard]] constexpr double latitude_deg() const noexcept { return latitude_deg_; }
    [[nodiscard]] constexpr double longitude_deg() const noexcept { return longitude_deg_; }
    [[nodiscard]] constexpr double latitude_radians() const noexcept { return degrees_to_radians(latitude_deg_); }
    [[nodiscard]] constexpr double longitude_radians() const noexcept { return degrees_to_radians(longitude_deg_); }

    friend constexpr bool operator==(const GeoPoint&, const GeoPoint&) = default;

  private:
    double latitude_deg_;
    double longitude_deg_;
};

/**
 * @brief Build a GeoPoint after validating both coordinates.
 *
 * @throws InvalidGeometryError when either value is non-finite or out of range.
 */
[[nodiscard]] GeoPoint make_geo_point(double latitude_deg, double longitude_deg);

/** @brief True when both coordinates are finite and within range. */
[[nodiscard]] bool is_valid_geo_point(double latitude_deg, double longitude_deg) noexcept;

}  // namespace store_locator
