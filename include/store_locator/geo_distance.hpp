// === Geo Distance ============================================================
//
// Great-circle distance on a spherical Earth using the haversine formula. All
// functions are pure and safe to call concurrently.

#pragma once

#include "store_locator/geo_point.hpp"
#include "store_locator/types.hpp"

namespace store_locator {

/** @brief Sphere radius for @p units (6371 km or its mile equivalent). */
[[nodiscard]] double sphere_radius(UnitSystem units) noexcept;

/** @brief Full great-circle circumference (2 pi R) for @p units. */
[[nodiscard]] double great_circle_circumference(UnitSystem units) noexcept;

/**
 * @brief Haversine distance between two points in the requested unit.
 *
 * Symmetric and non-negative; zero for identical points. Coordinates are not
 * range-checked.
 */
[[nodiscard]] double distance_between(const GeoPoint& point_a, const GeoPoint& point_b, UnitSystem units = UnitSystem::Miles) noexcept;

}  // namespace store_locator
