// === Nearest Finder ==========================================================
//
// Linear-scan nearest-neighbour search over a caller-owned candidate sequence.
// Candidates are any type exposing `point() -> GeoPoint`. The scan keeps the
// first candidate among exact ties, never mutates its input, and holds no
// state between calls.

#pragma once

#include <vector>

#include "store_locator/errors.hpp"
#include "store_locator/geo_distance.hpp"
#include "store_locator/store_record.hpp"

namespace store_locator {

/** @brief Default distance policy: haversine great-circle distance. */
struct HaversineDistance final {
    double operator()(const GeoPoint& point_a, const GeoPoint& point_b, UnitSystem units) const noexcept {
        return distance_between(point_a, point_b, units);
    }
};

/**
 * @brief Return a ranked copy of the candidate closest to @p query.
 *
 * @param query Search origin.
 * @param candidates Non-empty ordered sequence of candidates.
 * @param units Unit for the reported distance.
 * @param distance_fn Callable `(GeoPoint, GeoPoint, UnitSystem) -> double`.
 * @throws EmptyInputError when @p candidates is empty.
 */
template <typename Record, typename DistanceFn = HaversineDistance>
[[nodiscard]] Ranked<Record> find_nearest(const GeoPoint& query,
                                          const std::vector<Record>& candidates,
                                          UnitSystem units = UnitSystem::Miles,
                                          DistanceFn&& distance_fn = DistanceFn{}) {
    if (candidates.empty()) {
        throw EmptyInputError("Cannot search for the nearest location in an empty candidate set");
    }

    // Sentinel: no real distance on the sphere reaches the full circumference.
    double smallest_distance = great_circle_circumference(units);
    const Record* nearest = nullptr;
    for (const Record& candidate : candidates) {
        const double candidate_distance = distance_fn(query, candidate.point(), units);
        if (candidate_distance < smallest_distance) {
            smallest_distance = candidate_distance;
            nearest = &candidate;
        }
    }

    if (nearest == nullptr) {
        // NaN coordinates compare false against everything.
        throw InvalidGeometryError("No candidate produced a comparable distance to the query point");
    }
    return Ranked<Record>{*nearest, smallest_distance, units};
}

}  // namespace store_locator
