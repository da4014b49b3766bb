// === Store Record ============================================================
//
// Attributes of a single retail location as read from the store catalogue,
// plus the ranked wrapper produced by a nearest-store search. The unranked and
// ranked forms are separate types so a distance can only exist once a search
// has computed it.

#pragma once

#include <string>

#include "store_locator/geo_point.hpp"
#include "store_locator/types.hpp"

namespace store_locator {

/**
 * @brief One row of the store catalogue.
 */
struct StoreRecord final {
    std::string name{};       /**< Store name, e.g. "Crystal". */
    std::string location{};   /**< Free-form location hint, e.g. "SWC Broadway & Bass Lake Rd". */
    std::string address{};    /**< Street address. */
    std::string city{};       /**< City. */
    std::string state{};      /**< Two-letter state code. */
    std::string zip_code{};   /**< ZIP or ZIP+4 code. */
    double latitude{};        /**< Latitude in decimal degrees. */
    double longitude{};       /**< Longitude in decimal degrees. */
    std::string county{};     /**< County name. */

    /** @brief Position of the store. */
    [[nodiscard]] GeoPoint point() const noexcept { return GeoPoint{latitude, longitude}; }

    friend bool operator==(const StoreRecord&, const StoreRecord&) = default;
};

/**
 * @brief A candidate record annotated with its distance from a query point.
 *
 * Only produced by `find_nearest`; the wrapped record is a copy of the winning
 * candidate.
 */
template <typename Record>
struct Ranked final {
    Record record;                      /**< Copy of the winning candidate. */
    double distance{};                  /**< Distance from the query point, always >= 0. */
    UnitSystem units{UnitSystem::Miles}; /**< Unit in which @ref distance is expressed. */
};

using RankedStore = Ranked<StoreRecord>;

}  // namespace store_locator
