// === Core Types ==============================================================
//
// Collects shared enumerations and constants used throughout the store locator
// (unit systems, output formats, sphere radii).

#pragma once

#include <string_view>

namespace store_locator {

/**
 * @brief Conversion factor from kilometres to statute miles.
 */
inline constexpr double k_km_to_mi{0.621371};

/**
 * @brief Mean Earth radius in kilometres used for great-circle calculations.
 */
inline constexpr double k_earth_radius_km{6'371.0};

/**
 * @brief Mean Earth radius expressed in statute miles.
 */
inline constexpr double k_earth_radius_mi{k_earth_radius_km * k_km_to_mi};

/**
 * @brief Selects the unit in which distances are reported.
 */
enum class UnitSystem {
    Miles,       /**< Statute miles ("mi"). */
    Kilometers   /**< Kilometres ("km"). */
};

/**
 * @brief Identifies how a search result is presented to the caller.
 */
enum class OutputFormat {
    Text,   /**< Human-readable address and distance lines. */
    Json    /**< Single JSON object with the store fields. */
};

/** @brief Short textual form of @p units ("mi" or "km"). */
[[nodiscard]] std::string_view to_string(UnitSystem units) noexcept;

/** @brief Parse "mi" or "km"; throws std::invalid_argument otherwise. */
[[nodiscard]] UnitSystem parse_unit_system(std::string_view text);

/** @brief Textual form of @p format ("text" or "json"). */
[[nodiscard]] std::string_view to_string(OutputFormat format) noexcept;

/** @brief Parse "text" or "json"; throws std::invalid_argument otherwise. */
[[nodiscard]] OutputFormat parse_output_format(std::string_view text);

}  // namespace store_locator
