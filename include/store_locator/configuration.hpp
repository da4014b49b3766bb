// === Configuration ===========================================================
//
// Exposes the strongly-typed configuration consumed by the store locator:
// logging destination, catalogue location, and geocoder settings.
// `ConfigurationLoader` translates environment variables into these structures
// so downstream modules never touch `std::getenv` directly.

#pragma once

#include <string>

#include "store_locator/geocoder.hpp"

namespace store_locator {

/**
 * @brief Immutable bundle of runtime settings for one store locator run.
 *
 * Every field is populated by ConfigurationLoader; consumers should treat the
 * values as authoritative and avoid consulting environment variables directly.
 */
struct Configuration final {
    std::string log_directory{};     /**< Destination directory for structured logs. */
    std::string log_level{};         /**< spdlog level name applied after start-up. */
    std::string stores_csv_path{};   /**< Path of the store catalogue CSV. */
    GeocoderConfig geocoder{};       /**< Geocoding endpoint, retries and HTTP settings. */
};

/**
 * @brief Utility responsible for hydrating Configuration from environment
 *        variables.
 */
class ConfigurationLoader final {
  public:
    static Configuration load();

  private:
    static GeocoderConfig load_geocoder_config();
};

}  // namespace store_locator
