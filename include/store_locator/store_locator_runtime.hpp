// === Store Locator Runtime ===================================================
//
// Wires configuration, store catalogue, geocoder, nearest-store search and
// rendering together for a single command-line request.

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "store_locator/command_line.hpp"
#include "store_locator/configuration.hpp"
#include "store_locator/geocoder.hpp"
#include "store_locator/logging.hpp"
#include "store_locator/store_record.hpp"

namespace store_locator {

/** @brief Executes store searches against a catalogue loaded on first use. */
class StoreLocatorRuntime final {
  public:
    StoreLocatorRuntime(Configuration configuration, Geocoder& geocoder);

    /** @brief Stores loaded from the configured catalogue (loads it if needed). */
    [[nodiscard]] const std::vector<StoreRecord>& stores();

    /** @brief Geocode @p search_location and return the closest store. */
    [[nodiscard]] RankedStore find_nearest_store(const std::string& search_location, UnitSystem units);

    /** @brief Handle one parsed request and return the text to print. */
    [[nodiscard]] std::string run(const CommandLineOptions& options);

  private:
    Configuration configuration_;
    Geocoder& geocoder_;
    std::vector<StoreRecord> list_stores_;
    bool flag_stores_loaded_{false};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace store_locator
