#include "store_locator/store_locator_runtime.hpp"

#include <stdexcept>

#include "store_locator/nearest_finder.hpp"
#include "store_locator/result_renderer.hpp"
#include "store_locator/store_catalog.hpp"

namespace store_locator {

StoreLocatorRuntime::StoreLocatorRuntime(Configuration configuration, Geocoder& geocoder)
    : configuration_(std::move(configuration)),
      geocoder_(geocoder),
      logger_(get_logger()) {
    if (configuration_.stores_csv_path.empty()) {
        throw std::invalid_argument("StoreLocatorRuntime requires a store catalogue path");
    }
}

const std::vector<StoreRecord>& StoreLocatorRuntime::stores() {
    if (!flag_stores_loaded_) {
        list_stores_ = load_stores(configuration_.stores_csv_path);
        flag_stores_loaded_ = true;
    }
    return list_stores_;
}

RankedStore StoreLocatorRuntime::find_nearest_store(const std::string& search_location, UnitSystem units) {
    const std::vector<StoreRecord>& catalogue = stores();
    const GeoPoint search_point = geocoder_.geocode(search_location);
    RankedStore nearest = find_nearest(search_point, catalogue, units);
    logger_->info("Nearest store to '{}' is {} ({:.2f} {})",
                  search_location,
                  describe(nearest.record),
                  nearest.distance,
                  to_string(units));
    return nearest;
}

std::string StoreLocatorRuntime::run(const CommandLineOptions& options) {
    const RankedStore nearest = find_nearest_store(options.search_location(), options.units);
    return render(nearest, options.output_format);
}

}  // namespace store_locator
