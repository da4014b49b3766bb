#include "store_locator/result_renderer.hpp"

#include <stdexcept>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace store_locator {

namespace {

constexpr char k_distance_key[] = "distance_to_store";

nlohmann::ordered_json to_json(const StoreRecord& store) {
    nlohmann::ordered_json object;
    object["name"] = store.name;
    object["location"] = store.location;
    object["address"] = store.address;
    object["city"] = store.city;
    object["state"] = store.state;
    object["zip_code"] = store.zip_code;
    object["latitude"] = store.latitude;
    object["longitude"] = store.longitude;
    object["county"] = store.county;
    return object;
}

/**
 * @brief Serialize a flat object with ", " and ": " separators.
 *
 * nlohmann's compact dump emits no whitespace after separators. Non-ASCII
 * text is escaped as \uXXXX.
 */
std::string dump_spaced(const nlohmann::ordered_json& object) {
    std::string output{"{"};
    bool first_member = true;
    for (auto member = object.cbegin(); member != object.cend(); ++member) {
        if (!first_member) {
            output += ", ";
        }
        first_member = false;
        output += nlohmann::json(member.key()).dump(-1, ' ', true, nlohmann::json::error_handler_t::replace);
        output += ": ";
        output += member.value().dump(-1, ' ', true, nlohmann::json::error_handler_t::replace);
    }
    output += "}";
    return output;
}

}  // namespace

std::string render_text(const StoreRecord& store) {
    return fmt::format("{}, {}, {}, {}", store.address, store.city, store.state, store.zip_code);
}

std::string render_text(const RankedStore& ranked) {
    return fmt::format("{}\nDistance to store: {:.2f}", render_text(ranked.record), ranked.distance);
}

std::string render_json(const StoreRecord& store) {
    return dump_spaced(to_json(store));
}

std::string render_json(const RankedStore& ranked) {
    nlohmann::ordered_json object = to_json(ranked.record);
    object[k_distance_key] = ranked.distance;
    return dump_spaced(object);
}

std::string render(const StoreRecord& store, OutputFormat format) {
    switch (format) {
        case OutputFormat::Text:
            return render_text(store);
        case OutputFormat::Json:
            return render_json(store);
    }
    throw std::invalid_argument("Unsupported output format");
}

std::string render(const RankedStore& ranked, OutputFormat format) {
    switch (format) {
        case OutputFormat::Text:
            return render_text(ranked);
        case OutputFormat::Json:
            return render_json(ranked);
    }
    throw std::invalid_argument("Unsupported output format");
}

std::string describe(const StoreRecord& store) {
    return fmt::format("{} located at {}", store.name, render_text(store));
}

}  // namespace store_locator
