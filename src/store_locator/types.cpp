#include "store_locator/types.hpp"

#include <stdexcept>
#include <string>

namespace store_locator {

namespace {
constexpr std::string_view k_miles_name{"mi"};
constexpr std::string_view k_kilometers_name{"km"};
constexpr std::string_view k_text_name{"text"};
constexpr std::string_view k_json_name{"json"};
}  // namespace

std::string_view to_string(UnitSystem units) noexcept {
    switch (units) {
        case UnitSystem::Kilometers:
            return k_kilometers_name;
        case UnitSystem::Miles:
        default:
            return k_miles_name;
    }
}

UnitSystem parse_unit_system(std::string_view text) {
    if (text == k_miles_name) {
        return UnitSystem::Miles;
    }
    if (text == k_kilometers_name) {
        return UnitSystem::Kilometers;
    }
    throw std::invalid_argument("Invalid units '" + std::string{text} + "'. Valid units: [mi, km]");
}

std::string_view to_string(OutputFormat format) noexcept {
    switch (format) {
        case OutputFormat::Json:
            return k_json_name;
        case OutputFormat::Text:
        default:
            return k_text_name;
    }
}

OutputFormat parse_output_format(std::string_view text) {
    if (text == k_text_name) {
        return OutputFormat::Text;
    }
    if (text == k_json_name) {
        return OutputFormat::Json;
    }
    throw std::invalid_argument("Invalid output format '" + std::string{text} + "'. Valid formats: [json, text]");
}

}  // namespace store_locator
