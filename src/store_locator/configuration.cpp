// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of environment-driven settings. Defaults
// apply whenever a variable is unset or empty; unparsable or out-of-bounds
// numbers fall back to the default with a logged warning.
//
// Recognized variables
// - STORE_LOCATOR_LOG_DIR          log directory (default "logs")
// - STORE_LOCATOR_LOG_LEVEL        spdlog level name (default "info")
// - STORE_LOCATOR_STORES_CSV       catalogue path (default "store-locations.csv")
// - STORE_LOCATOR_GEOCODER_URL     Nominatim base URL
// - STORE_LOCATOR_USER_AGENT       HTTP User-Agent header
// - STORE_LOCATOR_HTTP_TIMEOUT_S   request timeout in seconds (default 10)
// - STORE_LOCATOR_GEOCODE_RETRIES  transport retries (default 2, zero allowed)

#include "store_locator/configuration.hpp"

#include <cstdlib>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string_view>

#include "store_locator/logging.hpp"
#include "store_locator/version.hpp"

namespace store_locator {

namespace {
constexpr std::string_view k_default_log_directory{"logs"};
constexpr std::string_view k_default_log_level{"info"};
constexpr std::string_view k_default_stores_csv{"store-locations.csv"};
constexpr std::string_view k_default_geocoder_url{"https://nominatim.openstreetmap.org"};
constexpr long k_default_http_timeout_s{10};
constexpr int k_default_geocode_retries{2};

std::string parse_string(const char* variable_name, std::string_view fallback) {
    const char* raw_value = std::getenv(variable_name);
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return std::string{fallback};
    }
    return std::string{raw_value};
}

std::optional<long> parse_whole_number(const char* variable_name, const char* raw_value) {
    const std::string text{raw_value};
    std::size_t consumed = 0;
    long parsed_value = 0;
    try {
        parsed_value = std::stol(text, &consumed);
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse integer from {}='{}'", variable_name, text);
        return std::nullopt;
    }
    if (consumed != text.size()) {
        get_logger()->warn("Trailing characters in {}='{}'", variable_name, text);
        return std::nullopt;
    }
    return parsed_value;
}

long parse_positive_long(const char* variable_name, long fallback) {
    const char* raw_value = std::getenv(variable_name);
    if (raw_value == nullptr) {
        return fallback;
    }
    const std::optional<long> parsed_value = parse_whole_number(variable_name, raw_value);
    if (!parsed_value.has_value()) {
        get_logger()->warn("Using fallback {} for {}", fallback, variable_name);
        return fallback;
    }
    if (*parsed_value <= 0) {
        get_logger()->warn("{} must be positive; using fallback {}", variable_name, fallback);
        return fallback;
    }
    return *parsed_value;
}

int parse_non_negative_int(const char* variable_name, int fallback) {
    const char* raw_value = std::getenv(variable_name);
    if (raw_value == nullptr) {
        return fallback;
    }
    const std::optional<long> parsed_value = parse_whole_number(variable_name, raw_value);
    if (!parsed_value.has_value()) {
        get_logger()->warn("Using fallback {} for {}", fallback, variable_name);
        return fallback;
    }
    if (*parsed_value < 0 || *parsed_value > std::numeric_limits<int>::max()) {
        get_logger()->warn("{} must be between 0 and {}; using fallback {}", variable_name, std::numeric_limits<int>::max(), fallback);
        return fallback;
    }
    return static_cast<int>(*parsed_value);
}

}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log_directory = parse_string("STORE_LOCATOR_LOG_DIR", k_default_log_directory);

    auto logger = initialize_logger(config.log_directory);
    logger->info("Loading configuration from environment");

    config.log_level = parse_string("STORE_LOCATOR_LOG_LEVEL", k_default_log_level);
    config.stores_csv_path = parse_string("STORE_LOCATOR_STORES_CSV", k_default_stores_csv);
    config.geocoder = load_geocoder_config();

    logger->info("Configuration loaded: stores_csv={} geocoder_url={} timeout_s={} retries={}",
                 config.stores_csv_path,
                 config.geocoder.endpoint,
                 config.geocoder.timeout_seconds,
                 config.geocoder.max_retries);

    return config;
}

GeocoderConfig ConfigurationLoader::load_geocoder_config() {
    GeocoderConfig geocoder{};
    geocoder.endpoint = parse_string("STORE_LOCATOR_GEOCODER_URL", k_default_geocoder_url);
    geocoder.user_agent = parse_string("STORE_LOCATOR_USER_AGENT", "store-locator/" + std::string{k_version});
    geocoder.timeout_seconds = parse_positive_long("STORE_LOCATOR_HTTP_TIMEOUT_S", k_default_http_timeout_s);
    geocoder.max_retries = parse_non_negative_int("STORE_LOCATOR_GEOCODE_RETRIES", k_default_geocode_retries);
    return geocoder;
}

}  // namespace store_locator
