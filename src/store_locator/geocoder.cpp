#include "store_locator/geocoder.hpp"

#include <stdexcept>
#include <thread>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "store_locator/errors.hpp"

namespace store_locator {

namespace {

constexpr char k_search_path[] = "/search?format=json&limit=1&q=";

double coordinate_from_json(const nlohmann::json& value, const char* field_name) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        const std::string text = value.get<std::string>();
        std::size_t consumed = 0;
        double parsed = 0.0;
        try {
            parsed = std::stod(text, &consumed);
        } catch (const std::exception&) {
            throw GeocodingError(fmt::format("Geocoder returned a non-numeric {} '{}'", field_name, text));
        }
        if (consumed != text.size()) {
            throw GeocodingError(fmt::format("Geocoder returned a non-numeric {} '{}'", field_name, text));
        }
        return parsed;
    }
    throw GeocodingError(fmt::format("Geocoder response is missing a usable {}", field_name));
}

}  // namespace

NominatimGeocoder::NominatimGeocoder(HttpClient& http_client, GeocoderConfig config)
    : http_client_(http_client),
      config_(std::move(config)),
      logger_(get_logger()) {
    if (config_.endpoint.empty()) {
        throw std::invalid_argument("NominatimGeocoder requires an endpoint");
    }
    while (!config_.endpoint.empty() && config_.endpoint.back() == '/') {
        config_.endpoint.pop_back();
    }
    if (config_.max_retries < 0) {
        throw std::invalid_argument("NominatimGeocoder retries cannot be negative");
    }
}

std::string NominatimGeocoder::search_url(const std::string& search_location) const {
    return config_.endpoint + k_search_path + url_encode(search_location);
}

GeoPoint NominatimGeocoder::geocode(const std::string& search_location) {
    const std::string url = search_url(search_location);
    logger_->info("Geocoding '{}'", search_location);

    const HttpResponse response = fetch_with_retries(url);
    if (!response.transport_ok()) {
        throw GeocodingError(fmt::format("Geocoding request for '{}' failed: {}", search_location, response.error));
    }
    if (!response.is_success()) {
        throw GeocodingError(fmt::format("Geocoding request for '{}' returned HTTP {}", search_location, response.status_code));
    }

    const std::optional<GeoPoint> point = parse_nominatim_response(response.body);
    if (!point.has_value()) {
        throw GeocodingError("No result found for " + search_location);
    }
    logger_->info("Geocoded '{}' to ({}, {})", search_location, point->latitude_deg(), point->longitude_deg());
    return *point;
}

HttpResponse NominatimGeocoder::fetch_with_retries(const std::string& url) {
    const HttpHeaders headers{{"Accept", "application/json"}, {"User-Agent", config_.user_agent}};
    int attempt = 0;
    while (true) {
        HttpResponse response = http_client_.get(url, headers);
        if (response.transport_ok() || attempt == config_.max_retries) {
            return response;
        }
        logger_->warn("Geocoding attempt {} failed: {}", attempt, response.error);
        ++attempt;
        std::this_thread::sleep_for(config_.retry_backoff * attempt);
    }
}

std::optional<GeoPoint> parse_nominatim_response(std::string_view body) {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(body.begin(), body.end());
    } catch (const nlohmann::json::exception& exc) {
        throw GeocodingError(fmt::format("Geocoder returned malformed JSON: {}", exc.what()));
    }

    if (!document.is_array()) {
        throw GeocodingError("Geocoder response is not a JSON array");
    }
    if (document.empty()) {
        return std::nullopt;
    }

    const nlohmann::json& first_match = document.front();
    if (!first_match.is_object() || !first_match.contains("lat") || !first_match.contains("lon")) {
        throw GeocodingError("Geocoder match is missing lat/lon");
    }
    const double latitude = coordinate_from_json(first_match.at("lat"), "latitude");
    const double longitude = coordinate_from_json(first_match.at("lon"), "longitude");
    try {
        return make_geo_point(latitude, longitude);
    } catch (const InvalidGeometryError& exc) {
        throw GeocodingError(fmt::format("Geocoder returned an invalid location: {}", exc.what()));
    }
}

std::string url_encode(std::string_view text) {
    constexpr char k_hex_digits[] = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(text.size() * 3);
    for (const char raw_char : text) {
        const auto byte = static_cast<unsigned char>(raw_char);
        const bool unreserved = (byte >= 'A' && byte <= 'Z') || (byte >= 'a' && byte <= 'z') || (byte >= '0' && byte <= '9')
            || byte == '-' || byte == '_' || byte == '.' || byte == '~';
        if (unreserved) {
            encoded.push_back(raw_char);
        } else {
            encoded.push_back('%');
            encoded.push_back(k_hex_digits[byte >> 4]);
            encoded.push_back(k_hex_digits[byte & 0x0F]);
        }
    }
    return encoded;
}

}  // namespace store_locator
