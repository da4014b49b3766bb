// === Geocoder ================================================================
//
// Resolves a free-text address or postal code to a GeoPoint. `Geocoder` is the
// seam the runtime depends on; `NominatimGeocoder` implements it against the
// OpenStreetMap Nominatim search API through an injected HttpClient. When the
// service returns several candidates the first one wins.

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "store_locator/geo_point.hpp"
#include "store_locator/http_client.hpp"
#include "store_locator/logging.hpp"

namespace store_locator {

/**
 * @brief Settings for the Nominatim geocoder and its HTTP transport.
 */
struct GeocoderConfig final {
    std::string endpoint{};                                       /**< Base URL, e.g. https://nominatim.openstreetmap.org. */
    std::string user_agent{};                                     /**< User-Agent header required by Nominatim's usage policy. */
    long timeout_seconds{10};                                     /**< Per-request timeout. */
    int max_retries{};                                            /**< Extra attempts after a transport failure. */
    std::chrono::milliseconds retry_backoff{std::chrono::milliseconds{200}}; /**< Base back-off, scaled by attempt. */
};

/** @brief Resolves free-text locations to coordinates. */
class Geocoder {
  public:
    virtual ~Geocoder() = default;

    /**
     * @brief Resolve @p search_location to a point.
     *
     * @throws GeocodingError when the lookup fails or finds nothing.
     */
    virtual GeoPoint geocode(const std::string& search_location) = 0;
};

/** @brief Geocoder backed by the Nominatim `/search` endpoint. */
class NominatimGeocoder final : public Geocoder {
  public:
    NominatimGeocoder(HttpClient& http_client, GeocoderConfig config);

    GeoPoint geocode(const std::string& search_location) override;

    /** @brief Fully-qualified search URL for @p search_location. */
    [[nodiscard]] std::string search_url(const std::string& search_location) const;

  private:
    HttpResponse fetch_with_retries(const std::string& url);

    HttpClient& http_client_;
    GeocoderConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
};

/**
 * @brief Extract the first match from a Nominatim JSON search response.
 *
 * @return std::nullopt for an empty result array.
 * @throws GeocodingError for malformed JSON or out-of-range coordinates.
 */
[[nodiscard]] std::optional<GeoPoint> parse_nominatim_response(std::string_view body);

/** @brief Percent-encode @p text for use in a URL query component. */
[[nodiscard]] std::string url_encode(std::string_view text);

}  // namespace store_locator
