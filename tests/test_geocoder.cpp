#include <catch2/catch.hpp>

#include <chrono>

#include "fake_http_client.hpp"
#include "logging_test_fixture.hpp"
#include "store_locator/errors.hpp"
#include "store_locator/geocoder.hpp"

using namespace store_locator;
using store_locator::test::FakeHttpClient;
using store_locator::test::ok_response;
using store_locator::test::transport_failure;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    store_locator::test::ensure_logger_initialized();
    return true;
}();

constexpr char k_pine_street[] = "1462 Pine St, San Francisco, CA 94109";
constexpr char k_pine_street_response[] =
    R"([{"place_id":1,"lat":"37.789783","lon":"-122.419862","display_name":"1462 Pine Street"}])";

GeocoderConfig test_config(int max_retries) {
    GeocoderConfig config{};
    config.endpoint = "https://geocoder.test/";
    config.user_agent = "store-locator-tests";
    config.max_retries = max_retries;
    config.retry_backoff = std::chrono::milliseconds{0};
    return config;
}
}  // namespace

TEST_CASE("parse_nominatim_response takes the first match") {
    const auto point = parse_nominatim_response(
        R"([{"lat":"37.789783","lon":"-122.419862"},{"lat":"10.0","lon":"10.0"}])");
    REQUIRE(point.has_value());
    REQUIRE(point->latitude_deg() == Approx(37.789783));
    REQUIRE(point->longitude_deg() == Approx(-122.419862));
}

TEST_CASE("parse_nominatim_response accepts numeric coordinates") {
    const auto point = parse_nominatim_response(R"([{"lat":45.05,"lon":-93.36}])");
    REQUIRE(point.has_value());
    REQUIRE(point->latitude_deg() == 45.05);
}

TEST_CASE("parse_nominatim_response returns nothing for an empty result") {
    REQUIRE_FALSE(parse_nominatim_response("[]").has_value());
}

TEST_CASE("parse_nominatim_response rejects malformed payloads") {
    REQUIRE_THROWS_AS(parse_nominatim_response("not json"), GeocodingError);
    REQUIRE_THROWS_AS(parse_nominatim_response(R"({"lat":"1","lon":"2"})"), GeocodingError);
    REQUIRE_THROWS_AS(parse_nominatim_response(R"([{"lat":"1"}])"), GeocodingError);
    REQUIRE_THROWS_AS(parse_nominatim_response(R"([{"lat":"north","lon":"2"}])"), GeocodingError);
    REQUIRE_THROWS_AS(parse_nominatim_response(R"([{"lat":"91","lon":"2"}])"), GeocodingError);
}

TEST_CASE("url_encode escapes reserved characters") {
    REQUIRE(url_encode("55428") == "55428");
    REQUIRE(url_encode("1462 Pine St, SF") == "1462%20Pine%20St%2C%20SF");
    REQUIRE(url_encode("a&b=c~d") == "a%26b%3Dc~d");
}

TEST_CASE("NominatimGeocoder queries the search endpoint and returns the match") {
    FakeHttpClient http_client{};
    http_client.enqueue(ok_response(k_pine_street_response));
    NominatimGeocoder geocoder{http_client, test_config(0)};

    const GeoPoint point = geocoder.geocode(k_pine_street);

    REQUIRE(point.latitude_deg() == Approx(37.789783));
    REQUIRE(point.longitude_deg() == Approx(-122.419862));
    REQUIRE(http_client.urls().size() == 1);
    REQUIRE(http_client.urls().front()
            == "https://geocoder.test/search?format=json&limit=1&q=1462%20Pine%20St%2C%20San%20Francisco%2C%20CA%2094109");
    REQUIRE(http_client.last_headers().at("User-Agent") == "store-locator-tests");
}

TEST_CASE("NominatimGeocoder reports when nothing matches") {
    FakeHttpClient http_client{};
    http_client.enqueue(ok_response("[]"));
    NominatimGeocoder geocoder{http_client, test_config(3)};

    REQUIRE_THROWS_WITH(geocoder.geocode(k_pine_street), std::string{"No result found for "} + k_pine_street);
    REQUIRE(http_client.urls().size() == 1);
}

TEST_CASE("NominatimGeocoder retries transport failures") {
    FakeHttpClient http_client{};
    http_client.enqueue(transport_failure("Couldn't resolve host name"));
    http_client.enqueue(ok_response(k_pine_street_response));
    NominatimGeocoder geocoder{http_client, test_config(1)};

    REQUIRE(geocoder.geocode(k_pine_street).latitude_deg() == Approx(37.789783));
    REQUIRE(http_client.urls().size() == 2);
}

TEST_CASE("NominatimGeocoder gives up after the configured retries") {
    FakeHttpClient http_client{};
    for (int attempt = 0; attempt < 3; ++attempt) {
        http_client.enqueue(transport_failure("Timeout was reached"));
    }
    NominatimGeocoder geocoder{http_client, test_config(2)};

    REQUIRE_THROWS_AS(geocoder.geocode(k_pine_street), GeocodingError);
    REQUIRE(http_client.urls().size() == 3);
}

TEST_CASE("NominatimGeocoder does not retry HTTP error statuses") {
    FakeHttpClient http_client{};
    http_client.enqueue(HttpResponse{503, "busy", ""});
    NominatimGeocoder geocoder{http_client, test_config(2)};

    REQUIRE_THROWS_WITH(geocoder.geocode("55428"), Catch::Contains("HTTP 503"));
    REQUIRE(http_client.urls().size() == 1);
}

TEST_CASE("NominatimGeocoder requires an endpoint") {
    FakeHttpClient http_client{};
    GeocoderConfig config = test_config(0);
    config.endpoint.clear();
    REQUIRE_THROWS_AS(NominatimGeocoder(http_client, config), std::invalid_argument);
}
