#include <catch2/catch.hpp>

#include <iterator>

#include <nlohmann/json.hpp>

#include "store_locator/result_renderer.hpp"

using namespace store_locator;

namespace {

StoreRecord crystal_store() {
    StoreRecord store{};
    store.name = "Crystal";
    store.location = "SWC Broadway & Bass Lake Rd";
    store.address = "5537 W Broadway Ave";
    store.city = "Crystal";
    store.state = "MN";
    store.zip_code = "55428-3507";
    store.latitude = 45.0521539;
    store.longitude = -93.364854;
    store.county = "Hennepin County";
    return store;
}

RankedStore ranked_crystal_store(double distance) {
    return RankedStore{crystal_store(), distance, UnitSystem::Miles};
}

}  // namespace

TEST_CASE("Text rendering omits the distance for unranked stores") {
    REQUIRE(render(crystal_store(), OutputFormat::Text) == "5537 W Broadway Ave, Crystal, MN, 55428-3507");
}

TEST_CASE("Text rendering appends the distance with two decimals") {
    REQUIRE(render(ranked_crystal_store(1.0), OutputFormat::Text)
            == "5537 W Broadway Ave, Crystal, MN, 55428-3507\nDistance to store: 1.00");
    REQUIRE(render_text(ranked_crystal_store(12.3456)) == "5537 W Broadway Ave, Crystal, MN, 55428-3507\nDistance to store: 12.35");
}

TEST_CASE("JSON rendering of an unranked store has no distance field") {
    const std::string rendered = render(crystal_store(), OutputFormat::Json);
    REQUIRE(rendered
            == R"({"name": "Crystal", "location": "SWC Broadway & Bass Lake Rd", "address": "5537 W Broadway Ave", )"
               R"("city": "Crystal", "state": "MN", "zip_code": "55428-3507", "latitude": 45.0521539, "longitude": -93.364854, )"
               R"("county": "Hennepin County"})");

    const auto document = nlohmann::json::parse(rendered);
    REQUIRE_FALSE(document.contains("distance_to_store"));
}

TEST_CASE("JSON rendering of a ranked store ends with the distance") {
    const std::string rendered = render(ranked_crystal_store(1.0), OutputFormat::Json);
    REQUIRE(rendered
            == R"({"name": "Crystal", "location": "SWC Broadway & Bass Lake Rd", "address": "5537 W Broadway Ave", )"
               R"("city": "Crystal", "state": "MN", "zip_code": "55428-3507", "latitude": 45.0521539, "longitude": -93.364854, )"
               R"("county": "Hennepin County", "distance_to_store": 1.0})");

    const auto document = nlohmann::ordered_json::parse(rendered);

    REQUIRE(document.size() == 10);
    REQUIRE(document.at("distance_to_store").get<double>() == 1.0);
    REQUIRE(document.at("zip_code").get<std::string>() == "55428-3507");
    REQUIRE(document.at("latitude").get<double>() == 45.0521539);
    REQUIRE(std::prev(document.end()).key() == "distance_to_store");
    REQUIRE(document.begin().key() == "name");
}

TEST_CASE("JSON rendering escapes special characters") {
    StoreRecord store = crystal_store();
    store.location = "Broadway \"Metreon\" \\ Suite";
    const auto document = nlohmann::json::parse(render_json(store));
    REQUIRE(document.at("location").get<std::string>() == store.location);
}

TEST_CASE("JSON rendering escapes non-ASCII text") {
    StoreRecord store = crystal_store();
    store.city = "Saint Cloud \xC3\xA9";
    const std::string rendered = render_json(store);
    REQUIRE_THAT(rendered, Catch::Contains(R"("city": "Saint Cloud \u00e9")"));
    REQUIRE(nlohmann::json::parse(rendered).at("city").get<std::string>() == store.city);
}

TEST_CASE("describe names the store and its address regardless of ranking") {
    const std::string expected = "Crystal located at 5537 W Broadway Ave, Crystal, MN, 55428-3507";
    REQUIRE(describe(crystal_store()) == expected);
    REQUIRE(describe(ranked_crystal_store(3.0).record) == expected);
}
