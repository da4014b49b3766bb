#include <catch2/catch.hpp>

#include <algorithm>
#include <string>
#include <vector>

#include "store_locator/nearest_finder.hpp"

using namespace store_locator;

namespace {

StoreRecord make_store(std::string name, double latitude, double longitude) {
    StoreRecord store{};
    store.name = std::move(name);
    store.address = store.name + " Ave";
    store.city = "Minneapolis";
    store.state = "MN";
    store.zip_code = "55401";
    store.latitude = latitude;
    store.longitude = longitude;
    store.county = "Hennepin County";
    return store;
}

/** @brief Candidate type unrelated to stores, to exercise the generic search. */
struct Landmark final {
    std::string label{};
    GeoPoint position{0.0, 0.0};

    [[nodiscard]] GeoPoint point() const noexcept { return position; }
};

}  // namespace

TEST_CASE("find_nearest picks the candidate with the smallest injected distance") {
    const std::vector<StoreRecord> stores{
        make_store("first", 1.0, 1.0),
        make_store("second", 2.0, 2.0),
        make_store("third", 3.0, 3.0),
    };
    const std::vector<double> injected_distances{2.0, 1.0, 3.0};
    std::size_t call_count = 0;

    const RankedStore nearest = find_nearest(
        GeoPoint{0.0, 0.0},
        stores,
        UnitSystem::Miles,
        [&](const GeoPoint&, const GeoPoint&, UnitSystem) { return injected_distances.at(call_count++); }
    );

    REQUIRE(call_count == stores.size());
    REQUIRE(nearest.record.name == "second");
    REQUIRE(nearest.distance == 1.0);
    REQUIRE(nearest.units == UnitSystem::Miles);
}

TEST_CASE("find_nearest reports the minimum haversine distance") {
    const GeoPoint query{44.9778, -93.2650};
    const std::vector<StoreRecord> stores{
        make_store("duluth", 46.808614, -92.1681479),
        make_store("crystal", 45.0521539, -93.364854),
        make_store("san-francisco", 37.784046, -122.4036),
    };

    for (const UnitSystem units : {UnitSystem::Miles, UnitSystem::Kilometers}) {
        const RankedStore nearest = find_nearest(query, stores, units);

        double expected_minimum = great_circle_circumference(units);
        for (const StoreRecord& store : stores) {
            expected_minimum = std::min(expected_minimum, distance_between(query, store.point(), units));
        }
        REQUIRE(nearest.record.name == "crystal");
        REQUIRE(nearest.distance == expected_minimum);
        REQUIRE(nearest.distance == distance_between(query, nearest.record.point(), units));
        REQUIRE(nearest.units == units);
    }
}

TEST_CASE("find_nearest keeps the first of equally distant candidates") {
    const GeoPoint query{0.0, 0.0};
    const std::vector<StoreRecord> stores{
        make_store("far", 10.0, 10.0),
        make_store("east", 0.0, 1.0),
        make_store("west", 0.0, -1.0),
    };

    const RankedStore nearest = find_nearest(query, stores, UnitSystem::Kilometers);
    REQUIRE(nearest.record.name == "east");

    const std::vector<StoreRecord> reversed{stores[2], stores[1], stores[0]};
    REQUIRE(find_nearest(query, reversed, UnitSystem::Kilometers).record.name == "west");
}

TEST_CASE("find_nearest keeps the first candidate when injected distances tie exactly") {
    const std::vector<StoreRecord> stores{make_store("a", 0.0, 0.0), make_store("b", 0.0, 0.0), make_store("c", 0.0, 0.0)};
    const std::vector<double> injected_distances{5.0, 4.0, 4.0};
    std::size_t call_count = 0;

    const RankedStore nearest = find_nearest(
        GeoPoint{1.0, 1.0},
        stores,
        UnitSystem::Miles,
        [&](const GeoPoint&, const GeoPoint&, UnitSystem) { return injected_distances.at(call_count++); }
    );
    REQUIRE(nearest.record.name == "b");
    REQUIRE(nearest.distance == 4.0);
}

TEST_CASE("find_nearest fails on an empty candidate set") {
    const std::vector<StoreRecord> stores{};
    REQUIRE_THROWS_AS(find_nearest(GeoPoint{0.0, 0.0}, stores, UnitSystem::Miles), EmptyInputError);
}

TEST_CASE("find_nearest copies the winner and leaves candidates untouched") {
    const std::vector<StoreRecord> stores{make_store("only", 45.0, -93.0)};
    const std::vector<StoreRecord> snapshot = stores;

    RankedStore nearest = find_nearest(GeoPoint{45.0, -93.0}, stores);
    nearest.record.name = "renamed";

    REQUIRE(stores == snapshot);
    REQUIRE(nearest.distance == Approx(0.0).margin(1e-9));
}

TEST_CASE("find_nearest works for any record exposing a point") {
    const std::vector<Landmark> landmarks{
        Landmark{"golden-gate", GeoPoint{37.8199, -122.4783}},
        Landmark{"space-needle", GeoPoint{47.6205, -122.3493}},
    };

    const Ranked<Landmark> nearest = find_nearest(GeoPoint{47.6062, -122.3321}, landmarks, UnitSystem::Kilometers);
    REQUIRE(nearest.record.label == "space-needle");
    REQUIRE(nearest.distance < 5.0);
}
