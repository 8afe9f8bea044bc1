#include <catch2/catch.hpp>

#include "match/facility_locator.hpp"
#include "match/nearest_neighbor.hpp"

#include <stdexcept>
#include <type_traits>

using namespace facmatch;

namespace {

geo::FacilityAnchor anchor(std::string const &id, double latitude, double longitude, size_t row)
{
    return geo::FacilityAnchor{id, geo::GeographicCoordinate{latitude, longitude},
                               geo::AnchorSource::RAW_POINT, row};
}

} // anonymous namespace

TEST_CASE("query near Paris matches the Paris facility", "[matcher]")
{
    match::FacilityLocatorTable const table{
        {anchor("F1", 48.8566, 2.3522, 0), anchor("F2", 45.7640, 4.8357, 1)}};
    match::NearestNeighborMatcher const matcher{table};

    auto const result = matcher.nearest(geo::GeographicCoordinate{48.8606, 2.3376});

    REQUIRE(table.getAnchor(result.anchor_index).facility_id == "F1");
    REQUIRE(result.distance_km == Approx(1.157).margin(0.01));
}

TEST_CASE("query coinciding with an anchor has zero distance", "[matcher]")
{
    match::FacilityLocatorTable const table{
        {anchor("F1", 48.8566, 2.3522, 0), anchor("F2", 45.7640, 4.8357, 1)}};
    match::NearestNeighborMatcher const matcher{table};

    auto const result = matcher.nearest(geo::GeographicCoordinate{45.7640, 4.8357});

    REQUIRE(result.anchor_index == 1);
    REQUIRE(result.distance_km == Approx(0.0).margin(1e-9));
}

TEST_CASE("first anchor in table order wins ties", "[matcher]")
{
    // Equidistant east and west of the query on the equator
    match::FacilityLocatorTable const table{
        {anchor("WEST", 0.0, -1.0, 0), anchor("EAST", 0.0, 1.0, 1), anchor("DUP", 0.0, -1.0, 2)}};
    match::NearestNeighborMatcher const matcher{table};

    geo::GeographicCoordinate const query{0.0, 0.0};
    auto const first = matcher.nearest(query);
    auto const second = matcher.nearest(query);

    REQUIRE(table.getAnchor(first.anchor_index).facility_id == "WEST");
    REQUIRE(first.anchor_index == second.anchor_index);
    REQUIRE(first.distance_km == second.distance_km);
}

TEST_CASE("nearest is the minimum over all anchors", "[matcher]")
{
    match::FacilityLocatorTable const table{
        {anchor("A", 10.0, 10.0, 0), anchor("B", 20.0, 20.0, 1),
         anchor("C", 30.0, 30.0, 2), anchor("D", 21.0, 19.0, 3)}};
    match::NearestNeighborMatcher const matcher{table};

    geo::GeographicCoordinate const query{21.2, 19.1};
    auto const result = matcher.nearest(query);

    for (auto const &candidate : table.getAnchors()) {
        REQUIRE(result.distance_km <= match::haversineDistance(query, candidate.location));
    }
    REQUIRE(table.getAnchor(result.anchor_index).facility_id == "D");
}

TEST_CASE("match all keeps query order and carries labels", "[matcher]")
{
    match::FacilityLocatorTable const table{
        {anchor("F1", 48.8566, 2.3522, 0), anchor("F2", 45.7640, 4.8357, 1)}};
    match::NearestNeighborMatcher const matcher{table};

    std::vector<geo::QueryPoint> const queries{
        geo::QueryPoint{0, geo::GeographicCoordinate{45.76, 4.83}, "near Lyon"},
        geo::QueryPoint{2, geo::GeographicCoordinate{48.8606, 2.3376}, "near Paris"}};

    auto const matches = matcher.matchAll(queries);

    REQUIRE(matches.size() == 2);
    REQUIRE(matches[0].query_index == 0);
    REQUIRE(matches[0].facility_id == "F2");
    REQUIRE(matches[0].query_label == "near Lyon");
    REQUIRE(matches[1].query_index == 2);
    REQUIRE(matches[1].facility_id == "F1");
    REQUIRE(matches[1].facility_location.latitude == Approx(48.8566));
    REQUIRE(matches[1].query_location.longitude == Approx(2.3376));
    REQUIRE(matches[1].distance_km == Approx(1.157).margin(0.01));
}

TEST_CASE("match all without queries yields no records", "[matcher]")
{
    match::FacilityLocatorTable const table{{anchor("F1", 48.8566, 2.3522, 0)}};
    match::NearestNeighborMatcher const matcher{table};

    REQUIRE(matcher.matchAll({}).empty());
}

TEST_CASE("empty table fails fast", "[matcher]")
{
    match::FacilityLocatorTable const table{std::vector<geo::FacilityAnchor>{}};

    REQUIRE(table.empty());
    REQUIRE_THROWS_AS(match::NearestNeighborMatcher{table}, std::runtime_error);
}

TEST_CASE("matcher only binds to a table that outlives it", "[matcher]")
{
    STATIC_REQUIRE(std::is_constructible<match::NearestNeighborMatcher,
                                         match::FacilityLocatorTable const &>::value);
    STATIC_REQUIRE_FALSE(std::is_constructible<match::NearestNeighborMatcher,
                                               match::FacilityLocatorTable &&>::value);
}
