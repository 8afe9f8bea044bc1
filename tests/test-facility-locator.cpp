#include <catch2/catch.hpp>

#include "match/facility_locator.hpp"

#include <stdexcept>

using namespace facmatch;

TEST_CASE("polygon centroid is the preferred anchor", "[locator]")
{
    geo::Projector const projector;
    std::vector<geo::FacilityRecord> const records{
        geo::FacilityRecord{0, "F1", "POINT(100 100)", "POLYGON((0 0,10 0,10 10,0 10))", "fibre"}};

    match::FacilityLocatorTable const table{records, projector};

    REQUIRE(table.size() == 1);
    auto const &anchor = table.getAnchor(0);
    REQUIRE(anchor.facility_id == "F1");
    REQUIRE(anchor.source == geo::AnchorSource::POLYGON_CENTROID);
    REQUIRE(anchor.location.latitude == Approx(4.4916e-05).epsilon(1e-4));
    REQUIRE(anchor.location.longitude == Approx(4.4916e-05).epsilon(1e-4));
    REQUIRE(table.getDiagnostics().empty());
}

TEST_CASE("empty polygon falls back to the point", "[locator]")
{
    geo::Projector const projector;
    std::vector<geo::FacilityRecord> const records{
        geo::FacilityRecord{0, "F1", "POINT(2 3)", "", "copper"}};

    match::FacilityLocatorTable const table{records, projector};

    REQUIRE(table.size() == 1);
    auto const &anchor = table.getAnchor(0);
    REQUIRE(anchor.source == geo::AnchorSource::RAW_POINT);
    REQUIRE(anchor.location.longitude == Approx(1.7966e-05).epsilon(1e-3));
    REQUIRE(anchor.location.latitude == Approx(2.6949e-05).epsilon(1e-3));

    // A missing polygon is not worth a diagnostic
    REQUIRE(table.getDiagnostics().empty());
}

TEST_CASE("degenerate polygon falls back to the point", "[locator]")
{
    geo::Projector const projector;
    std::vector<geo::FacilityRecord> const records{
        geo::FacilityRecord{0, "COLLINEAR", "POINT(2 3)", "POLYGON((0 0,1 1,2 2,3 3))", ""},
        geo::FacilityRecord{1, "SHORT", "POINT(2 3)", "POLYGON((0 0,1 1))", ""},
        geo::FacilityRecord{2, "GARBLED", "POINT(2 3)", "POLYGON((a b,c d,e f))", ""}};

    match::FacilityLocatorTable const table{records, projector};

    REQUIRE(table.size() == 3);
    for (auto const &anchor : table.getAnchors()) {
        REQUIRE(anchor.source == geo::AnchorSource::RAW_POINT);
    }

    auto const &diagnostics = table.getDiagnostics();
    REQUIRE(diagnostics.size() == 3);
    REQUIRE(diagnostics[0].identifier == "COLLINEAR");
    REQUIRE(diagnostics[0].reason.find("degenerate") != std::string::npos);
    REQUIRE(diagnostics[1].reason.find("fewer than 3") != std::string::npos);
    REQUIRE(diagnostics[2].reason.find("no valid polygon") != std::string::npos);
}

TEST_CASE("rows without usable geometry are skipped", "[locator]")
{
    geo::Projector const projector;
    std::vector<geo::FacilityRecord> const records{
        geo::FacilityRecord{0, "A", "POINT(0 0)", "", ""},
        geo::FacilityRecord{1, "B", "", "", ""},
        geo::FacilityRecord{2, "C", "POINT(x y)", "POLYGON((0 0,1 1,2 2))", ""},
        geo::FacilityRecord{3, "D", "POINT(10 10)", "", ""}};

    match::FacilityLocatorTable const table{records, projector};

    REQUIRE(table.size() == 2);
    REQUIRE(table.getAnchor(0).facility_id == "A");
    REQUIRE(table.getAnchor(1).facility_id == "D");
    REQUIRE(table.getAnchor(1).row_index == 3);

    auto const &diagnostics = table.getDiagnostics();
    REQUIRE(diagnostics.size() == 2);
    REQUIRE(diagnostics[0].row_index == 1);
    REQUIRE(diagnostics[1].row_index == 2);
    REQUIRE(diagnostics[1].reason.find("no valid point") != std::string::npos);
}

TEST_CASE("anchor order follows row order", "[locator]")
{
    geo::Projector const projector;
    std::vector<geo::FacilityRecord> const records{
        geo::FacilityRecord{0, "Z", "POINT(5 5)", "", ""},
        geo::FacilityRecord{1, "M", "", "SRID=3857;POLYGON((0 0,4 0,4 4,0 4,0 0))", ""},
        geo::FacilityRecord{2, "A", "POINT(1 1)", "", ""}};

    match::FacilityLocatorTable const table{records, projector};

    REQUIRE(table.size() == 3);
    REQUIRE(table.getAnchor(0).facility_id == "Z");
    REQUIRE(table.getAnchor(1).facility_id == "M");
    REQUIRE(table.getAnchor(1).source == geo::AnchorSource::POLYGON_CENTROID);
    REQUIRE(table.getAnchor(2).facility_id == "A");
}

TEST_CASE("no facility rows builds an empty table", "[locator]")
{
    geo::Projector const projector;

    match::FacilityLocatorTable const table{std::vector<geo::FacilityRecord>{}, projector};

    REQUIRE(table.empty());
    REQUIRE_THROWS_AS(table.getAnchor(0), std::out_of_range);
}
