#include <catch2/catch.hpp>

#include "common-cleanup.hpp"

#include "tool/tool_interface.hpp"

#include <nlohmann/json.hpp>

using namespace facmatch;

namespace {

// Web mercator coordinates around central Paris and Lyon
char const *const facility_csv =
    "FID,the_geom,osm_original_geom,telecom-medium\n"
    "F1,POINT(261845.7 6250566.7),\"SRID=3857;POLYGON((261745.7 6250466.7,261945.7 6250466.7,"
    "261945.7 6250666.7,261745.7 6250666.7,261745.7 6250466.7))\",fibre\n"
    "F2,POINT(538307.7 5742610.4),,copper\n"
    "F3,,,copper\n";

char const *const query_csv =
    "Latitude,Longitude,Libelle\n"
    "48.8606,2.3376,Louvre\n"
    "not-a-number,2.3376,Broken\n"
    "45.7600,4.8300,Bellecour\n";

nlohmann::json facilityConfig(std::string const &path)
{
    nlohmann::json config;
    config["file_path"] = path;
    return config;
}

nlohmann::json queryConfig(std::string const &path)
{
    nlohmann::json config;
    config["file_path"] = path;
    return config;
}

} // anonymous namespace

TEST_CASE("nearest facility tool end to end", "[tool]")
{
    testing::cleanup::file_t const facilities{"test-tool-facilities.csv"};
    testing::cleanup::file_t const queries{"test-tool-queries.csv"};
    testing::cleanup::file_t const output{"test-tool-output.geojson"};
    testing::cleanup::file_t const map{"test-tool-map.geojson"};
    testing::writeTextFile(facilities.path(), facility_csv);
    testing::writeTextFile(queries.path(), query_csv);

    nlohmann::json writer_config;
    writer_config["output_file_path"] = output.path();
    writer_config["map_output_file_path"] = map.path();

    std::string const result = tool_interface::processNearestFacilityTool(
        writer_config.dump(), facilityConfig(facilities.path()).dump(),
        queryConfig(queries.path()).dump(), nlohmann::json::object().dump());

    REQUIRE(result == "Success: Matched 2 of 3 query rows against 2 facility anchors");

    auto const matches = nlohmann::json::parse(testing::readTextFile(output.path()));
    REQUIRE(matches["features"].size() == 2);

    auto const &louvre = matches["features"][0]["properties"];
    REQUIRE(louvre["query_index"] == 0);
    REQUIRE(louvre["label"] == "Louvre");
    REQUIRE(louvre["facility_id"] == "F1");
    REQUIRE(louvre["distance_km"].get<double>() == Approx(1.157).margin(0.02));

    auto const &bellecour = matches["features"][1]["properties"];
    REQUIRE(bellecour["query_index"] == 2);
    REQUIRE(bellecour["facility_id"] == "F2");

    auto const map_layers = nlohmann::json::parse(testing::readTextFile(map.path()));
    REQUIRE(map_layers["zoom_start"] == 13);
    REQUIRE(map_layers["map_center"][0].get<double>() == Approx(48.8566).margin(1e-3));
}

TEST_CASE("nearest facility tool writes the match table", "[tool]")
{
    testing::cleanup::file_t const facilities{"test-tool-table-facilities.csv"};
    testing::cleanup::file_t const queries{"test-tool-table-queries.csv"};
    testing::cleanup::file_t const output{"test-tool-table-output.csv"};
    testing::writeTextFile(facilities.path(), facility_csv);
    testing::writeTextFile(queries.path(), query_csv);

    nlohmann::json writer_config;
    writer_config["output_file_path"] = output.path();

    std::string const result = tool_interface::processNearestFacilityTool(
        writer_config.dump(), facilityConfig(facilities.path()).dump(),
        queryConfig(queries.path()).dump(), "{}");

    REQUIRE(result.rfind("Success", 0) == 0);

    std::string const content = testing::readTextFile(output.path());
    REQUIRE(content.find("Louvre") != std::string::npos);
    REQUIRE(content.find("Bellecour") != std::string::npos);
    REQUIRE(content.find("Broken") == std::string::npos);
}

TEST_CASE("nearest facility tool fails without facility anchors", "[tool]")
{
    testing::cleanup::file_t const facilities{"test-tool-empty-facilities.csv"};
    testing::cleanup::file_t const queries{"test-tool-empty-queries.csv"};
    testing::writeTextFile(facilities.path(),
                           "FID,the_geom,osm_original_geom\n"
                           "F1,,\n");
    testing::writeTextFile(queries.path(), query_csv);

    std::string const result = tool_interface::processNearestFacilityTool(
        "{}", facilityConfig(facilities.path()).dump(), queryConfig(queries.path()).dump(), "{}");

    REQUIRE(result.rfind("Error: No valid facility anchor", 0) == 0);
}

TEST_CASE("nearest facility tool reports unreadable input", "[tool]")
{
    std::string const result = tool_interface::processNearestFacilityTool(
        "{}", facilityConfig("test-tool-missing.csv").dump(), queryConfig("test-tool-missing.csv").dump(), "{}");

    REQUIRE(result.rfind("Error", 0) == 0);
}

TEST_CASE("nearest facility tool rejects malformed configuration", "[tool]")
{
    std::string const result = tool_interface::processNearestFacilityTool("{", "{}", "{}", "{}");

    REQUIRE(result.rfind("Error", 0) == 0);
}

TEST_CASE("configuration parsing keeps defaults for missing keys", "[tool]")
{
    nlohmann::json facility;
    facility["file_path"] = "facilities.csv";
    facility["id_field"] = "site_id";

    auto const facility_config = tool_interface::parseFacilityReaderConfig(facility);
    REQUIRE(facility_config.file_path == "facilities.csv");
    REQUIRE(facility_config.id_field == "site_id");
    REQUIRE(facility_config.point_field == "the_geom");
    REQUIRE(facility_config.polygon_field == "osm_original_geom");

    auto const query_config = tool_interface::parseQueryReaderConfig(nlohmann::json::object());
    REQUIRE(query_config.latitude_field == "Latitude");
    REQUIRE(query_config.label_field == "Libelle");

    nlohmann::json writer;
    writer["map_output_file_path"] = "map.geojson";
    writer["second_color"] = "#00ff00";

    auto const match_config = tool_interface::parseMatchWriterConfig(writer);
    REQUIRE(match_config.output_file_path == "output_nearest_facility.csv");

    auto const map_config = tool_interface::parseMapLayersWriterConfig(writer);
    REQUIRE(map_config.output_file_path == "map.geojson");
    REQUIRE(map_config.second_color == "#00ff00");
    REQUIRE(map_config.first_color == "red");

    nlohmann::json projection;
    projection["source_crs"] = "EPSG:2154";
    auto const projector_config = tool_interface::parseProjectorConfig(projection);
    REQUIRE(projector_config.source_crs == "EPSG:2154");
    REQUIRE(projector_config.target_crs == "EPSG:4326");
}
