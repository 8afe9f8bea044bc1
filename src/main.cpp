#include <iostream>
#include <fstream>
#include <string>
#include <unordered_map>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "tool/tool_interface.hpp"

using namespace tool_interface;


void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " --facility-file-path <path> --query-file-path <path> [options]\n"
              << "\nRequired arguments:\n"
              << "  --facility-file-path <path>        Path to the facility CSV (point and polygon text columns)\n"
              << "  --query-file-path <path>           Path to the query point CSV (latitude/longitude columns)\n"
              << "\nOptional arguments:\n"
              << "  --output-file <path>               Match table output with extension (default: output_nearest_facility.csv)\n"
              << "  --map-output-file <path>           Map layers output (GeoJSON); not written if omitted\n"
              << "  --facility-id-field <name>         Field name for facility ID (default: FID, falls back to OGR FID)\n"
              << "  --facility-point-field <name>      Field name for POINT text (default: the_geom)\n"
              << "  --facility-polygon-field <name>    Field name for POLYGON text (default: osm_original_geom)\n"
              << "  --facility-classification-field <name> Field name for polygon classification (default: telecom-medium)\n"
              << "  --query-latitude-field <name>      Field name for latitude (default: Latitude)\n"
              << "  --query-longitude-field <name>     Field name for longitude (default: Longitude)\n"
              << "  --query-label-field <name>         Field name for label (default: Libelle)\n"
              << "  --source-crs <crs>                 Coordinate system of facility geometries (default: EPSG:3857)\n"
              << "  --target-crs <crs>                 Geographic coordinate system of query points (default: EPSG:4326)\n"
              << "  --config <path>                    JSON file with 'facility', 'query', 'writer' and 'projection' sections\n"
              << "\nExample:\n"
              << "  " << programName << " --facility-file-path facilities.csv --query-file-path field_points.csv --output-file matches.csv --map-output-file map.geojson\n"
              << "\nUse --help for detailed parameter explanations.\n"
              << "Use --version to display version information.\n";
}

void printDetailedHelp(const char* programName) {
    std::cout << "FacMatch - Nearest Facility Reconciliation Tool\n"
              << "===============================================\n\n"
              << "Matches every field-measured GPS point to its nearest facility by great-circle distance.\n\n"
              << "FACILITY DATASET:\n"
              << "  - Delimited text with a facility ID, a POINT(x y) column and a POLYGON((...)) column\n"
              << "  - Polygon text may carry a coordinate system prefix (e.g. SRID=3857;POLYGON((...)))\n"
              << "  - Geometries are planar coordinates in the source coordinate system\n"
              << "  - A facility is located at its polygon centroid, or at its point when the polygon is\n"
              << "    missing or degenerate; rows with neither are skipped\n\n"
              << "QUERY DATASET:\n"
              << "  - Delimited text with latitude and longitude in decimal degrees\n"
              << "  - Rows with missing or non-numeric coordinates are ignored\n\n"
              << "OUTPUT:\n"
              << "  - Match table: query_index, query_lat, query_lon, label, facility_id,\n"
              << "    facility_lat, facility_lon, distance_km\n"
              << "  - Map layers (optional): facility points, polygons colored by classification,\n"
              << "    centroids and query points with match annotations\n\n"
              << "CONFIG FILE:\n"
              << "  {\"facility\": {\"file_path\": ..., \"id_field\": ...},\n"
              << "   \"query\": {\"file_path\": ..., \"latitude_field\": ...},\n"
              << "   \"writer\": {\"output_file_path\": ..., \"map_output_file_path\": ...},\n"
              << "   \"projection\": {\"source_crs\": \"EPSG:3857\", \"target_crs\": \"EPSG:4326\"}}\n"
              << "  Command line arguments override config file values.\n\n"
              << "Example:\n"
              << "  " << programName << " --facility-file-path facilities.csv --query-file-path field_points.csv --map-output-file map.geojson\n\n"
              << "OTHER OPTIONS:\n"
              << "  --help, -h     Show this detailed help message\n"
              << "  --version, -v  Show version information\n";
}

std::unordered_map<std::string, std::string> parseArgs(int argc, char* argv[]) {
    std::unordered_map<std::string, std::string> args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg.substr(0, 2) == "--" || arg == "-h" || arg == "-v") {
            std::string key = arg.substr(arg.find_first_not_of('-'));

            // Check if this is a flag argument (no value) or a key-value argument
            if (i + 1 < argc && argv[i + 1][0] != '-') {
                args[key] = argv[i + 1];
                i++; // Skip the value in next iteration
            } else {
                args[key] = "true";
            }
        }
    }

    return args;
}

nlohmann::json loadConfigFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }
    nlohmann::json config = nlohmann::json::parse(file);
    if (!config.is_object()) {
        throw std::runtime_error("Config file must contain a JSON object: " + path);
    }
    return config;
}

nlohmann::json configSection(const nlohmann::json& config, const std::string& name) {
    if (config.contains(name) && config[name].is_object()) {
        return config[name];
    }
    return nlohmann::json::object();
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        auto args = parseArgs(argc, argv);

        // Check for help flag first
        if (args.count("help") > 0 || args.count("h") > 0) {
            printDetailedHelp(argv[0]);
            return 0;
        }

        // Check for version flag
        if (args.count("version") > 0 || args.count("v") > 0) {
            std::cout << "FacMatch v1.0.0\n";
            std::cout << "Nearest Facility Reconciliation Tool\n";
            return 0;
        }

        nlohmann::json file_config = nlohmann::json::object();
        if (args.count("config")) {
            file_config = loadConfigFile(args.at("config"));
        }

        nlohmann::json facility_config = configSection(file_config, "facility");
        nlohmann::json query_config = configSection(file_config, "query");
        nlohmann::json writer_config = configSection(file_config, "writer");
        nlohmann::json projection_config = configSection(file_config, "projection");

        // Command line arguments override the config file
        if (args.count("facility-file-path")) facility_config["file_path"] = args.at("facility-file-path");
        if (args.count("facility-id-field")) facility_config["id_field"] = args.at("facility-id-field");
        if (args.count("facility-point-field")) facility_config["point_field"] = args.at("facility-point-field");
        if (args.count("facility-polygon-field")) facility_config["polygon_field"] = args.at("facility-polygon-field");
        if (args.count("facility-classification-field")) facility_config["classification_field"] = args.at("facility-classification-field");

        if (args.count("query-file-path")) query_config["file_path"] = args.at("query-file-path");
        if (args.count("query-latitude-field")) query_config["latitude_field"] = args.at("query-latitude-field");
        if (args.count("query-longitude-field")) query_config["longitude_field"] = args.at("query-longitude-field");
        if (args.count("query-label-field")) query_config["label_field"] = args.at("query-label-field");

        if (args.count("output-file")) writer_config["output_file_path"] = args.at("output-file");
        if (args.count("map-output-file")) writer_config["map_output_file_path"] = args.at("map-output-file");

        if (args.count("source-crs")) projection_config["source_crs"] = args.at("source-crs");
        if (args.count("target-crs")) projection_config["target_crs"] = args.at("target-crs");

        // Check for required arguments
        if (!facility_config.contains("file_path")) {
            std::cerr << "Error: --facility-file-path is required" << std::endl;
            printUsage(argv[0]);
            return 1;
        }

        if (!query_config.contains("file_path")) {
            std::cerr << "Error: --query-file-path is required" << std::endl;
            printUsage(argv[0]);
            return 1;
        }

        std::string result = processNearestFacilityTool(
            writer_config.dump(),
            facility_config.dump(),
            query_config.dump(),
            projection_config.dump()
        );

        std::cout << result << std::endl;

        // Check if result indicates an error
        if (result.substr(0, 5) == "Error") {
            return 1;
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
