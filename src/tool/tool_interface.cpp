#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "tool/tool_interface.hpp"
#include "match/facility_locator.hpp"
#include "match/nearest_neighbor.hpp"

using namespace facmatch;

namespace tool_interface {

// Helper function to parse FacilityReaderConfig from JSON
io::FacilityReaderConfig parseFacilityReaderConfig(const nlohmann::json& config_json) {
    io::FacilityReaderConfig config;

    if (config_json.contains("file_path")) {
        config.file_path = config_json["file_path"];
    }
    if (config_json.contains("id_field")) {
        config.id_field = config_json["id_field"];
    }
    if (config_json.contains("point_field")) {
        config.point_field = config_json["point_field"];
    }
    if (config_json.contains("polygon_field")) {
        config.polygon_field = config_json["polygon_field"];
    }
    if (config_json.contains("classification_field")) {
        config.classification_field = config_json["classification_field"];
    }

    return config;
}

// Helper function to parse QueryReaderConfig from JSON
io::QueryReaderConfig parseQueryReaderConfig(const nlohmann::json& config_json) {
    io::QueryReaderConfig config;

    if (config_json.contains("file_path")) {
        config.file_path = config_json["file_path"];
    }
    if (config_json.contains("latitude_field")) {
        config.latitude_field = config_json["latitude_field"];
    }
    if (config_json.contains("longitude_field")) {
        config.longitude_field = config_json["longitude_field"];
    }
    if (config_json.contains("label_field")) {
        config.label_field = config_json["label_field"];
    }

    return config;
}

io::MatchWriterConfig parseMatchWriterConfig(const nlohmann::json& config_json) {
    io::MatchWriterConfig config;

    if (config_json.contains("output_file_path")) {
        config.output_file_path = config_json["output_file_path"];
    }
    if (config_json.contains("crs")) {
        config.crs = config_json["crs"];
    }

    return config;
}

io::MapLayersWriterConfig parseMapLayersWriterConfig(const nlohmann::json& config_json) {
    io::MapLayersWriterConfig config;

    config.output_file_path = config_json.value("map_output_file_path", config.output_file_path);
    config.crs = config_json.value("crs", config.crs);
    config.first_classification = config_json.value("first_classification", config.first_classification);
    config.first_color = config_json.value("first_color", config.first_color);
    config.second_classification = config_json.value("second_classification", config.second_classification);
    config.second_color = config_json.value("second_color", config.second_color);
    config.default_color = config_json.value("default_color", config.default_color);
    config.zoom_start = config_json.value("zoom_start", config.zoom_start);

    return config;
}

geo::ProjectorConfig parseProjectorConfig(const nlohmann::json& config_json) {
    geo::ProjectorConfig config;

    if (config_json.contains("source_crs")) {
        config.source_crs = config_json["source_crs"];
    }
    if (config_json.contains("target_crs")) {
        config.target_crs = config_json["target_crs"];
    }

    return config;
}

// Nearest Facility Tool
std::string processNearestFacilityTool(
    const std::string& writer_config_json,
    const std::string& facility_config_json,
    const std::string& query_config_json,
    const std::string& projection_config_json) {

    try {
        // Parse configurations
        nlohmann::json writer_config = nlohmann::json::parse(writer_config_json);
        nlohmann::json facility_config = nlohmann::json::parse(facility_config_json);
        nlohmann::json query_config = nlohmann::json::parse(query_config_json);
        nlohmann::json projection_config = nlohmann::json::parse(projection_config_json);

        // Create configurations
        io::FacilityReaderConfig facility_cfg = parseFacilityReaderConfig(facility_config);
        io::QueryReaderConfig query_cfg = parseQueryReaderConfig(query_config);
        geo::ProjectorConfig projector_cfg = parseProjectorConfig(projection_config);

        // Output locations are expressed in the target coordinate system
        writer_config["crs"] = projector_cfg.target_crs;
        io::MatchWriterConfig match_writer_cfg = parseMatchWriterConfig(writer_config);
        io::MapLayersWriterConfig map_writer_cfg = parseMapLayersWriterConfig(writer_config);

        // Read facilities
        io::FacilityReader facility_reader(facility_cfg);
        if (!facility_reader.read()) {
            return "Error: Failed to read facility file: " + facility_cfg.file_path;
        }

        // One transformation context for the whole run
        geo::Projector projector(projector_cfg);

        // Build facility anchors
        match::FacilityLocatorTable table(facility_reader.getRecords(), projector);
        if (table.empty()) {
            return "Error: No valid facility anchor found in " + facility_cfg.file_path;
        }

        // Read query points
        io::QueryReader query_reader(query_cfg);
        if (!query_reader.read()) {
            return "Error: Failed to read query file: " + query_cfg.file_path;
        }

        // Match
        match::NearestNeighborMatcher matcher(table);
        std::vector<geo::MatchRecord> matches = matcher.matchAll(query_reader.getQueryPoints());

        // Write results
        io::MatchWriter match_writer;
        if (!match_writer.writeMatches(match_writer_cfg, matches)) {
            return "Error: Failed to write match results: " + match_writer.getLastError();
        }

        if (!map_writer_cfg.output_file_path.empty()) {
            io::MapLayersWriter map_writer;
            if (!map_writer.writeMapLayers(map_writer_cfg, facility_reader.getRecords(), projector, table, matches)) {
                return "Error: Failed to write map layers: " + map_writer.getLastError();
            }
        }

        return "Success: Matched " + std::to_string(matches.size()) + " of " +
               std::to_string(query_reader.getRowCount()) + " query rows against " +
               std::to_string(table.size()) + " facility anchors";

    } catch (const std::exception& e) {
        return "Error: " + std::string(e.what());
    }
}

} // namespace tool_interface
