#ifndef FACMATCH_TOOL_INTERFACE_HPP
#define FACMATCH_TOOL_INTERFACE_HPP

#include <string>
#include <nlohmann/json.hpp>
#include "geo/projector.hpp"
#include "io/facility_reader.hpp"
#include "io/query_reader.hpp"
#include "io/match_writer.hpp"
#include "io/map_layers_writer.hpp"

namespace tool_interface {

/**
 * Nearest Facility Tool
 * Reads facilities and query points, matches every query point to its nearest
 * facility and writes the match table (and optionally the map layers)
 * @param writer_config_json JSON string for writer configuration (output_file_path, map_output_file_path, colors)
 * @param facility_config_json JSON string for facility reader configuration
 * @param query_config_json JSON string for query point reader configuration
 * @param projection_config_json JSON string for projection configuration (source_crs, target_crs)
 * @return Result message (success or error)
 */
std::string processNearestFacilityTool(
    const std::string& writer_config_json,
    const std::string& facility_config_json,
    const std::string& query_config_json,
    const std::string& projection_config_json
);

// Configuration parsing helpers, missing keys keep their defaults
facmatch::io::FacilityReaderConfig parseFacilityReaderConfig(const nlohmann::json& config_json);
facmatch::io::QueryReaderConfig parseQueryReaderConfig(const nlohmann::json& config_json);
facmatch::io::MatchWriterConfig parseMatchWriterConfig(const nlohmann::json& config_json);
facmatch::io::MapLayersWriterConfig parseMapLayersWriterConfig(const nlohmann::json& config_json);
facmatch::geo::ProjectorConfig parseProjectorConfig(const nlohmann::json& config_json);

} // namespace tool_interface

#endif // FACMATCH_TOOL_INTERFACE_HPP
