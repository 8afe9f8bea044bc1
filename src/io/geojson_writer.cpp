#include "io/geojson_writer.hpp"
#include <fstream>
#include <stdexcept>

namespace facmatch {
namespace io {

std::string GeoJSONWriter::last_error_ = "";

bool GeoJSONWriter::writeToFile(const geo::GeospatialDataset& dataset, const std::string& filepath,
                                const nlohmann::json& foreign_members) {
    try {
        nlohmann::json geojson = toGeoJSON(dataset);
        if (foreign_members.is_object()) {
            for (auto it = foreign_members.begin(); it != foreign_members.end(); ++it) {
                geojson[it.key()] = it.value();
            }
        }

        std::ofstream file(filepath);
        if (!file.is_open()) {
            setError("Failed to open file for writing: " + filepath);
            return false;
        }

        // Invalid UTF-8 from input fields is replaced, not fatal
        file << geojson.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
        file.close();

        if (file.fail()) {
            setError("Failed to write file: " + filepath);
            return false;
        }

        return true;

    } catch (const std::exception& e) {
        setError("Error writing file " + filepath + ": " + e.what());
        return false;
    }
}

nlohmann::json GeoJSONWriter::toGeoJSON(const geo::GeospatialDataset& dataset) {
    nlohmann::json geojson;

    geojson["type"] = "FeatureCollection";

    // Set CRS if provided
    if (!dataset.crs.empty()) {
        setCRS(geojson, dataset.crs);
    }

    nlohmann::json features = nlohmann::json::array();
    for (const auto& feature : dataset.features) {
        features.push_back(featureToGeoJSON(feature));
    }
    geojson["features"] = features;

    return geojson;
}

void GeoJSONWriter::setCRS(nlohmann::json& geojson, const std::string& crs) {
    if (crs.empty()) {
        return;
    }

    // Standard GeoJSON CRS format: {"type": "name", "properties": {"name": "EPSG:4326"}}
    nlohmann::json crs_obj;
    crs_obj["type"] = "name";
    crs_obj["properties"]["name"] = crs;

    geojson["crs"] = crs_obj;
}

nlohmann::json GeoJSONWriter::featureToGeoJSON(const geo::GeospatialFeature& feature) {
    nlohmann::json feature_json;

    feature_json["type"] = "Feature";
    feature_json["geometry"] = feature.geometry;

    // Set properties (including ID)
    nlohmann::json properties = feature.properties.is_object() ? feature.properties : nlohmann::json::object();
    properties["id"] = feature.id;
    feature_json["properties"] = properties;

    return feature_json;
}

} // namespace io
} // namespace facmatch
