#include "io/map_layers_writer.hpp"
#include "io/geojson_writer.hpp"
#include "geo/wkt_parser.hpp"
#include "geo/centroid.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace facmatch {
namespace io {

namespace {

std::string normalizeTag(const std::string& tag) {
    std::string normalized = geo::trimWhitespace(tag);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return normalized;
}

nlohmann::json markerProperties(const std::string& layer, const std::string& color, int radius,
                                double fill_opacity, const std::string& popup) {
    nlohmann::json properties;
    properties["layer"] = layer;
    properties["marker-color"] = color;
    properties["radius"] = radius;
    properties["fill-opacity"] = fill_opacity;
    properties["popup"] = popup;
    return properties;
}

} // namespace

bool MapLayersWriter::writeMapLayers(const MapLayersWriterConfig& config,
                                     const std::vector<geo::FacilityRecord>& records,
                                     const geo::Projector& projector,
                                     const match::FacilityLocatorTable& table,
                                     const std::vector<geo::MatchRecord>& matches) {
    last_error_.clear();

    if (table.empty()) {
        last_error_ = "No facility anchor to center the map on";
        return false;
    }

    geo::GeospatialDataset dataset = buildMapLayers(config, records, projector, matches);

    const auto& center = table.getAnchor(0).location;
    nlohmann::json foreign_members;
    foreign_members["map_center"] = {center.latitude, center.longitude};
    foreign_members["zoom_start"] = config.zoom_start;

    if (!GeoJSONWriter::writeToFile(dataset, config.output_file_path, foreign_members)) {
        last_error_ = GeoJSONWriter::getLastError();
        return false;
    }

    std::cout << "Map layers saved to " << config.output_file_path
              << " (" << dataset.features.size() << " features)" << std::endl;
    return true;
}

geo::GeospatialDataset MapLayersWriter::buildMapLayers(const MapLayersWriterConfig& config,
                                                       const std::vector<geo::FacilityRecord>& records,
                                                       const geo::Projector& projector,
                                                       const std::vector<geo::MatchRecord>& matches) const {
    std::vector<geo::GeospatialFeature> features;
    size_t feature_id = 0;

    for (const auto& record : records) {
        // Raw facility point
        if (auto point = geo::WKTParser::parsePoint(record.point_wkt)) {
            try {
                geo::GeographicCoordinate location = projector.toGeographic(*point);
                nlohmann::json properties = markerProperties("facility_point", "black", 8, 0.8,
                                                             "Facility point " + record.facility_id);
                properties["facility_id"] = record.facility_id;
                features.emplace_back(feature_id++, geo::geographicPointToGeoJSON(location), properties);
            } catch (const std::runtime_error& e) {
                std::cerr << "Warning: Facility " << record.facility_id << " point not displayed: " << e.what() << std::endl;
            }
        }

        std::vector<geo::Point> vertices = geo::WKTParser::parsePolygon(record.polygon_wkt);
        if (vertices.empty()) {
            continue;
        }

        // Outline only; vertex-wise projection is fine for display
        std::vector<geo::GeographicCoordinate> outline = projector.toGeographic(vertices);
        if (outline.size() <= 2) {
            continue;
        }

        std::string color = classificationColor(record.classification, config);
        nlohmann::json polygon_properties;
        polygon_properties["layer"] = "facility_polygon";
        polygon_properties["facility_id"] = record.facility_id;
        polygon_properties["classification"] = record.classification;
        polygon_properties["stroke"] = color;
        polygon_properties["fill"] = color;
        polygon_properties["fill-opacity"] = 0.4;
        polygon_properties["popup"] = "Facility polygon " + record.facility_id + " - " + record.classification;
        features.emplace_back(feature_id++, geo::geographicPolygonToGeoJSON(outline), polygon_properties);

        // Centroid on planar vertices, then projected
        std::optional<geo::Point> centroid = geo::computeCentroid(vertices);
        if (!centroid) {
            std::cerr << "Warning: Centroid undefined for facility " << record.facility_id << std::endl;
            continue;
        }
        try {
            geo::GeographicCoordinate location = projector.toGeographic(*centroid);
            std::ostringstream popup;
            popup << std::fixed << std::setprecision(5)
                  << "Centroid facility " << record.facility_id
                  << ": (" << location.latitude << ", " << location.longitude << ")";
            nlohmann::json properties = markerProperties("facility_centroid", "orange", 10, 0.9, popup.str());
            properties["facility_id"] = record.facility_id;
            features.emplace_back(feature_id++, geo::geographicPointToGeoJSON(location), properties);
        } catch (const std::runtime_error& e) {
            std::cerr << "Warning: Centroid of facility " << record.facility_id << " not displayed: " << e.what() << std::endl;
        }
    }

    for (const auto& match : matches) {
        nlohmann::json properties = markerProperties("query_point", "purple", 6, 0.8, queryPopupText(match));
        properties["query_index"] = match.query_index;
        properties["facility_id"] = match.facility_id;
        properties["distance_km"] = match.distance_km;
        features.emplace_back(feature_id++, geo::geographicPointToGeoJSON(match.query_location), properties);
    }

    return geo::GeospatialDataset(config.crs, features);
}

std::string MapLayersWriter::classificationColor(const std::string& classification, const MapLayersWriterConfig& config) {
    std::string tag = normalizeTag(classification);
    if (!tag.empty() && tag == normalizeTag(config.first_classification)) {
        return config.first_color;
    }
    if (!tag.empty() && tag == normalizeTag(config.second_classification)) {
        return config.second_color;
    }
    return config.default_color;
}

std::string MapLayersWriter::queryPopupText(const geo::MatchRecord& match) {
    std::ostringstream popup;
    popup << "Query " << match.query_index << "\nFacility: " << match.facility_id
          << " (" << std::fixed << std::setprecision(2) << match.distance_km << " km)";
    return popup.str();
}

} // namespace io
} // namespace facmatch
