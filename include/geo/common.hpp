#ifndef FACMATCH_COMMON_HPP
#define FACMATCH_COMMON_HPP

#include <cstddef>
#include <string>
#include <vector>
#include <optional>
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/point.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <nlohmann/json.hpp>

namespace facmatch {
namespace geo {

// Boost Geometry namespace alias
namespace bg = boost::geometry;

// Planar geometry types (source projected coordinate system)
using Point = bg::model::point<double, 2, bg::cs::cartesian>;
using Polygon = bg::model::polygon<Point>;
using LinearRing = bg::model::ring<Point>;

// Origin of a facility anchor
enum class AnchorSource {
    POLYGON_CENTROID,   // Centroid of the facility polygon, projected after computation
    RAW_POINT           // Facility point geometry, projected directly
};

/**
 * Latitude/longitude pair in degrees in the target (geographic) coordinate system
 */
struct GeographicCoordinate {
    double latitude;
    double longitude;

    GeographicCoordinate() : latitude(0.0), longitude(0.0) {}

    GeographicCoordinate(double lat, double lon)
        : latitude(lat), longitude(lon) {}
};

// Facility row as read from the facility dataset
struct FacilityRecord {
    size_t row_index;             // 0-based data row position
    std::string facility_id;      // Opaque facility key
    std::string point_wkt;        // POINT(x y) text, may be empty
    std::string polygon_wkt;      // [SRID=...;]POLYGON((...)) text, may be empty
    std::string classification;   // Presentation tag (e.g. transmission medium)

    FacilityRecord(size_t row, const std::string& id, const std::string& point,
                   const std::string& polygon, const std::string& tag)
        : row_index(row), facility_id(id), point_wkt(point), polygon_wkt(polygon), classification(tag) {}
};

// Resolved single location of a facility used as matching target
struct FacilityAnchor {
    std::string facility_id;
    GeographicCoordinate location;
    AnchorSource source;
    size_t row_index;             // Facility row the anchor was built from

    FacilityAnchor(const std::string& id, const GeographicCoordinate& loc, AnchorSource anchor_source, size_t row)
        : facility_id(id), location(loc), source(anchor_source), row_index(row) {}
};

// Valid row of the query dataset
struct QueryPoint {
    size_t row_index;
    GeographicCoordinate location;
    std::string label;

    QueryPoint(size_t row, const GeographicCoordinate& loc, const std::string& query_label = "")
        : row_index(row), location(loc), label(query_label) {}
};

// Nearest facility for one query point
struct MatchRecord {
    size_t query_index;
    GeographicCoordinate query_location;
    std::string query_label;
    std::string facility_id;
    GeographicCoordinate facility_location;
    double distance_km;

    MatchRecord(const QueryPoint& query, const FacilityAnchor& anchor, double distance)
        : query_index(query.row_index), query_location(query.location), query_label(query.label),
          facility_id(anchor.facility_id), facility_location(anchor.location), distance_km(distance) {}
};

// Non-fatal per-row condition (skipped row, fallback, dropped query)
struct RowDiagnostic {
    size_t row_index;
    std::string identifier;
    std::string reason;

    RowDiagnostic(size_t row, const std::string& id, const std::string& why)
        : row_index(row), identifier(id), reason(why) {}
};

// GeoJSON feature held as raw JSON geometry and properties
struct GeospatialFeature {
    size_t id;
    nlohmann::json geometry;
    nlohmann::json properties;

    GeospatialFeature(size_t feature_id, const nlohmann::json& geom, const nlohmann::json& props)
        : id(feature_id), geometry(geom), properties(props) {}
};

// Feature collection with its coordinate system (e.g. "EPSG:4326")
struct GeospatialDataset {
    std::string crs;
    std::vector<GeospatialFeature> features;

    GeospatialDataset() = default;

    GeospatialDataset(const std::string& dataset_crs, const std::vector<GeospatialFeature>& dataset_features)
        : crs(dataset_crs), features(dataset_features) {}
};

// Geometry conversion utilities for GeoJSON (geometry_conversion.cpp)
nlohmann::json geographicPointToGeoJSON(const GeographicCoordinate& coordinate);
nlohmann::json geographicPolygonToGeoJSON(const std::vector<GeographicCoordinate>& outer_ring);

// Text field utilities (geometry_conversion.cpp)
std::string trimWhitespace(const std::string& text);
std::optional<double> parseDouble(const std::string& text);

} // namespace geo
} // namespace facmatch

#endif // FACMATCH_COMMON_HPP
