#include "match/facility_locator.hpp"
#include "geo/wkt_parser.hpp"
#include "geo/centroid.hpp"
#include <iostream>
#include <stdexcept>
#include <utility>

namespace facmatch {
namespace match {

FacilityLocatorTable::FacilityLocatorTable(const std::vector<geo::FacilityRecord>& records,
                                           const geo::Projector& projector) {
    anchors_.reserve(records.size());

    for (const auto& record : records) {
        std::string polygon_failure;
        std::optional<geo::GeographicCoordinate> location =
            polygonCentroidLocation(record, projector, polygon_failure);
        if (location) {
            anchors_.emplace_back(record.facility_id, *location, geo::AnchorSource::POLYGON_CENTROID, record.row_index);
            continue;
        }

        // Parse failure and degenerate polygon share this fallback
        std::string point_failure;
        location = rawPointLocation(record, projector, point_failure);
        if (location) {
            if (!record.polygon_wkt.empty()) {
                std::cerr << "Warning: Facility " << record.facility_id << " (row " << record.row_index
                          << "): " << polygon_failure << ", using point geometry" << std::endl;
                diagnostics_.emplace_back(record.row_index, record.facility_id,
                                          polygon_failure + ", using point geometry");
            }
            anchors_.emplace_back(record.facility_id, *location, geo::AnchorSource::RAW_POINT, record.row_index);
            continue;
        }

        std::string reason = polygon_failure + "; " + point_failure;
        std::cerr << "Warning: Facility " << record.facility_id << " (row " << record.row_index
                  << ") skipped: " << reason << std::endl;
        diagnostics_.emplace_back(record.row_index, record.facility_id, reason);
    }

    std::cout << "Facility locator table: " << anchors_.size() << " anchors from "
              << records.size() << " facility rows" << std::endl;
}

FacilityLocatorTable::FacilityLocatorTable(std::vector<geo::FacilityAnchor> anchors)
    : anchors_(std::move(anchors)) {
}

const geo::FacilityAnchor& FacilityLocatorTable::getAnchor(size_t index) const {
    if (index >= anchors_.size()) {
        throw std::out_of_range("Facility anchor index out of range");
    }
    return anchors_[index];
}

std::optional<geo::GeographicCoordinate> FacilityLocatorTable::polygonCentroidLocation(
    const geo::FacilityRecord& record, const geo::Projector& projector, std::string& failure_reason) {

    std::vector<geo::Point> vertices = geo::WKTParser::parsePolygon(record.polygon_wkt);
    if (vertices.size() < 3) {
        failure_reason = vertices.empty() ? "no valid polygon" : "polygon has fewer than 3 coordinate pairs";
        return std::nullopt;
    }

    // Centroid on planar vertices first, then project the single centroid
    std::optional<geo::Point> centroid = geo::computeCentroid(vertices);
    if (!centroid) {
        failure_reason = "degenerate polygon, centroid undefined";
        return std::nullopt;
    }

    try {
        return projector.toGeographic(*centroid);
    } catch (const std::runtime_error& e) {
        failure_reason = std::string("centroid projection failed: ") + e.what();
        return std::nullopt;
    }
}

std::optional<geo::GeographicCoordinate> FacilityLocatorTable::rawPointLocation(
    const geo::FacilityRecord& record, const geo::Projector& projector, std::string& failure_reason) {

    std::optional<geo::Point> point = geo::WKTParser::parsePoint(record.point_wkt);
    if (!point) {
        failure_reason = "no valid point";
        return std::nullopt;
    }

    try {
        return projector.toGeographic(*point);
    } catch (const std::runtime_error& e) {
        failure_reason = std::string("point projection failed: ") + e.what();
        return std::nullopt;
    }
}

} // namespace match
} // namespace facmatch
