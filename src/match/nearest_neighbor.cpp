#include "match/nearest_neighbor.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace facmatch {
namespace match {

namespace {

constexpr double PI = 3.14159265358979323846;
constexpr double DEG_TO_RAD = PI / 180.0;

} // namespace

double haversineDistance(const geo::GeographicCoordinate& a, const geo::GeographicCoordinate& b) {
    double phi1 = a.latitude * DEG_TO_RAD;
    double phi2 = b.latitude * DEG_TO_RAD;
    double dphi = (b.latitude - a.latitude) * DEG_TO_RAD;
    double dlambda = (b.longitude - a.longitude) * DEG_TO_RAD;

    double sin_dphi = std::sin(dphi / 2.0);
    double sin_dlambda = std::sin(dlambda / 2.0);
    double h = sin_dphi * sin_dphi + std::cos(phi1) * std::cos(phi2) * sin_dlambda * sin_dlambda;

    // Rounding can push h slightly outside [0, 1] near antipodal points
    h = std::min(1.0, std::max(0.0, h));

    double c = 2.0 * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));
    return EARTH_RADIUS_KM * c;
}

NearestNeighborMatcher::NearestNeighborMatcher(const FacilityLocatorTable& table)
    : table_(table) {
    if (table_.empty()) {
        throw std::runtime_error("No valid facility anchor found, matching cannot start");
    }
}

NearestFacility NearestNeighborMatcher::nearest(const geo::GeographicCoordinate& query_location) const {
    const auto& anchors = table_.getAnchors();

    size_t best_index = 0;
    double best_distance = std::numeric_limits<double>::infinity();

    for (size_t i = 0; i < anchors.size(); ++i) {
        double distance = haversineDistance(query_location, anchors[i].location);
        // Strict comparison keeps the first anchor on ties
        if (distance < best_distance) {
            best_distance = distance;
            best_index = i;
        }
    }

    return NearestFacility(best_index, best_distance);
}

std::vector<geo::MatchRecord> NearestNeighborMatcher::matchAll(const std::vector<geo::QueryPoint>& queries) const {
    std::vector<geo::MatchRecord> matches;
    matches.reserve(queries.size());

    for (const auto& query : queries) {
        NearestFacility result = nearest(query.location);
        matches.emplace_back(query, table_.getAnchor(result.anchor_index), result.distance_km);
    }

    std::cout << "Matched " << matches.size() << " query points against "
              << table_.size() << " facility anchors" << std::endl;

    return matches;
}

} // namespace match
} // namespace facmatch
