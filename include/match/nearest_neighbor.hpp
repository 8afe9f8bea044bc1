#ifndef FACMATCH_NEAREST_NEIGHBOR_HPP
#define FACMATCH_NEAREST_NEIGHBOR_HPP

#include <cstddef>
#include <vector>
#include "geo/common.hpp"
#include "match/facility_locator.hpp"

namespace facmatch {
namespace match {

// Mean Earth radius used by the haversine distance
constexpr double EARTH_RADIUS_KM = 6371.0;

/**
 * Great-circle distance between two geographic coordinates (haversine, atan2 form)
 * @param a First coordinate in degrees
 * @param b Second coordinate in degrees
 * @return Distance in kilometers
 */
double haversineDistance(const geo::GeographicCoordinate& a, const geo::GeographicCoordinate& b);

// Closest anchor for one query location
struct NearestFacility {
    size_t anchor_index;      // Position of the anchor in the locator table
    double distance_km;

    NearestFacility(size_t index, double distance)
        : anchor_index(index), distance_km(distance) {}
};

/**
 * Exact nearest-neighbor search over a facility locator table.
 *
 * Every query scans all anchors (O(queries x anchors)). Ties are resolved by
 * strict less-than comparison, so the first anchor in table order wins. A
 * spatial index may replace the scan only if it returns the same anchor.
 */
class NearestNeighborMatcher {
public:
    /**
     * @param table Built facility table, must outlive the matcher
     * @throws std::runtime_error if the table holds no anchor
     */
    explicit NearestNeighborMatcher(const FacilityLocatorTable& table);

    // The matcher keeps a reference, a temporary table would dangle
    NearestNeighborMatcher(FacilityLocatorTable&&) = delete;

    /**
     * Find the closest anchor
     * @param query_location Query coordinate in degrees
     * @return Anchor index and distance in kilometers
     */
    NearestFacility nearest(const geo::GeographicCoordinate& query_location) const;

    /**
     * Match every query point, one record per query in input order
     * @param queries Valid query points
     * @return Match records
     */
    std::vector<geo::MatchRecord> matchAll(const std::vector<geo::QueryPoint>& queries) const;

private:
    const FacilityLocatorTable& table_;
};

} // namespace match
} // namespace facmatch

#endif // FACMATCH_NEAREST_NEIGHBOR_HPP
