#ifndef FACMATCH_FACILITY_LOCATOR_HPP
#define FACMATCH_FACILITY_LOCATOR_HPP

#include <string>
#include <vector>
#include <optional>
#include "geo/common.hpp"
#include "geo/projector.hpp"

namespace facmatch {
namespace match {

/**
 * Ordered, read-only list of facility anchors built once per run.
 * Anchor order follows facility row order and decides nearest-neighbor ties.
 */
class FacilityLocatorTable {
public:
    /**
     * Build anchors from facility rows
     * Each row contributes at most one anchor: projected polygon centroid first,
     * projected raw point as fallback. Rows with neither are skipped and recorded
     * as diagnostics.
     * @param records Facility rows in input order
     * @param projector Planar to geographic transformation context
     */
    FacilityLocatorTable(const std::vector<geo::FacilityRecord>& records, const geo::Projector& projector);

    /**
     * Wrap anchors that are already resolved (order preserved)
     * @param anchors Anchors in table order
     */
    explicit FacilityLocatorTable(std::vector<geo::FacilityAnchor> anchors);

    size_t size() const { return anchors_.size(); }
    bool empty() const { return anchors_.empty(); }

    const std::vector<geo::FacilityAnchor>& getAnchors() const { return anchors_; }

    const geo::FacilityAnchor& getAnchor(size_t index) const;

    /**
     * Rows that produced no anchor or fell back from polygon to point
     */
    const std::vector<geo::RowDiagnostic>& getDiagnostics() const { return diagnostics_; }

private:
    std::vector<geo::FacilityAnchor> anchors_;
    std::vector<geo::RowDiagnostic> diagnostics_;

    /**
     * Projected polygon centroid of a row
     * @param record Facility row
     * @param projector Transformation context
     * @param failure_reason Set when the polygon cannot be used
     * @return Centroid location or std::nullopt
     */
    static std::optional<geo::GeographicCoordinate> polygonCentroidLocation(const geo::FacilityRecord& record,
                                                                            const geo::Projector& projector,
                                                                            std::string& failure_reason);

    static std::optional<geo::GeographicCoordinate> rawPointLocation(const geo::FacilityRecord& record,
                                                                     const geo::Projector& projector,
                                                                     std::string& failure_reason);
};

} // namespace match
} // namespace facmatch

#endif // FACMATCH_FACILITY_LOCATOR_HPP
