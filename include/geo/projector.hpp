#ifndef FACMATCH_PROJECTOR_HPP
#define FACMATCH_PROJECTOR_HPP

#include <string>
#include <vector>
#include <ogr_srs_api.h>
#include "geo/common.hpp"

namespace facmatch {
namespace geo {

// Projector configuration
struct ProjectorConfig {
    std::string source_crs = "EPSG:3857";   // Planar system of the facility geometries
    std::string target_crs = "EPSG:4326";   // Geographic system of anchors and query points

    ProjectorConfig() = default;
};

/**
 * Planar to geographic reprojection over one transformation context.
 * The context is created once and reused for every call; the projector is
 * read-only after construction.
 */
class Projector {
public:
    /**
     * Create the transformation context
     * @param config Source and target coordinate systems
     * @throws std::runtime_error if the transformation cannot be created
     */
    explicit Projector(const ProjectorConfig& config = ProjectorConfig());
    ~Projector();

    // Disable copy constructor and assignment
    Projector(const Projector&) = delete;
    Projector& operator=(const Projector&) = delete;

    /**
     * Project one planar coordinate
     * @param x Easting in the source system
     * @param y Northing in the source system
     * @return Latitude/longitude in the target system
     * @throws std::runtime_error if the transformation fails or yields non-finite values
     */
    GeographicCoordinate toGeographic(double x, double y) const;

    GeographicCoordinate toGeographic(const Point& point) const;

    /**
     * Project every vertex of a planar ring, dropping vertices that fail
     * Only suitable for display outlines; centroids must be computed before projection.
     * @param vertices Planar vertices
     * @return Projected vertices in input order
     */
    std::vector<GeographicCoordinate> toGeographic(const std::vector<Point>& vertices) const;

    const std::string& getSourceCRS() const { return config_.source_crs; }
    const std::string& getTargetCRS() const { return config_.target_crs; }

private:
    ProjectorConfig config_;
    OGRCoordinateTransformationH transformation_;
};

} // namespace geo
} // namespace facmatch

#endif // FACMATCH_PROJECTOR_HPP
