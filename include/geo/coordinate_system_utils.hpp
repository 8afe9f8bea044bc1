#ifndef FACMATCH_COORDINATE_SYSTEM_UTILS_HPP
#define FACMATCH_COORDINATE_SYSTEM_UTILS_HPP

#include <string>
#include <gdal.h>
#include <ogr_api.h>
#include <ogr_srs_api.h>

namespace facmatch {
namespace geo {

/**
 * Coordinate system utility functions for reprojection setup and validation
 */
class CoordinateSystemUtils {
public:
    /**
     * Create a spatial reference from a user definition
     * @param definition "EPSG:3857", a PROJ string or WKT
     * @return Spatial reference handle with traditional GIS axis order (caller owns the handle),
     *         nullptr if the definition is not understood
     */
    static OGRSpatialReferenceH createSpatialReference(const std::string& definition);

    /**
     * Check if coordinate system is geographic (latitude/longitude)
     * @param spatial_ref OGRSpatialReference handle
     * @return true if geographic, false otherwise
     */
    static bool isGeographic(OGRSpatialReferenceH spatial_ref);

    /**
     * Check if coordinate system is projected (planar units)
     * @param spatial_ref OGRSpatialReference handle
     * @return true if projected, false otherwise
     */
    static bool isProjected(OGRSpatialReferenceH spatial_ref);

    /**
     * Create coordinate transformation between two user definitions
     * @param source_definition Source coordinate system definition
     * @param target_definition Target coordinate system definition
     * @return Coordinate transformation handle (caller owns the handle), nullptr on failure
     */
    static OGRCoordinateTransformationH createTransformation(const std::string& source_definition,
                                                             const std::string& target_definition);

private:
    // Disable instantiation
    CoordinateSystemUtils() = delete;
};

} // namespace geo
} // namespace facmatch

#endif // FACMATCH_COORDINATE_SYSTEM_UTILS_HPP
