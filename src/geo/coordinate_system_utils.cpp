#include "geo/coordinate_system_utils.hpp"
#include <gdal.h>
#include <ogr_api.h>
#include <ogr_srs_api.h>
#include <iostream>

namespace facmatch {
namespace geo {

OGRSpatialReferenceH CoordinateSystemUtils::createSpatialReference(const std::string& definition) {
    if (definition.empty()) {
        return nullptr;
    }

    OGRSpatialReferenceH srs = OSRNewSpatialReference(nullptr);
    if (OSRSetFromUserInput(srs, definition.c_str()) != OGRERR_NONE) {
        std::cerr << "Error: Unrecognized coordinate system definition '" << definition << "'" << std::endl;
        OSRDestroySpatialReference(srs);
        return nullptr;
    }

    // Set axis mapping strategy for GDAL 3+ (x = easting/longitude, y = northing/latitude)
    OSRSetAxisMappingStrategy(srs, OAMS_TRADITIONAL_GIS_ORDER);

    return srs;
}

bool CoordinateSystemUtils::isGeographic(OGRSpatialReferenceH spatial_ref) {
    if (!spatial_ref) {
        return false;
    }
    return OSRIsGeographic(spatial_ref) != 0;
}

bool CoordinateSystemUtils::isProjected(OGRSpatialReferenceH spatial_ref) {
    if (!spatial_ref) {
        return false;
    }
    return OSRIsProjected(spatial_ref) != 0;
}

OGRCoordinateTransformationH CoordinateSystemUtils::createTransformation(const std::string& source_definition,
                                                                          const std::string& target_definition) {
    OGRSpatialReferenceH source_srs = createSpatialReference(source_definition);
    if (!source_srs) {
        return nullptr;
    }

    OGRSpatialReferenceH target_srs = createSpatialReference(target_definition);
    if (!target_srs) {
        OSRDestroySpatialReference(source_srs);
        return nullptr;
    }

    if (!isProjected(source_srs)) {
        std::cerr << "Warning: Source coordinate system " << source_definition
                  << " is not projected; centroids will be computed in its native units" << std::endl;
    }

    if (!isGeographic(target_srs)) {
        std::cerr << "Error: Target coordinate system " << target_definition
                  << " must be geographic (latitude/longitude)" << std::endl;
        OSRDestroySpatialReference(source_srs);
        OSRDestroySpatialReference(target_srs);
        return nullptr;
    }

    // Create coordinate transformation
    OGRCoordinateTransformationH coord_trans = OCTNewCoordinateTransformation(source_srs, target_srs);

    // Clean up spatial references
    OSRDestroySpatialReference(source_srs);
    OSRDestroySpatialReference(target_srs);

    return coord_trans;
}

} // namespace geo
} // namespace facmatch
