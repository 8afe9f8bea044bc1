#include "geo/projector.hpp"
#include "geo/coordinate_system_utils.hpp"
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace facmatch {
namespace geo {

Projector::Projector(const ProjectorConfig& config)
    : config_(config), transformation_(nullptr) {
    transformation_ = CoordinateSystemUtils::createTransformation(config_.source_crs, config_.target_crs);
    if (!transformation_) {
        throw std::runtime_error("Failed to create coordinate transformation from " +
                                 config_.source_crs + " to " + config_.target_crs);
    }
}

Projector::~Projector() {
    if (transformation_) {
        OCTDestroyCoordinateTransformation(transformation_);
    }
}

GeographicCoordinate Projector::toGeographic(double x, double y) const {
    double lon = x;
    double lat = y;

    // Traditional GIS axis order on both sides: x in, longitude out
    if (!OCTTransform(transformation_, 1, &lon, &lat, nullptr)) {
        std::ostringstream message;
        message << "Coordinate transformation failed for (" << x << ", " << y << ")";
        throw std::runtime_error(message.str());
    }

    if (!std::isfinite(lat) || !std::isfinite(lon)) {
        std::ostringstream message;
        message << "Coordinate transformation produced non-finite result for (" << x << ", " << y << ")";
        throw std::runtime_error(message.str());
    }

    return GeographicCoordinate(lat, lon);
}

GeographicCoordinate Projector::toGeographic(const Point& point) const {
    return toGeographic(bg::get<0>(point), bg::get<1>(point));
}

std::vector<GeographicCoordinate> Projector::toGeographic(const std::vector<Point>& vertices) const {
    std::vector<GeographicCoordinate> projected;
    projected.reserve(vertices.size());

    for (const auto& vertex : vertices) {
        try {
            projected.push_back(toGeographic(vertex));
        } catch (const std::runtime_error& e) {
            std::cerr << "Warning: " << e.what() << ", dropping vertex" << std::endl;
        }
    }

    return projected;
}

} // namespace geo
} // namespace facmatch
