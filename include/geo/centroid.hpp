#ifndef FACMATCH_CENTROID_HPP
#define FACMATCH_CENTROID_HPP

#include <vector>
#include <optional>
#include "geo/common.hpp"

namespace facmatch {
namespace geo {

/**
 * Build a closed, correctly oriented polygon from an outer ring
 * @param vertices Outer ring vertices, closing vertex optional
 * @return Polygon usable by Boost Geometry algorithms
 */
Polygon buildPolygon(const std::vector<Point>& vertices);

/**
 * Area-weighted centroid of a planar polygon, computed on the raw (unprojected) vertices
 * @param vertices Outer ring vertices, closing vertex optional
 * @return Centroid, or std::nullopt for degenerate input (fewer than 3 distinct
 *         vertices, zero or non-finite area)
 */
std::optional<Point> computeCentroid(const std::vector<Point>& vertices);

} // namespace geo
} // namespace facmatch

#endif // FACMATCH_CENTROID_HPP
