#include "geo/centroid.hpp"
#include <algorithm>
#include <cmath>

namespace facmatch {
namespace geo {

namespace {

size_t countDistinctVertices(const std::vector<Point>& vertices) {
    std::vector<std::pair<double, double>> coords;
    coords.reserve(vertices.size());
    for (const auto& vertex : vertices) {
        coords.emplace_back(bg::get<0>(vertex), bg::get<1>(vertex));
    }
    std::sort(coords.begin(), coords.end());
    return static_cast<size_t>(std::unique(coords.begin(), coords.end()) - coords.begin());
}

} // namespace

Polygon buildPolygon(const std::vector<Point>& vertices) {
    Polygon polygon;
    LinearRing outer(vertices.begin(), vertices.end());

    // Ensure the ring is closed (Boost geometry requirement)
    if (outer.size() > 0 &&
        (bg::get<0>(outer.front()) != bg::get<0>(outer.back()) ||
         bg::get<1>(outer.front()) != bg::get<1>(outer.back()))) {
        outer.push_back(outer.front());
    }

    polygon.outer() = outer;

    // Orientation of the input ring is not guaranteed
    bg::correct(polygon);

    return polygon;
}

std::optional<Point> computeCentroid(const std::vector<Point>& vertices) {
    // Non-finite values first, they cannot be ordered when counting distinct vertices
    for (const auto& vertex : vertices) {
        if (!std::isfinite(bg::get<0>(vertex)) || !std::isfinite(bg::get<1>(vertex))) {
            return std::nullopt;
        }
    }

    if (countDistinctVertices(vertices) < 3) {
        return std::nullopt;
    }

    Polygon polygon = buildPolygon(vertices);

    // Collinear rings have no area and no defined centroid
    double area = bg::area(polygon);
    if (!std::isfinite(area) || area == 0.0) {
        return std::nullopt;
    }

    Point centroid;
    try {
        bg::centroid(polygon, centroid);
    } catch (const bg::centroid_exception&) {
        return std::nullopt;
    }

    if (!std::isfinite(bg::get<0>(centroid)) || !std::isfinite(bg::get<1>(centroid))) {
        return std::nullopt;
    }

    return centroid;
}

} // namespace geo
} // namespace facmatch
