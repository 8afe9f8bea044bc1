#include "geo/common.hpp"
#include <cctype>
#include <stdexcept>

namespace facmatch {
namespace geo {

// GeoJSON positions are [longitude, latitude]
nlohmann::json geographicPointToGeoJSON(const GeographicCoordinate& coordinate) {
    nlohmann::json geometry;
    geometry["type"] = "Point";
    geometry["coordinates"] = {coordinate.longitude, coordinate.latitude};
    return geometry;
}

nlohmann::json geographicPolygonToGeoJSON(const std::vector<GeographicCoordinate>& outer_ring) {
    nlohmann::json geometry;
    geometry["type"] = "Polygon";
    nlohmann::json coordinates = nlohmann::json::array();

    // Outer ring
    nlohmann::json ring = nlohmann::json::array();
    for (const auto& coordinate : outer_ring) {
        ring.push_back({coordinate.longitude, coordinate.latitude});
    }

    // Ensure the ring is closed
    if (!outer_ring.empty() &&
        (outer_ring.front().latitude != outer_ring.back().latitude ||
         outer_ring.front().longitude != outer_ring.back().longitude)) {
        ring.push_back({outer_ring.front().longitude, outer_ring.front().latitude});
    }

    coordinates.push_back(ring);
    geometry["coordinates"] = coordinates;
    return geometry;
}

// Text Field Utilities
std::string trimWhitespace(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::optional<double> parseDouble(const std::string& text) {
    std::string trimmed = trimWhitespace(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    try {
        size_t consumed = 0;
        double value = std::stod(trimmed, &consumed);
        // Reject trailing garbage such as "12abc"
        if (consumed != trimmed.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // namespace geo
} // namespace facmatch
