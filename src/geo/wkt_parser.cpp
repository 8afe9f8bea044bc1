#include "geo/wkt_parser.hpp"
#include <iostream>
#include <sstream>

namespace facmatch {
namespace geo {

namespace {

const std::string POINT_PREFIX = "POINT(";
const std::string POINT_SUFFIX = ")";
const std::string POLYGON_PREFIX = "POLYGON((";
const std::string POLYGON_SUFFIX = "))";

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

std::optional<Point> WKTParser::parsePoint(const std::string& text) {
    std::string wkt = trimWhitespace(text);

    // "POINT()" is the shortest acceptable frame
    if (wkt.size() < POINT_PREFIX.size() + POINT_SUFFIX.size() ||
        !startsWith(wkt, POINT_PREFIX) || !endsWith(wkt, POINT_SUFFIX)) {
        return std::nullopt;
    }

    std::string coords = wkt.substr(POINT_PREFIX.size(),
                                    wkt.size() - POINT_PREFIX.size() - POINT_SUFFIX.size());
    std::vector<std::string> parts = splitWhitespace(coords);
    if (parts.size() != 2) {
        return std::nullopt;
    }

    std::optional<double> x = parseCoordinateToken(parts[0]);
    std::optional<double> y = parseCoordinateToken(parts[1]);
    if (!x || !y) {
        return std::nullopt;
    }

    return Point(*x, *y);
}

std::vector<Point> WKTParser::parsePolygon(const std::string& text) {
    std::vector<Point> vertices;
    std::string wkt = trimWhitespace(text);

    // Strip the coordinate system prefix, e.g. "SRID=3857;"
    size_t separator = wkt.find(';');
    if (separator != std::string::npos) {
        wkt = trimWhitespace(wkt.substr(separator + 1));
    }

    if (wkt.size() < POLYGON_PREFIX.size() + POLYGON_SUFFIX.size() ||
        !startsWith(wkt, POLYGON_PREFIX) || !endsWith(wkt, POLYGON_SUFFIX)) {
        return vertices;
    }

    std::string coords = wkt.substr(POLYGON_PREFIX.size(),
                                    wkt.size() - POLYGON_PREFIX.size() - POLYGON_SUFFIX.size());

    std::stringstream stream(coords);
    std::string pair;
    while (std::getline(stream, pair, ',')) {
        std::vector<std::string> parts = splitWhitespace(pair);
        if (parts.size() != 2) {
            continue;
        }

        std::optional<double> x = parseCoordinateToken(parts[0]);
        std::optional<double> y = parseCoordinateToken(parts[1]);
        if (!x || !y) {
            std::cerr << "Warning: Could not convert coordinate pair '" << trimWhitespace(pair)
                      << "' to numbers, skipping it" << std::endl;
            continue;
        }

        vertices.emplace_back(*x, *y);
    }

    return vertices;
}

std::optional<double> WKTParser::parseCoordinateToken(const std::string& token) {
    size_t begin = token.find_first_not_of("()");
    if (begin == std::string::npos) {
        return std::nullopt;
    }
    size_t end = token.find_last_not_of("()");
    return parseDouble(token.substr(begin, end - begin + 1));
}

std::vector<std::string> WKTParser::splitWhitespace(const std::string& text) {
    std::vector<std::string> tokens;
    std::istringstream stream(text);
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

} // namespace geo
} // namespace facmatch
