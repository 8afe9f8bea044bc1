#ifndef FACMATCH_WKT_PARSER_HPP
#define FACMATCH_WKT_PARSER_HPP

#include <string>
#include <vector>
#include <optional>
#include "geo/common.hpp"

namespace facmatch {
namespace geo {

/**
 * Permissive reader for the point and polygon text found in facility exports.
 * Malformed input never throws: it yields an absent point or an empty vertex list.
 */
class WKTParser {
public:
    /**
     * Parse "POINT(x y)"
     * @param text Geometry text (surrounding whitespace ignored)
     * @return Planar point, or std::nullopt if the text is not a valid point
     */
    static std::optional<Point> parsePoint(const std::string& text);

    /**
     * Parse "POLYGON((x1 y1,x2 y2,...))", optionally prefixed by "<crs>;"
     * The prefix is stripped without being interpreted. Coordinate pairs that
     * fail numeric conversion are skipped and reported on std::cerr.
     * @param text Geometry text
     * @return Vertices in input order, empty if the text is not a polygon
     */
    static std::vector<Point> parsePolygon(const std::string& text);

private:
    /**
     * Convert one coordinate token, ignoring parentheses glued to it
     * @param token Token such as "12.5" or "(12.5"
     * @return Numeric value or std::nullopt
     */
    static std::optional<double> parseCoordinateToken(const std::string& token);

    /**
     * Split on runs of whitespace
     * @param text Text to split
     * @return Non-empty tokens
     */
    static std::vector<std::string> splitWhitespace(const std::string& text);

    // Disable instantiation
    WKTParser() = delete;
};

} // namespace geo
} // namespace facmatch

#endif // FACMATCH_WKT_PARSER_HPP
