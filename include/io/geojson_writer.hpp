#ifndef FACMATCH_GEOJSON_WRITER_HPP
#define FACMATCH_GEOJSON_WRITER_HPP

#include <string>
#include <nlohmann/json.hpp>
#include "geo/common.hpp"

namespace facmatch {
namespace io {

/**
 * GeoJSON writer for converting GeospatialDataset objects to GeoJSON files
 */
class GeoJSONWriter {
public:
    /**
     * Write a GeospatialDataset to a GeoJSON file
     * @param dataset Dataset to write
     * @param filepath Path to the output GeoJSON file
     * @param foreign_members Extra top-level members (e.g. map center), may be null
     * @return true if successful, false otherwise
     */
    static bool writeToFile(const geo::GeospatialDataset& dataset, const std::string& filepath,
                            const nlohmann::json& foreign_members = nlohmann::json());

    /**
     * Convert a GeospatialDataset to a GeoJSON object
     * @param dataset Dataset to convert
     * @return GeoJSON FeatureCollection
     */
    static nlohmann::json toGeoJSON(const geo::GeospatialDataset& dataset);

    /**
     * Set CRS information in a GeoJSON object
     * @param geojson JSON object to modify
     * @param crs CRS string (e.g., "EPSG:4326")
     */
    static void setCRS(nlohmann::json& geojson, const std::string& crs);

    /**
     * Get the last error message
     * @return Error message from the last operation
     */
    static std::string getLastError() {
        return last_error_;
    }

private:
    static std::string last_error_;

    /**
     * Convert a GeospatialFeature to GeoJSON format
     * @param feature Feature to convert
     * @return JSON object representing the feature
     */
    static nlohmann::json featureToGeoJSON(const geo::GeospatialFeature& feature);

    /**
     * Set error message
     * @param error Error message to set
     */
    static void setError(const std::string& error) {
        last_error_ = error;
    }

    // Disable instantiation
    GeoJSONWriter() = delete;
};

} // namespace io
} // namespace facmatch

#endif // FACMATCH_GEOJSON_WRITER_HPP
