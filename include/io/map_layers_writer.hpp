#ifndef FACMATCH_MAP_LAYERS_WRITER_HPP
#define FACMATCH_MAP_LAYERS_WRITER_HPP

#include <string>
#include <vector>
#include "geo/common.hpp"
#include "geo/projector.hpp"
#include "match/facility_locator.hpp"

namespace facmatch {
namespace io {

/**
 * Configuration for map overlay writer
 */
struct MapLayersWriterConfig {
    std::string output_file_path;               // Output file path (GeoJSON), empty disables the writer
    std::string crs = "EPSG:4326";              // Coordinate system of the written coordinates
    std::string first_classification = "copper";
    std::string first_color = "red";
    std::string second_classification = "fibre";
    std::string second_color = "green";
    std::string default_color = "blue";
    int zoom_start = 13;

    MapLayersWriterConfig() = default;
};

/**
 * Writes everything a map renderer needs as one GeoJSON FeatureCollection.
 * Each feature carries a "layer" property: facility_point, facility_polygon,
 * facility_centroid or query_point, plus style and popup properties.
 */
class MapLayersWriter {
public:
    MapLayersWriter() = default;
    ~MapLayersWriter() = default;

    // Disable copy constructor and assignment
    MapLayersWriter(const MapLayersWriter&) = delete;
    MapLayersWriter& operator=(const MapLayersWriter&) = delete;

    /**
     * Write map layers
     * @param config Writer configuration
     * @param records Facility rows (geometries are re-read for display)
     * @param projector Transformation context
     * @param table Built facility table (map center is its first anchor)
     * @param matches Match records
     * @return true if successful, false otherwise
     */
    bool writeMapLayers(const MapLayersWriterConfig& config,
                        const std::vector<geo::FacilityRecord>& records,
                        const geo::Projector& projector,
                        const match::FacilityLocatorTable& table,
                        const std::vector<geo::MatchRecord>& matches);

    /**
     * Build the map layer features without writing them
     */
    geo::GeospatialDataset buildMapLayers(const MapLayersWriterConfig& config,
                                          const std::vector<geo::FacilityRecord>& records,
                                          const geo::Projector& projector,
                                          const std::vector<geo::MatchRecord>& matches) const;

    /**
     * Presentation color of a facility classification
     * Comparison ignores surrounding whitespace and case.
     * @param classification Classification tag
     * @param config Designated values and colors
     * @return Color name
     */
    static std::string classificationColor(const std::string& classification, const MapLayersWriterConfig& config);

    /**
     * Popup text of a matched query point
     */
    static std::string queryPopupText(const geo::MatchRecord& match);

    std::string getLastError() const { return last_error_; }

private:
    std::string last_error_;
};

} // namespace io
} // namespace facmatch

#endif // FACMATCH_MAP_LAYERS_WRITER_HPP
