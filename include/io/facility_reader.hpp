#ifndef FACMATCH_FACILITY_READER_HPP
#define FACMATCH_FACILITY_READER_HPP

#include <string>
#include <vector>
#include "geo/common.hpp"

namespace facmatch {
namespace io {

// Facility reader configuration
struct FacilityReaderConfig {
    std::string file_path;                                  // Input file path (CSV)
    std::string id_field = "FID";                           // Field name for facility ID (uses OGR FID if missing)
    std::string point_field = "the_geom";                   // Field name for POINT text
    std::string polygon_field = "osm_original_geom";        // Field name for POLYGON text
    std::string classification_field = "telecom-medium";    // Field name for presentation tag (optional)

    FacilityReaderConfig() = default;
};

class FacilityReader {
public:
    explicit FacilityReader(const FacilityReaderConfig& config);
    ~FacilityReader();

    // Disable copy constructor and assignment
    FacilityReader(const FacilityReader&) = delete;
    FacilityReader& operator=(const FacilityReader&) = delete;

    /**
     * Read facility rows from file
     * Geometry text is kept as-is; parsing happens when anchors are built.
     * @return true if successful, false otherwise
     */
    bool read();

    /**
     * Get all facility rows in file order
     * @return Vector of facility rows
     */
    const std::vector<geo::FacilityRecord>& getRecords() const { return records_; }

private:
    FacilityReaderConfig config_;
    std::vector<geo::FacilityRecord> records_;
};

} // namespace io
} // namespace facmatch

#endif // FACMATCH_FACILITY_READER_HPP
