#ifndef FACMATCH_MATCH_WRITER_HPP
#define FACMATCH_MATCH_WRITER_HPP

#include <string>
#include <vector>
#include <gdal.h>
#include <ogr_api.h>
#include "geo/common.hpp"

namespace facmatch {
namespace io {

/**
 * Configuration for match record output writer
 */
struct MatchWriterConfig {
    std::string output_file_path = "output_nearest_facility.csv";  // Format follows the extension
    std::string crs = "EPSG:4326";                                 // Coordinate system of query and facility locations

    MatchWriterConfig() = default;
};

/**
 * Match record output writer using GDAL/OGR
 * One feature per match record, point geometry at the query location.
 */
class MatchWriter {
public:
    MatchWriter();
    ~MatchWriter() = default;

    // Disable copy constructor and assignment
    MatchWriter(const MatchWriter&) = delete;
    MatchWriter& operator=(const MatchWriter&) = delete;

    /**
     * Write match records to the output file, replacing an existing file
     * @param config Writer configuration
     * @param matches Match records in query order
     * @return true if successful, false otherwise
     */
    bool writeMatches(const MatchWriterConfig& config, const std::vector<geo::MatchRecord>& matches);

    /**
     * Path actually written (extension may change on format fallback)
     */
    const std::string& getWrittenFilePath() const { return written_file_path_; }

    /**
     * Get the last error message
     * @return Error message string
     */
    std::string getLastError() const { return last_error_; }

    /**
     * Clear the last error message
     */
    void clearError() { last_error_.clear(); }

private:
    std::string last_error_;
    std::string written_file_path_;

    /**
     * Create output dataset and layer with match record fields
     * @param config Writer configuration
     * @param output_file_path Output path, updated if the format falls back
     * @return Dataset handle, nullptr on failure
     */
    GDALDatasetH createMatchDataset(const MatchWriterConfig& config, std::string& output_file_path);

    bool writeMatchFeature(OGRLayerH layer, const geo::MatchRecord& match);
};

} // namespace io
} // namespace facmatch

#endif // FACMATCH_MATCH_WRITER_HPP
