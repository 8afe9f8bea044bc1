#ifndef FACMATCH_QUERY_READER_HPP
#define FACMATCH_QUERY_READER_HPP

#include <string>
#include <vector>
#include <optional>
#include "geo/common.hpp"

namespace facmatch {
namespace io {

// Query point reader configuration
struct QueryReaderConfig {
    std::string file_path;                      // Input file path (CSV, separator detected)
    std::string latitude_field = "Latitude";    // Field name for latitude in decimal degrees
    std::string longitude_field = "Longitude";  // Field name for longitude in decimal degrees
    std::string label_field = "Libelle";        // Field name for free-text label (optional)

    QueryReaderConfig() = default;
};

class QueryReader {
public:
    explicit QueryReader(const QueryReaderConfig& config);
    ~QueryReader();

    // Disable copy constructor and assignment
    QueryReader(const QueryReader&) = delete;
    QueryReader& operator=(const QueryReader&) = delete;

    /**
     * Read query points from file
     * Rows whose coordinates are missing, non-numeric or non-finite are dropped
     * and recorded as diagnostics.
     * @return true if successful, false otherwise
     */
    bool read();

    /**
     * Convert raw coordinate text into a query location
     * @param latitude_text Latitude as read from the file
     * @param longitude_text Longitude as read from the file
     * @param failure_reason Set when the row is rejected
     * @return Location or std::nullopt
     */
    static std::optional<geo::GeographicCoordinate> parseLocation(const std::string& latitude_text,
                                                                  const std::string& longitude_text,
                                                                  std::string& failure_reason);

    size_t getQueryCount() const { return queries_.size(); }

    /**
     * Number of data rows in the file, valid or not
     */
    size_t getRowCount() const { return row_count_; }

    const std::vector<geo::QueryPoint>& getQueryPoints() const { return queries_; }

    const std::vector<geo::RowDiagnostic>& getDiagnostics() const { return diagnostics_; }

private:
    QueryReaderConfig config_;
    std::vector<geo::QueryPoint> queries_;
    std::vector<geo::RowDiagnostic> diagnostics_;
    size_t row_count_ = 0;
};

} // namespace io
} // namespace facmatch

#endif // FACMATCH_QUERY_READER_HPP
