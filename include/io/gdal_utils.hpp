#ifndef FACMATCH_GDAL_UTILS_HPP
#define FACMATCH_GDAL_UTILS_HPP

#include <string>
#include <vector>
#include <gdal.h>
#include <ogr_api.h>

namespace facmatch {
namespace io {

/**
 * GDAL utility functions for format detection, dataset access and field reads
 */
class GDALUtils {
public:
    /**
     * Register all GDAL drivers once per process
     */
    static void ensureDriversRegistered();

    /**
     * Check if a specific GDAL driver is available and supports creation
     * @param driver_name GDAL driver name
     * @return true if driver is available and supports creation, false otherwise
     */
    static bool isDriverAvailable(const std::string& driver_name);

    /**
     * Determine GDAL output format and modify file path if driver is not available
     * @param file_path File path with extension (will be modified if format fallback occurs)
     * @return GDAL format string
     */
    static std::string determineFormatAndModifyPath(std::string& file_path);

    /**
     * Open a delimited text file as a read-only vector dataset (CSV driver)
     * Column separator is detected by the driver; every field is read as text.
     * @param file_path Path to the file
     * @return Dataset handle (caller closes it), nullptr on failure
     */
    static GDALDatasetH openDelimitedText(const std::string& file_path);

    /**
     * Names of the fields of a layer
     * @param layer Layer handle
     * @return Field names in layer order
     */
    static std::vector<std::string> getFieldNames(OGRLayerH layer);

    /**
     * Read a field as text
     * @param feature Feature handle
     * @param field_index Field index, negative for a missing column
     * @return Field content, empty string for missing columns and null fields
     */
    static std::string getFieldAsString(OGRFeatureH feature, int field_index);

private:
    // Disable instantiation
    GDALUtils() = delete;
};

} // namespace io
} // namespace facmatch

#endif // FACMATCH_GDAL_UTILS_HPP
