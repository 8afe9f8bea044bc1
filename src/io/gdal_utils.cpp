#include "io/gdal_utils.hpp"
#include <gdal.h>
#include <ogr_api.h>
#include <cpl_error.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <cstring>
#include <mutex>

namespace facmatch {
namespace io {

namespace {

// Output formats by file extension; drivers marked optional may be missing from a GDAL build
struct OutputFormat {
    const char* extension;
    const char* driver_name;
    bool optional_driver;
};

const OutputFormat OUTPUT_FORMATS[] = {
    {".csv", "CSV", false},
    {".shp", "ESRI Shapefile", false},
    {".json", "GeoJSON", false},
    {".geojson", "GeoJSON", false},
    {".geojsonseq", "GeoJSONSeq", false},
    {".flatgeobuf", "FlatGeobuf", false},
    {".gml", "GML", true},
    {".kml", "KML", true},
    {".gpkg", "GPKG", true},
    {".sqlite", "SQLite", true},
};

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

void GDALUtils::ensureDriversRegistered() {
    static std::once_flag registered;
    std::call_once(registered, []() { GDALAllRegister(); });
}

bool GDALUtils::isDriverAvailable(const std::string& driver_name) {
    ensureDriversRegistered();

    GDALDriverH driver = GDALGetDriverByName(driver_name.c_str());
    if (!driver) {
        std::cout << "WARNING: GDAL driver '" << driver_name << "' is not available. Falling back to GeoJSON format." << std::endl;
        return false;
    }

    // Check if the driver supports creation
    const char* creation_support = GDALGetMetadataItem(driver, GDAL_DCAP_CREATE, nullptr);
    if (!creation_support || strcmp(creation_support, "YES") != 0) {
        std::cout << "WARNING: GDAL driver '" << driver_name << "' does not support creation. Falling back to GeoJSON format." << std::endl;
        return false;
    }

    return true;
}

std::string GDALUtils::determineFormatAndModifyPath(std::string& file_path) {
    std::filesystem::path path(file_path);
    std::string extension = toLower(path.extension().string());

    for (const auto& format : OUTPUT_FORMATS) {
        if (extension != format.extension) {
            continue;
        }
        if (!format.optional_driver || isDriverAvailable(format.driver_name)) {
            return format.driver_name;
        }
        break;
    }

    // Unknown extension or missing driver: fall back to GeoJSON
    std::string new_path = path.replace_extension(".geojson").string();
    std::cout << "WARNING: Changing output file extension from '" << extension
              << "' to '.geojson' due to format fallback." << std::endl;
    std::cout << "New output file: " << new_path << std::endl;
    file_path = new_path;

    return "GeoJSON";
}

GDALDatasetH GDALUtils::openDelimitedText(const std::string& file_path) {
    ensureDriversRegistered();

    // The CSV driver only claims files with a .csv extension unless told explicitly
    std::string extension = toLower(std::filesystem::path(file_path).extension().string());
    std::string open_path = (extension == ".csv") ? file_path : "CSV:" + file_path;

    const char* const allowed_drivers[] = {"CSV", nullptr};
    const char* const open_options[] = {"AUTODETECT_TYPE=NO", "KEEP_GEOM_COLUMNS=YES",
                                        "EMPTY_STRING_AS_NULL=NO", nullptr};

    GDALDatasetH dataset = GDALOpenEx(open_path.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY,
                                      allowed_drivers, open_options, nullptr);
    if (!dataset) {
        std::cerr << "Error: Failed to open delimited text file: " << file_path
                  << " (" << CPLGetLastErrorMsg() << ")" << std::endl;
    }
    return dataset;
}

std::vector<std::string> GDALUtils::getFieldNames(OGRLayerH layer) {
    std::vector<std::string> names;
    if (!layer) {
        return names;
    }

    OGRFeatureDefnH definition = OGR_L_GetLayerDefn(layer);
    int field_count = OGR_FD_GetFieldCount(definition);
    for (int i = 0; i < field_count; ++i) {
        names.emplace_back(OGR_Fld_GetNameRef(OGR_FD_GetFieldDefn(definition, i)));
    }
    return names;
}

std::string GDALUtils::getFieldAsString(OGRFeatureH feature, int field_index) {
    if (!feature || field_index < 0 || !OGR_F_IsFieldSetAndNotNull(feature, field_index)) {
        return "";
    }
    const char* value = OGR_F_GetFieldAsString(feature, field_index);
    return value ? std::string(value) : std::string();
}

} // namespace io
} // namespace facmatch
