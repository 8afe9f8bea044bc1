#include "io/match_writer.hpp"
#include "io/gdal_utils.hpp"
#include "geo/coordinate_system_utils.hpp"
#include <gdal.h>
#include <ogr_api.h>
#include <ogr_srs_api.h>
#include <filesystem>
#include <iostream>

namespace facmatch {
namespace io {

namespace {

struct FieldDefinition {
    const char* name;
    OGRFieldType type;
};

const FieldDefinition MATCH_FIELDS[] = {
    {"query_index", OFTInteger64},
    {"query_lat", OFTReal},
    {"query_lon", OFTReal},
    {"label", OFTString},
    {"facility_id", OFTString},
    {"facility_lat", OFTReal},
    {"facility_lon", OFTReal},
    {"distance_km", OFTReal},
};

} // namespace

MatchWriter::MatchWriter() {
    // Register GDAL drivers
    GDALUtils::ensureDriversRegistered();
}

bool MatchWriter::writeMatches(const MatchWriterConfig& config, const std::vector<geo::MatchRecord>& matches) {
    clearError();

    std::string output_file_path = config.output_file_path;
    GDALDatasetH dataset = createMatchDataset(config, output_file_path);
    if (!dataset) {
        return false;
    }

    OGRLayerH layer = GDALDatasetGetLayer(dataset, 0);
    if (!layer) {
        last_error_ = "Failed to get layer from dataset";
        GDALClose(dataset);
        return false;
    }

    bool success = true;
    for (const auto& match : matches) {
        if (!writeMatchFeature(layer, match)) {
            success = false;
            break;
        }
    }

    GDALClose(dataset);

    if (success) {
        written_file_path_ = output_file_path;
        std::cout << "Wrote " << matches.size() << " match records to " << output_file_path << std::endl;
    }

    return success;
}

GDALDatasetH MatchWriter::createMatchDataset(const MatchWriterConfig& config, std::string& output_file_path) {
    // Determine format from file extension and modify path if needed
    std::string format = GDALUtils::determineFormatAndModifyPath(output_file_path);

    GDALDriverH driver = GDALGetDriverByName(format.c_str());
    if (!driver) {
        last_error_ = "Failed to get GDAL driver for format: " + format;
        return nullptr;
    }

    // Drivers refuse to create over an existing file
    if (std::filesystem::exists(output_file_path)) {
        if (GDALDeleteDataset(driver, output_file_path.c_str()) != CE_None) {
            std::error_code error;
            std::filesystem::remove(output_file_path, error);
            if (error) {
                last_error_ = "Failed to replace existing output file: " + output_file_path;
                return nullptr;
            }
        }
    }

    GDALDatasetH dataset = GDALCreate(driver, output_file_path.c_str(), 0, 0, 0, GDT_Unknown, nullptr);
    if (!dataset) {
        last_error_ = "Failed to create GDAL dataset: " + output_file_path;
        return nullptr;
    }

    OGRSpatialReferenceH layer_srs = geo::CoordinateSystemUtils::createSpatialReference(config.crs);

    OGRLayerH layer = GDALDatasetCreateLayer(dataset, "nearest_facility", layer_srs, wkbPoint, nullptr);
    if (layer_srs) {
        OSRDestroySpatialReference(layer_srs);
    }
    if (!layer) {
        last_error_ = "Failed to create layer in dataset";
        GDALClose(dataset);
        return nullptr;
    }

    for (const auto& definition : MATCH_FIELDS) {
        OGRFieldDefnH field = OGR_Fld_Create(definition.name, definition.type);
        OGRErr err = OGR_L_CreateField(layer, field, 1);
        OGR_Fld_Destroy(field);
        if (err != OGRERR_NONE) {
            last_error_ = std::string("Failed to create field: ") + definition.name;
            GDALClose(dataset);
            return nullptr;
        }
    }

    return dataset;
}

bool MatchWriter::writeMatchFeature(OGRLayerH layer, const geo::MatchRecord& match) {
    OGRFeatureDefnH layer_defn = OGR_L_GetLayerDefn(layer);
    OGRFeatureH feature = OGR_F_Create(layer_defn);

    OGRGeometryH point = OGR_G_CreateGeometry(wkbPoint);
    OGR_G_SetPoint_2D(point, 0, match.query_location.longitude, match.query_location.latitude);
    OGR_F_SetGeometryDirectly(feature, point);

    OGR_F_SetFieldInteger64(feature, OGR_F_GetFieldIndex(feature, "query_index"), static_cast<GIntBig>(match.query_index));
    OGR_F_SetFieldDouble(feature, OGR_F_GetFieldIndex(feature, "query_lat"), match.query_location.latitude);
    OGR_F_SetFieldDouble(feature, OGR_F_GetFieldIndex(feature, "query_lon"), match.query_location.longitude);
    OGR_F_SetFieldString(feature, OGR_F_GetFieldIndex(feature, "label"), match.query_label.c_str());
    OGR_F_SetFieldString(feature, OGR_F_GetFieldIndex(feature, "facility_id"), match.facility_id.c_str());
    OGR_F_SetFieldDouble(feature, OGR_F_GetFieldIndex(feature, "facility_lat"), match.facility_location.latitude);
    OGR_F_SetFieldDouble(feature, OGR_F_GetFieldIndex(feature, "facility_lon"), match.facility_location.longitude);
    OGR_F_SetFieldDouble(feature, OGR_F_GetFieldIndex(feature, "distance_km"), match.distance_km);

    if (OGR_L_CreateFeature(layer, feature) != OGRERR_NONE) {
        last_error_ = "Failed to create feature for query " + std::to_string(match.query_index);
        OGR_F_Destroy(feature);
        return false;
    }

    OGR_F_Destroy(feature);
    return true;
}

} // namespace io
} // namespace facmatch
