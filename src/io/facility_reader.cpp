#include "io/facility_reader.hpp"
#include "io/gdal_utils.hpp"
#include <gdal.h>
#include <ogr_api.h>
#include <iostream>

namespace facmatch {
namespace io {

namespace {

int findField(OGRLayerH layer, const std::string& field_name) {
    if (field_name.empty()) {
        return -1;
    }
    return OGR_FD_GetFieldIndex(OGR_L_GetLayerDefn(layer), field_name.c_str());
}

void printAvailableFields(OGRLayerH layer) {
    std::cerr << "Available fields:";
    for (const auto& name : GDALUtils::getFieldNames(layer)) {
        std::cerr << " '" << name << "'";
    }
    std::cerr << std::endl;
}

} // namespace

FacilityReader::FacilityReader(const FacilityReaderConfig& config)
    : config_(config) {
}

FacilityReader::~FacilityReader() = default;

bool FacilityReader::read() {
    // Clear any existing rows
    records_.clear();

    GDALDatasetH dataset = GDALUtils::openDelimitedText(config_.file_path);
    if (!dataset) {
        std::cerr << "Failed to read facility file: " << config_.file_path << std::endl;
        return false;
    }

    OGRLayerH layer = GDALDatasetGetLayer(dataset, 0);
    if (!layer) {
        std::cerr << "Error: Facility file has no layer: " << config_.file_path << std::endl;
        GDALClose(dataset);
        return false;
    }

    int point_index = findField(layer, config_.point_field);
    int polygon_index = findField(layer, config_.polygon_field);
    if (point_index < 0 || polygon_index < 0) {
        std::cerr << "Error: Facility file must contain fields '" << config_.point_field
                  << "' and '" << config_.polygon_field << "'" << std::endl;
        printAvailableFields(layer);
        GDALClose(dataset);
        return false;
    }

    int id_index = findField(layer, config_.id_field);
    if (id_index < 0) {
        std::cout << "Warning: Specified ID field '" << config_.id_field
                  << "' not found. Falling back to OGR FID." << std::endl;
    }

    int classification_index = findField(layer, config_.classification_field);
    if (classification_index < 0 && !config_.classification_field.empty()) {
        std::cout << "Warning: Classification field '" << config_.classification_field
                  << "' not found. Polygons will use the default color." << std::endl;
    }

    OGR_L_ResetReading(layer);
    size_t row_index = 0;
    OGRFeatureH feature = nullptr;
    while ((feature = OGR_L_GetNextFeature(layer)) != nullptr) {
        std::string facility_id = (id_index >= 0)
            ? GDALUtils::getFieldAsString(feature, id_index)
            : std::to_string(OGR_F_GetFID(feature));

        records_.emplace_back(row_index,
                              facility_id,
                              GDALUtils::getFieldAsString(feature, point_index),
                              GDALUtils::getFieldAsString(feature, polygon_index),
                              GDALUtils::getFieldAsString(feature, classification_index));

        OGR_F_Destroy(feature);
        ++row_index;
    }

    GDALClose(dataset);

    std::cout << "Facility row count: " << records_.size() << std::endl;

    return true;
}

} // namespace io
} // namespace facmatch
