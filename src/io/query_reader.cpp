#include "io/query_reader.hpp"
#include "io/gdal_utils.hpp"
#include <gdal.h>
#include <ogr_api.h>
#include <cmath>
#include <iostream>

namespace facmatch {
namespace io {

QueryReader::QueryReader(const QueryReaderConfig& config)
    : config_(config) {
}

QueryReader::~QueryReader() = default;

bool QueryReader::read() {
    queries_.clear();
    diagnostics_.clear();
    row_count_ = 0;

    GDALDatasetH dataset = GDALUtils::openDelimitedText(config_.file_path);
    if (!dataset) {
        std::cerr << "Failed to read query file: " << config_.file_path << std::endl;
        return false;
    }

    OGRLayerH layer = GDALDatasetGetLayer(dataset, 0);
    if (!layer) {
        std::cerr << "Error: Query file has no layer: " << config_.file_path << std::endl;
        GDALClose(dataset);
        return false;
    }

    OGRFeatureDefnH definition = OGR_L_GetLayerDefn(layer);
    int latitude_index = OGR_FD_GetFieldIndex(definition, config_.latitude_field.c_str());
    int longitude_index = OGR_FD_GetFieldIndex(definition, config_.longitude_field.c_str());
    if (latitude_index < 0 || longitude_index < 0) {
        std::cerr << "Error: Query file must contain fields '" << config_.latitude_field
                  << "' and '" << config_.longitude_field << "'" << std::endl;
        GDALClose(dataset);
        return false;
    }

    int label_index = config_.label_field.empty()
        ? -1 : OGR_FD_GetFieldIndex(definition, config_.label_field.c_str());

    OGR_L_ResetReading(layer);
    OGRFeatureH feature = nullptr;
    while ((feature = OGR_L_GetNextFeature(layer)) != nullptr) {
        size_t row_index = row_count_++;

        std::string failure_reason;
        auto location = parseLocation(GDALUtils::getFieldAsString(feature, latitude_index),
                                      GDALUtils::getFieldAsString(feature, longitude_index),
                                      failure_reason);
        if (location) {
            queries_.emplace_back(row_index, *location, GDALUtils::getFieldAsString(feature, label_index));
        } else {
            std::cerr << "Warning: Query row " << row_index << " ignored: " << failure_reason << std::endl;
            diagnostics_.emplace_back(row_index, std::to_string(row_index), failure_reason);
        }

        OGR_F_Destroy(feature);
    }

    GDALClose(dataset);

    std::cout << "Query rows: " << row_count_ << ", valid query points: " << queries_.size() << std::endl;

    return true;
}

std::optional<geo::GeographicCoordinate> QueryReader::parseLocation(const std::string& latitude_text,
                                                                    const std::string& longitude_text,
                                                                    std::string& failure_reason) {
    std::optional<double> latitude = geo::parseDouble(latitude_text);
    std::optional<double> longitude = geo::parseDouble(longitude_text);

    if (!latitude || !longitude) {
        failure_reason = "latitude '" + latitude_text + "' or longitude '" + longitude_text + "' is not numeric";
        return std::nullopt;
    }

    if (!std::isfinite(*latitude) || !std::isfinite(*longitude)) {
        failure_reason = "latitude or longitude is not a finite number";
        return std::nullopt;
    }

    return geo::GeographicCoordinate(*latitude, *longitude);
}

} // namespace io
} // namespace facmatch
