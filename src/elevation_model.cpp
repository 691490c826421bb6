/**
 * @file elevation_model.cpp
 * @brief Implementation of GridElevationModel
 */

#include "drone_georef/elevation_model.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace drone_georef {

GridElevationModel::GridElevationModel(
    std::vector<float> data,
    int width,
    int height,
    double north_lat,
    double west_lon,
    double spacing_lat_deg,
    double spacing_lon_deg,
    float nodata
) : data_(std::move(data)),
    width_(width),
    height_(height),
    north_lat_(north_lat),
    west_lon_(west_lon),
    spacing_lat_(spacing_lat_deg),
    spacing_lon_(spacing_lon_deg),
    nodata_(nodata) {

    if (width_ <= 0 || height_ <= 0) {
        throw std::invalid_argument(
            "GridElevationModel: dimensions must be positive, got " +
            std::to_string(width_) + "x" + std::to_string(height_));
    }
    if (!(spacing_lat_ > 0.0) || !(spacing_lon_ > 0.0)) {
        throw std::invalid_argument("GridElevationModel: spacing must be positive");
    }
    if (data_.size() != static_cast<size_t>(width_) * static_cast<size_t>(height_)) {
        throw std::invalid_argument(
            "GridElevationModel: data size (" + std::to_string(data_.size()) +
            ") does not match dimensions");
    }
}

std::optional<double> GridElevationModel::post(int row, int col) const {
    float v = data_[static_cast<size_t>(row) * width_ + col];
    if (v == nodata_ || !std::isfinite(v)) {
        return std::nullopt;
    }
    return static_cast<double>(v);
}

void GridElevationModel::bounds(double& min_lat, double& max_lat,
                                double& min_lon, double& max_lon) const {
    max_lat = north_lat_;
    min_lat = north_lat_ - (height_ - 1) * spacing_lat_;
    min_lon = west_lon_;
    max_lon = west_lon_ + (width_ - 1) * spacing_lon_;
}

std::optional<double> GridElevationModel::elevationAt(double latitude, double longitude) const {
    // Fractional post indices
    double row_f = (north_lat_ - latitude) / spacing_lat_;
    double col_f = (longitude - west_lon_) / spacing_lon_;

    const double eps = 1e-9;
    if (row_f < -eps || col_f < -eps ||
        row_f > (height_ - 1) + eps || col_f > (width_ - 1) + eps) {
        return std::nullopt;
    }

    int r0 = std::clamp(static_cast<int>(std::floor(row_f)), 0, height_ - 1);
    int c0 = std::clamp(static_cast<int>(std::floor(col_f)), 0, width_ - 1);
    int r1 = std::min(r0 + 1, height_ - 1);
    int c1 = std::min(c0 + 1, width_ - 1);

    double tr = std::clamp(row_f - r0, 0.0, 1.0);
    double tc = std::clamp(col_f - c0, 0.0, 1.0);

    auto e00 = post(r0, c0);
    auto e01 = post(r0, c1);
    auto e10 = post(r1, c0);
    auto e11 = post(r1, c1);

    if (e00 && e01 && e10 && e11) {
        double top = *e00 * (1.0 - tc) + *e01 * tc;
        double bottom = *e10 * (1.0 - tc) + *e11 * tc;
        return top * (1.0 - tr) + bottom * tr;
    }

    // Nearest valid post
    int rn = (tr < 0.5) ? r0 : r1;
    int cn = (tc < 0.5) ? c0 : c1;
    return post(rn, cn);
}

} // namespace drone_georef
