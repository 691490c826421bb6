/**
 * @file elevation_model.hpp
 * @brief Digital surface model interface and in-memory rasters
 */

#pragma once

#include "common.hpp"
#include <optional>
#include <string>
#include <vector>

namespace drone_georef {

/**
 * @brief Queryable terrain surface (DSM)
 *
 * Owned and cached by the caller; projectors only hold a reference.
 * Implementations shared between threads must be safe to query
 * concurrently.
 */
class ElevationModel {
public:
    virtual ~ElevationModel() = default;

    /**
     * @brief Surface elevation above mean sea level (meters)
     * @return nullopt where the model has no data
     */
    virtual std::optional<double> elevationAt(double latitude, double longitude) const = 0;

    /**
     * @brief Human-readable source name
     */
    virtual std::string name() const = 0;
};

/**
 * @brief Same elevation everywhere (or nowhere, when constructed empty)
 */
class ConstantElevationModel : public ElevationModel {
public:
    ConstantElevationModel() = default;
    explicit ConstantElevationModel(double elevation_m) : elevation_m_(elevation_m) {}

    std::optional<double> elevationAt(double, double) const override {
        return elevation_m_;
    }

    std::string name() const override { return "constant"; }

private:
    std::optional<double> elevation_m_;
};

/**
 * @brief North-up lat/lon elevation raster with bilinear interpolation
 *
 * Posts are laid out row-major from the north-west corner: row r is at
 * latitude north_lat - r * spacing_lat, column c at longitude
 * west_lon + c * spacing_lon. Queries outside the posts return nullopt;
 * cells touching a nodata post fall back to the nearest post.
 */
class GridElevationModel : public ElevationModel {
public:
    /**
     * @throws std::invalid_argument if dimensions, spacing, or data size are invalid
     */
    GridElevationModel(
        std::vector<float> data,
        int width,
        int height,
        double north_lat,
        double west_lon,
        double spacing_lat_deg,
        double spacing_lon_deg,
        float nodata = -32768.0f
    );

    std::optional<double> elevationAt(double latitude, double longitude) const override;

    std::string name() const override { return "grid"; }

    int width() const { return width_; }
    int height() const { return height_; }

    /**
     * @brief Geographic extent (min_lat, max_lat, min_lon, max_lon)
     */
    void bounds(double& min_lat, double& max_lat, double& min_lon, double& max_lon) const;

private:
    std::optional<double> post(int row, int col) const;

    std::vector<float> data_;
    int width_;
    int height_;
    double north_lat_;
    double west_lon_;
    double spacing_lat_;
    double spacing_lon_;
    float nodata_;
};

} // namespace drone_georef
