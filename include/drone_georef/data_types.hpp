/**
 * @file data_types.hpp
 * @brief Core data structures: pixels, geographic points, camera poses
 */

#pragma once

#include "common.hpp"
#include <Eigen/Dense>
#include <cstdio>
#include <string>
#include <vector>
#include <optional>

namespace drone_georef {

/**
 * @brief Location in image pixel space (origin top-left, y grows down)
 *
 * Not bounds-checked: pixels outside the image still produce a ray.
 */
struct PixelPoint {
    double x = 0.0;
    double y = 0.0;

    PixelPoint() = default;
    PixelPoint(double px, double py) : x(px), y(py) {}
};

/**
 * @brief WGS84 geographic point
 */
struct GeoPoint {
    double latitude = 0.0;   ///< degrees
    double longitude = 0.0;  ///< degrees

    std::optional<double> elevation_m;  ///< Terrain elevation if terrain-aware

    GeoPoint() = default;
    GeoPoint(double lat, double lon) : latitude(lat), longitude(lon) {}
    GeoPoint(double lat, double lon, double elev)
        : latitude(lat), longitude(lon), elevation_m(elev) {}

    std::string toString() const {
        char buffer[128];
        if (elevation_m) {
            snprintf(buffer, sizeof(buffer), "GeoPoint(lat=%.8f, lon=%.8f, elev=%.2fm)",
                     latitude, longitude, *elevation_m);
        } else {
            snprintf(buffer, sizeof(buffer), "GeoPoint(lat=%.8f, lon=%.8f)",
                     latitude, longitude);
        }
        return std::string(buffer);
    }
};

/**
 * @brief Camera position and orientation at capture time
 *
 * Angle conventions (see coordinate_frames.hpp):
 *   - gimbal_pitch_deg: -90 = nadir (straight down), 0 = horizon, positive = up
 *   - gimbal_yaw_deg:   compass heading, 0 = north, positive clockwise from above
 *   - gimbal_roll_deg:  positive = right side down
 */
struct CameraPose {
    double latitude = 0.0;    ///< degrees
    double longitude = 0.0;   ///< degrees
    double altitude_m = 100.0;  ///< Height above ground at capture

    std::optional<double> absolute_altitude_m;  ///< Above mean sea level

    double gimbal_pitch_deg = -90.0;
    double gimbal_roll_deg = 0.0;
    double gimbal_yaw_deg = 0.0;

    std::optional<double> aircraft_yaw_deg;  ///< Airframe heading, if reported separately

    int image_width_px = 4000;
    int image_height_px = 3000;
    double horizontal_fov_deg = 84.0;

    std::optional<Eigen::Vector2d> principal_point_offset_px;  ///< (dx, dy) from image center
    std::optional<double> focal_length_px;  ///< Calibrated focal length, overrides FOV
    std::vector<double> distortion_coeffs;  ///< (k1, k2, p1, p2, k3), empty = none

    std::optional<double> lrf_distance_m;  ///< Laser rangefinder slant distance

    // Ground point hit by the rangefinder, as reported by the aircraft
    std::optional<double> lrf_target_latitude;
    std::optional<double> lrf_target_longitude;
    std::optional<double> lrf_target_altitude_m;  ///< DSM height datum

    bool hasLrfTarget() const {
        return lrf_target_latitude.has_value() && lrf_target_longitude.has_value();
    }

    std::optional<ProfileId> camera_profile_id;

    std::string toString() const {
        char buffer[256];
        snprintf(buffer, sizeof(buffer),
                 "CameraPose(lat=%.7f, lon=%.7f, alt=%.1fm, pitch=%.1f, roll=%.1f, "
                 "yaw=%.1f, %dx%d, fov=%.1f%s)",
                 latitude, longitude, altitude_m,
                 gimbal_pitch_deg, gimbal_roll_deg, gimbal_yaw_deg,
                 image_width_px, image_height_px, horizontal_fov_deg,
                 lrf_distance_m ? ", lrf" : "");
        return std::string(buffer);
    }
};

/**
 * @brief Axis-aligned pixel rectangle (top-left origin)
 */
struct PixelBox {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    PixelPoint center() const {
        return PixelPoint(x + width / 2.0, y + height / 2.0);
    }
};

/**
 * @brief Geographic form of one annotation polygon
 */
struct PolygonResult {
    std::vector<GeoPoint> polygon;     ///< Closed when >= 3 vertices converted
    std::optional<GeoPoint> centroid;  ///< nullopt when nothing converted
    int failed_vertices = 0;
    int total_vertices = 0;

    int converted() const { return total_vertices - failed_vertices; }

    bool isClosed() const {
        return polygon.size() >= 4 &&
               polygon.front().latitude == polygon.back().latitude &&
               polygon.front().longitude == polygon.back().longitude;
    }

    /// True when not a single vertex could be georeferenced
    bool failed() const { return !centroid.has_value(); }

    std::string toString() const {
        char buffer[160];
        if (centroid) {
            snprintf(buffer, sizeof(buffer),
                     "PolygonResult(%d/%d converted, centroid=%.7f,%.7f)",
                     converted(), total_vertices,
                     centroid->latitude, centroid->longitude);
        } else {
            snprintf(buffer, sizeof(buffer),
                     "PolygonResult(0/%d converted)", total_vertices);
        }
        return std::string(buffer);
    }
};

/**
 * @brief Completeness assessment of raw capture metadata
 */
struct GeoQualityResult {
    GeoQuality quality = GeoQuality::MISSING;
    std::vector<std::string> missing;
    bool has_calibration = false;
    bool has_lrf = false;  ///< Range plus target latitude/longitude
};

} // namespace drone_georef
