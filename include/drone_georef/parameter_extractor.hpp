/**
 * @file parameter_extractor.hpp
 * @brief Builds typed camera poses from loosely-typed capture metadata
 */

#pragma once

#include "common.hpp"
#include "calibration.hpp"
#include "config.hpp"
#include "data_types.hpp"
#include <nlohmann/json.hpp>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace drone_georef {

/**
 * @brief Read the first usable number among several metadata keys
 *
 * Accepts JSON numbers and numeric strings (EXIF/XMP values are often
 * stored as text). Keys are looked up at the top level first, then in a
 * nested "metadata" object. Non-finite or unparsable values are skipped.
 */
std::optional<double> readMetadataNumber(
    const nlohmann::json& raw,
    std::initializer_list<const char*> keys
);

/**
 * @brief Parse DJI DewarpData ("date;fx,fy,cx,cy,k1,k2,p1,p2,k3")
 * @return (k1, k2, p1, p2, k3), empty if the string is not in that form
 */
std::vector<double> parseDewarpCoefficients(const std::string& dewarp_data);

/**
 * @brief Build a CameraPose from raw capture metadata
 *
 * Never throws: missing or unusable fields take the configured defaults
 * (altitude 100 m, pitch at nadir, roll/yaw 0, 4000x3000, FOV 84 deg).
 * Gimbal yaw falls back to the flight yaw before the default. The raw
 * pitch is converted from config.pitch_convention to the canonical
 * -90 = nadir convention. Completeness is reported separately by
 * evaluateGeoQuality().
 */
CameraPose extractPose(const nlohmann::json& raw, const Config& config = Config());

/**
 * @brief extractPose() plus calibrated camera parameters
 *
 * Adds the calibrated focal length, optical center (as an offset from
 * the image center) and DewarpData distortion coefficients when present.
 * If the metadata names a camera profile found in @p profiles, the
 * profile fills calibrated fields the metadata does not carry.
 */
CameraPose extractPrecisionPose(
    const nlohmann::json& raw,
    const Config& config = Config(),
    const CameraProfileStore* profiles = nullptr
);

/**
 * @brief Grade how complete the georeferencing metadata is
 *
 *   - MISSING: no GPS position
 *   - HIGH:    GPS, image size, altitude, gimbal pitch/yaw, and either
 *              calibration (focal + optical center) or LRF
 *   - MEDIUM:  GPS, image size, altitude
 *   - LOW:     anything else with GPS
 */
GeoQualityResult evaluateGeoQuality(const nlohmann::json& raw);

/**
 * @brief Check a pose against its invariants
 * @return Human-readable problems; empty if the pose is usable
 */
std::vector<std::string> validatePose(const CameraPose& pose);

} // namespace drone_georef
