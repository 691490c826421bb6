/**
 * @file parameter_extractor.cpp
 * @brief Implementation of metadata-to-pose extraction
 */

#include "drone_georef/parameter_extractor.hpp"
#include "drone_georef/coordinate_frames.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <sstream>

namespace drone_georef {

using json = nlohmann::json;

namespace {

// Metadata key aliases: EXIF, DJI XMP (drone-dji:), and asset column names
const std::initializer_list<const char*> kLatitudeKeys = {"GPSLatitude", "GpsLatitude", "gpsLatitude", "latitude", "Latitude"};
const std::initializer_list<const char*> kLongitudeKeys = {"GPSLongitude", "GpsLongitude", "gpsLongitude", "longitude", "Longitude"};
const std::initializer_list<const char*> kAltitudeKeys = {"RelativeAltitude", "drone-dji:RelativeAltitude", "altitude", "GPSAltitude"};
const std::initializer_list<const char*> kAbsoluteAltitudeKeys = {"AbsoluteAltitude", "drone-dji:AbsoluteAltitude", "absoluteAltitude"};
const std::initializer_list<const char*> kPitchKeys = {"GimbalPitchDegree", "drone-dji:GimbalPitchDegree", "gimbalPitch"};
const std::initializer_list<const char*> kRollKeys = {"GimbalRollDegree", "drone-dji:GimbalRollDegree", "gimbalRoll"};
const std::initializer_list<const char*> kYawKeys = {"GimbalYawDegree", "drone-dji:GimbalYawDegree", "gimbalYaw"};
const std::initializer_list<const char*> kFlightYawKeys = {"FlightYawDegree", "drone-dji:FlightYawDegree", "flightYaw"};
const std::initializer_list<const char*> kWidthKeys = {"ImageWidth", "ExifImageWidth", "imageWidth"};
const std::initializer_list<const char*> kHeightKeys = {"ImageHeight", "ExifImageHeight", "imageHeight"};
const std::initializer_list<const char*> kFovKeys = {"FieldOfView", "drone-dji:FieldOfView", "FOV", "CameraFOV", "cameraFov"};
const std::initializer_list<const char*> kLrfKeys = {"LRFTargetDistance", "drone-dji:LRFTargetDistance", "LRFDistance", "lrfDistance"};
const std::initializer_list<const char*> kLrfTargetLatKeys = {"LRFTargetLat", "drone-dji:LRFTargetLat", "lrfTargetLat"};
const std::initializer_list<const char*> kLrfTargetLonKeys = {"LRFTargetLon", "drone-dji:LRFTargetLon", "lrfTargetLon"};
const std::initializer_list<const char*> kLrfTargetAltKeys = {"LRFTargetAlt", "drone-dji:LRFTargetAlt", "lrfTargetAlt"};
const std::initializer_list<const char*> kFocalKeys = {"CalibratedFocalLength", "drone-dji:CalibratedFocalLength"};
const std::initializer_list<const char*> kOpticalCenterXKeys = {"CalibratedOpticalCenterX", "drone-dji:CalibratedOpticalCenterX"};
const std::initializer_list<const char*> kOpticalCenterYKeys = {"CalibratedOpticalCenterY", "drone-dji:CalibratedOpticalCenterY"};

std::optional<double> toNumber(const json& value) {
    if (value.is_number()) {
        double v = value.get<double>();
        return std::isfinite(v) ? std::optional<double>(v) : std::nullopt;
    }
    if (value.is_string()) {
        const std::string& s = value.get_ref<const std::string&>();
        const char* begin = s.c_str();
        while (*begin && std::isspace(static_cast<unsigned char>(*begin))) {
            ++begin;
        }
        if (*begin == '\0') {
            return std::nullopt;
        }
        char* end = nullptr;
        double v = std::strtod(begin, &end);
        while (end && *end && std::isspace(static_cast<unsigned char>(*end))) {
            ++end;
        }
        if (end == begin || (end && *end != '\0') || !std::isfinite(v)) {
            return std::nullopt;
        }
        return v;
    }
    return std::nullopt;
}

const json* findKey(const json& raw, const char* key) {
    if (raw.is_object()) {
        auto it = raw.find(key);
        if (it != raw.end() && !it->is_null()) {
            return &(*it);
        }
        auto meta = raw.find("metadata");
        if (meta != raw.end() && meta->is_object()) {
            auto inner = meta->find(key);
            if (inner != meta->end() && !inner->is_null()) {
                return &(*inner);
            }
        }
    }
    return nullptr;
}

std::optional<std::string> readString(const json& raw, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        const json* value = findKey(raw, key);
        if (value && value->is_string() && !value->get_ref<const std::string&>().empty()) {
            return value->get<std::string>();
        }
    }
    return std::nullopt;
}

std::optional<double> readPositive(const json& raw, std::initializer_list<const char*> keys) {
    auto v = readMetadataNumber(raw, keys);
    if (v && *v > 0.0) {
        return v;
    }
    return std::nullopt;
}

// Pixel count that fits an int; anything else counts as missing
std::optional<int> readDimension(const json& raw, std::initializer_list<const char*> keys) {
    auto v = readPositive(raw, keys);
    if (!v) {
        return std::nullopt;
    }
    double rounded = std::round(*v);
    if (rounded < 1.0 || rounded > static_cast<double>(std::numeric_limits<int>::max())) {
        return std::nullopt;
    }
    return static_cast<int>(rounded);
}

} // namespace

std::optional<double> readMetadataNumber(const json& raw, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        const json* value = findKey(raw, key);
        if (!value) {
            continue;
        }
        if (auto number = toNumber(*value)) {
            return number;
        }
    }
    return std::nullopt;
}

std::vector<double> parseDewarpCoefficients(const std::string& dewarp_data) {
    std::string body = dewarp_data;
    auto semicolon = body.find(';');
    if (semicolon != std::string::npos) {
        body = body.substr(semicolon + 1);
    }

    std::vector<double> values;
    std::stringstream ss(body);
    std::string token;
    while (std::getline(ss, token, ',')) {
        auto v = toNumber(json(token));
        if (!v) {
            return {};
        }
        values.push_back(*v);
    }

    // fx, fy, cx, cy, k1, k2, p1, p2, k3
    if (values.size() != 9) {
        return {};
    }
    return std::vector<double>(values.begin() + 4, values.end());
}

CameraPose extractPose(const json& raw, const Config& config) {
    const PoseDefaults& d = config.default_pose;
    CameraPose pose;

    pose.latitude = readMetadataNumber(raw, kLatitudeKeys).value_or(0.0);
    pose.longitude = readMetadataNumber(raw, kLongitudeKeys).value_or(0.0);
    pose.altitude_m = readPositive(raw, kAltitudeKeys).value_or(d.altitude_m);
    pose.absolute_altitude_m = readMetadataNumber(raw, kAbsoluteAltitudeKeys);

    // Pitch: convert upstream convention; missing pitch means nadir
    if (auto raw_pitch = readMetadataNumber(raw, kPitchKeys)) {
        pose.gimbal_pitch_deg = canonicalPitchDeg(*raw_pitch, config.pitch_convention);
    } else {
        pose.gimbal_pitch_deg = d.gimbal_pitch_from_nadir_deg - 90.0;
    }

    pose.gimbal_roll_deg = readMetadataNumber(raw, kRollKeys).value_or(d.gimbal_roll_deg);

    pose.aircraft_yaw_deg = readMetadataNumber(raw, kFlightYawKeys);
    if (auto yaw = readMetadataNumber(raw, kYawKeys)) {
        pose.gimbal_yaw_deg = *yaw;
    } else if (pose.aircraft_yaw_deg && !config.gimbal_yaw_relative) {
        pose.gimbal_yaw_deg = *pose.aircraft_yaw_deg;
    } else {
        pose.gimbal_yaw_deg = d.gimbal_yaw_deg;
    }

    pose.image_width_px = readDimension(raw, kWidthKeys).value_or(d.image_width_px);
    pose.image_height_px = readDimension(raw, kHeightKeys).value_or(d.image_height_px);

    auto fov = readPositive(raw, kFovKeys);
    pose.horizontal_fov_deg = (fov && *fov < 180.0) ? *fov : d.horizontal_fov_deg;

    pose.lrf_distance_m = readPositive(raw, kLrfKeys);

    // Target position is kept only as a complete, in-range pair
    auto target_lat = readMetadataNumber(raw, kLrfTargetLatKeys);
    auto target_lon = readMetadataNumber(raw, kLrfTargetLonKeys);
    if (target_lat && target_lon && std::abs(*target_lat) <= 90.0 &&
        std::abs(*target_lon) <= 180.0) {
        pose.lrf_target_latitude = target_lat;
        pose.lrf_target_longitude = target_lon;
    }
    pose.lrf_target_altitude_m = readMetadataNumber(raw, kLrfTargetAltKeys);

    pose.camera_profile_id = readString(raw, {"cameraProfileId", "camera_profile_id", "CameraProfileId"});

    return pose;
}

CameraPose extractPrecisionPose(
    const json& raw,
    const Config& config,
    const CameraProfileStore* profiles
) {
    CameraPose pose = extractPose(raw, config);

    pose.focal_length_px = readPositive(raw, kFocalKeys);

    auto ocx = readMetadataNumber(raw, kOpticalCenterXKeys);
    auto ocy = readMetadataNumber(raw, kOpticalCenterYKeys);
    if (ocx && ocy) {
        pose.principal_point_offset_px = Eigen::Vector2d(
            *ocx - pose.image_width_px / 2.0,
            *ocy - pose.image_height_px / 2.0);
    }

    if (auto dewarp = readString(raw, {"DewarpData", "drone-dji:DewarpData"})) {
        pose.distortion_coeffs = parseDewarpCoefficients(*dewarp);
    }

    if (profiles && pose.camera_profile_id) {
        if (auto profile = profiles->find(*pose.camera_profile_id)) {
            if (!readPositive(raw, kFovKeys) && profile->horizontal_fov_deg &&
                *profile->horizontal_fov_deg > 0.0 && *profile->horizontal_fov_deg < 180.0) {
                pose.horizontal_fov_deg = *profile->horizontal_fov_deg;
            }
            if (!pose.focal_length_px && profile->focal_length_px &&
                *profile->focal_length_px > 0.0) {
                pose.focal_length_px = profile->focal_length_px;
            }
            if (!pose.principal_point_offset_px && profile->hasPrincipalPoint()) {
                pose.principal_point_offset_px = Eigen::Vector2d(
                    *profile->optical_center_x_px - pose.image_width_px / 2.0,
                    *profile->optical_center_y_px - pose.image_height_px / 2.0);
            }
            if (pose.distortion_coeffs.empty()) {
                pose.distortion_coeffs = profile->dist_coeffs;
            }
        }
    }

    return pose;
}

GeoQualityResult evaluateGeoQuality(const json& raw) {
    GeoQualityResult result;

    bool has_gps = readMetadataNumber(raw, kLatitudeKeys).has_value() &&
                   readMetadataNumber(raw, kLongitudeKeys).has_value();
    if (!has_gps) {
        result.quality = GeoQuality::MISSING;
        result.missing.push_back("gps");
        return result;
    }

    bool has_dims = readDimension(raw, kWidthKeys).has_value() &&
                    readDimension(raw, kHeightKeys).has_value();
    if (!has_dims) {
        result.missing.push_back("image dimensions");
    }

    bool has_altitude = readMetadataNumber(raw, kAltitudeKeys).has_value();
    if (!has_altitude) {
        result.missing.push_back("altitude");
    }

    bool has_orientation = readMetadataNumber(raw, kPitchKeys).has_value() &&
                           readMetadataNumber(raw, kYawKeys).has_value();
    if (!has_orientation) {
        result.missing.push_back("gimbal angles");
    }

    result.has_calibration = readMetadataNumber(raw, kFocalKeys).has_value() &&
                             readMetadataNumber(raw, kOpticalCenterXKeys).has_value() &&
                             readMetadataNumber(raw, kOpticalCenterYKeys).has_value();
    result.has_lrf = readPositive(raw, kLrfKeys).has_value() &&
                     readMetadataNumber(raw, kLrfTargetLatKeys).has_value() &&
                     readMetadataNumber(raw, kLrfTargetLonKeys).has_value();

    bool has_fov = readPositive(raw, kFovKeys).has_value();
    if (!result.has_calibration && !has_fov) {
        result.missing.push_back("camera calibration");
    }

    if (has_dims && has_altitude && has_orientation &&
        (result.has_calibration || result.has_lrf)) {
        result.quality = GeoQuality::HIGH;
    } else if (has_dims && has_altitude) {
        result.quality = GeoQuality::MEDIUM;
    } else {
        result.quality = GeoQuality::LOW;
    }
    return result;
}

std::vector<std::string> validatePose(const CameraPose& pose) {
    std::vector<std::string> problems;

    if (!std::isfinite(pose.latitude) || std::abs(pose.latitude) > 90.0) {
        problems.push_back("latitude out of range");
    }
    if (!std::isfinite(pose.longitude) || std::abs(pose.longitude) > 180.0) {
        problems.push_back("longitude out of range");
    }
    if (!std::isfinite(pose.altitude_m)) {
        problems.push_back("altitude is not finite");
    }
    if (!std::isfinite(pose.gimbal_pitch_deg) || !std::isfinite(pose.gimbal_roll_deg) ||
        !std::isfinite(pose.gimbal_yaw_deg)) {
        problems.push_back("gimbal angles must be finite");
    }
    if (pose.aircraft_yaw_deg && !std::isfinite(*pose.aircraft_yaw_deg)) {
        problems.push_back("aircraft yaw must be finite");
    }
    if (pose.image_width_px <= 0 || pose.image_height_px <= 0) {
        problems.push_back("image size must be positive");
    }
    if (!(pose.horizontal_fov_deg > 0.0 && pose.horizontal_fov_deg < 180.0)) {
        problems.push_back("horizontal FOV must be in (0, 180)");
    }
    if (pose.focal_length_px && !(*pose.focal_length_px > 0.0)) {
        problems.push_back("calibrated focal length must be positive");
    }
    if (pose.principal_point_offset_px && !pose.principal_point_offset_px->allFinite()) {
        problems.push_back("principal point offset must be finite");
    }
    if (pose.lrf_target_latitude &&
        (!std::isfinite(*pose.lrf_target_latitude) || std::abs(*pose.lrf_target_latitude) > 90.0)) {
        problems.push_back("LRF target latitude out of range");
    }
    if (pose.lrf_target_longitude &&
        (!std::isfinite(*pose.lrf_target_longitude) || std::abs(*pose.lrf_target_longitude) > 180.0)) {
        problems.push_back("LRF target longitude out of range");
    }
    if (pose.lrf_target_altitude_m && !std::isfinite(*pose.lrf_target_altitude_m)) {
        problems.push_back("LRF target altitude must be finite");
    }
    if (!isSupportedDistortionCount(pose.distortion_coeffs.size())) {
        problems.push_back("distortion needs 4, 5, 8, 12 or 14 coefficients");
    }
    for (double k : pose.distortion_coeffs) {
        if (!std::isfinite(k)) {
            problems.push_back("distortion coefficients must be finite");
            break;
        }
    }

    return problems;
}

} // namespace drone_georef
