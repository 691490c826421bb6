/**
 * @file calibration.cpp
 * @brief Implementation of intrinsics and camera profile store
 */

#include "drone_georef/calibration.hpp"
#include <nlohmann/json.hpp>
#include <opencv2/calib3d.hpp>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace drone_georef {

using json = nlohmann::json;

// ============================================================================
// CameraIntrinsics
// ============================================================================

bool CameraIntrinsics::hasDistortion() const {
    for (double k : dist_coeffs) {
        if (std::abs(k) > 1e-10) {
            return true;
        }
    }
    return false;
}

std::vector<cv::Point2d> CameraIntrinsics::undistortPoints(
    const std::vector<cv::Point2d>& pts
) const {
    if (pts.empty() || !hasDistortion()) {
        return pts;
    }
    if (!isSupportedDistortionCount(dist_coeffs.size())) {
        throw std::invalid_argument(
            "Unsupported number of distortion coefficients: " +
            std::to_string(dist_coeffs.size()));
    }

    std::vector<cv::Point2d> undistorted;
    cv::undistortPoints(pts, undistorted, K_cv(), distCoeffs_cv(), cv::noArray(), K_cv());
    return undistorted;
}

cv::Point2d CameraIntrinsics::undistortPoint(const cv::Point2d& pt) const {
    if (!hasDistortion()) {
        return pt;
    }
    std::vector<cv::Point2d> out = undistortPoints({pt});
    return out.front();
}

CameraIntrinsics CameraIntrinsics::fromFov(
    int image_width,
    int image_height,
    double horizontal_fov_deg,
    const Eigen::Vector2d& principal_offset
) {
    if (image_width <= 0 || image_height <= 0) {
        throw std::invalid_argument("Image size must be positive");
    }
    if (!(horizontal_fov_deg > 0.0 && horizontal_fov_deg < 180.0)) {
        throw std::invalid_argument("Horizontal FOV must be in (0, 180) degrees");
    }

    double f = image_width / (2.0 * std::tan(deg2rad(horizontal_fov_deg) / 2.0));

    CameraIntrinsics intrinsics;
    intrinsics.fx = f;
    intrinsics.fy = f;
    intrinsics.cx = image_width / 2.0 + principal_offset.x();
    intrinsics.cy = image_height / 2.0 + principal_offset.y();
    intrinsics.width = image_width;
    intrinsics.height = image_height;
    return intrinsics;
}

// ============================================================================
// CameraProfileStore
// ============================================================================

void CameraProfileStore::add(const CameraProfile& profile) {
    if (profile.id.empty()) {
        throw std::invalid_argument("Camera profile id must not be empty");
    }
    profiles_[profile.id] = profile;
}

std::optional<CameraProfile> CameraProfileStore::find(const ProfileId& id) const {
    auto it = profiles_.find(id);
    if (it == profiles_.end()) {
        return std::nullopt;
    }
    return it->second;
}

namespace {

std::optional<double> optionalNumber(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) {
        return std::nullopt;
    }
    double value = it->get<double>();
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

} // namespace

CameraProfileStore CameraProfileStore::fromJson(const json& j) {
    if (!j.is_array()) {
        throw std::invalid_argument("Camera profiles JSON must be an array");
    }

    CameraProfileStore store;
    for (const auto& item : j) {
        if (!item.is_object() || !item.contains("id") || !item["id"].is_string()) {
            throw std::invalid_argument("Camera profile entry requires a string id");
        }

        CameraProfile profile;
        profile.id = item["id"].get<std::string>();
        profile.name = item.value("name", std::string());
        profile.description = item.value("description", std::string());
        profile.horizontal_fov_deg = optionalNumber(item, "fov");
        profile.focal_length_px = optionalNumber(item, "calibratedFocalLength");
        profile.optical_center_x_px = optionalNumber(item, "opticalCenterX");
        profile.optical_center_y_px = optionalNumber(item, "opticalCenterY");
        if (item.contains("distortion") && !item["distortion"].is_null()) {
            const json& coeffs = item["distortion"];
            if (!coeffs.is_array()) {
                throw std::invalid_argument(
                    "Camera profile " + profile.id + ": distortion must be an array");
            }
            for (const auto& k : coeffs) {
                if (!k.is_number() || !std::isfinite(k.get<double>())) {
                    throw std::invalid_argument(
                        "Camera profile " + profile.id + ": distortion values must be finite numbers");
                }
                profile.dist_coeffs.push_back(k.get<double>());
            }
            if (!isSupportedDistortionCount(profile.dist_coeffs.size())) {
                throw std::invalid_argument(
                    "Camera profile " + profile.id + ": expected 4, 5, 8, 12 or 14 "
                    "distortion coefficients, got " +
                    std::to_string(profile.dist_coeffs.size()));
            }
        }

        store.add(profile);
    }
    return store;
}

CameraProfileStore CameraProfileStore::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open camera profile file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse camera profile file " + path + ": " + e.what());
    }
    return fromJson(j);
}

} // namespace drone_georef
