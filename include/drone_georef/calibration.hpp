/**
 * @file calibration.hpp
 * @brief Camera intrinsics and calibrated camera profiles
 */

#pragma once

#include "common.hpp"
#include <Eigen/Dense>
#include <nlohmann/json_fwd.hpp>
#include <opencv2/core.hpp>
#include <map>
#include <optional>
#include <vector>

namespace drone_georef {

/**
 * @brief True for the coefficient counts OpenCV's distortion model accepts
 *
 * 4, 5, 8, 12 or 14; zero means no distortion.
 */
inline bool isSupportedDistortionCount(size_t count) {
    return count == 0 || count == 4 || count == 5 || count == 8 ||
           count == 12 || count == 14;
}

/**
 * @brief Camera intrinsic parameters
 */
struct CameraIntrinsics {
    double fx;  ///< Focal length x (pixels)
    double fy;  ///< Focal length y (pixels)
    double cx;  ///< Principal point x (pixels)
    double cy;  ///< Principal point y (pixels)

    std::vector<double> dist_coeffs;  ///< Distortion coefficients (k1, k2, p1, p2, k3)

    int width = 4000;   ///< Image width
    int height = 3000;  ///< Image height

    /**
     * @brief Get OpenCV camera matrix
     */
    cv::Mat K_cv() const {
        cv::Mat mat = cv::Mat::eye(3, 3, CV_64F);
        mat.at<double>(0, 0) = fx;
        mat.at<double>(1, 1) = fy;
        mat.at<double>(0, 2) = cx;
        mat.at<double>(1, 2) = cy;
        return mat;
    }

    /**
     * @brief Get OpenCV distortion coefficients
     */
    cv::Mat distCoeffs_cv() const {
        if (dist_coeffs.empty()) {
            return cv::Mat::zeros(5, 1, CV_64F);
        }
        cv::Mat mat(static_cast<int>(dist_coeffs.size()), 1, CV_64F);
        for (size_t i = 0; i < dist_coeffs.size(); ++i) {
            mat.at<double>(static_cast<int>(i)) = dist_coeffs[i];
        }
        return mat;
    }

    /**
     * @brief True if any distortion coefficient is non-negligible
     */
    bool hasDistortion() const;

    /**
     * @brief Remove lens distortion from pixel coordinates
     *
     * Output is in the same pixel frame (re-projected with K).
     *
     * @throws std::invalid_argument if the coefficient count is unsupported
     */
    std::vector<cv::Point2d> undistortPoints(const std::vector<cv::Point2d>& pts) const;

    /**
     * @brief Single-point convenience wrapper for undistortPoints()
     */
    cv::Point2d undistortPoint(const cv::Point2d& pt) const;

    /**
     * @brief Pinhole intrinsics from a horizontal field of view
     *
     * fx = fy = width / (2 tan(hfov/2)); principal point at the image
     * center shifted by the optional offset.
     *
     * @throws std::invalid_argument if size or FOV are out of range
     */
    static CameraIntrinsics fromFov(
        int image_width,
        int image_height,
        double horizontal_fov_deg,
        const Eigen::Vector2d& principal_offset = Eigen::Vector2d::Zero()
    );
};

/**
 * @brief Calibrated camera parameters shared by all captures of one camera
 *
 * Any field may be absent; only present fields enrich a pose.
 */
struct CameraProfile {
    ProfileId id;
    std::string name;
    std::string description;

    std::optional<double> horizontal_fov_deg;
    std::optional<double> focal_length_px;
    std::optional<double> optical_center_x_px;  ///< Absolute, pixels
    std::optional<double> optical_center_y_px;  ///< Absolute, pixels
    std::vector<double> dist_coeffs;

    bool hasPrincipalPoint() const {
        return optical_center_x_px.has_value() && optical_center_y_px.has_value();
    }
};

/**
 * @brief In-memory lookup of camera profiles by id
 */
class CameraProfileStore {
public:
    CameraProfileStore() = default;

    /**
     * @brief Insert or replace a profile
     * @throws std::invalid_argument if the id is empty
     */
    void add(const CameraProfile& profile);

    std::optional<CameraProfile> find(const ProfileId& id) const;

    size_t size() const { return profiles_.size(); }
    bool empty() const { return profiles_.empty(); }

    /**
     * @brief Build a store from a JSON array of profile objects
     *
     * Keys: id, name, description, fov, calibratedFocalLength,
     * opticalCenterX, opticalCenterY, distortion (array of 4, 5, 8, 12
     * or 14 numbers).
     *
     * @throws std::invalid_argument if the JSON is not an array of objects with
     *         ids, or a distortion array is malformed
     */
    static CameraProfileStore fromJson(const nlohmann::json& j);

    /**
     * @brief Load a store from a JSON file
     * @throws std::runtime_error if the file cannot be opened or parsed
     */
    static CameraProfileStore loadFile(const std::string& path);

private:
    std::map<ProfileId, CameraProfile> profiles_;
};

} // namespace drone_georef
