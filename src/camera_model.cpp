/**
 * @file camera_model.cpp
 * @brief Implementation of the pinhole camera model
 */

#include "drone_georef/camera_model.hpp"
#include <cmath>
#include <stdexcept>

namespace drone_georef {

CameraIntrinsics intrinsicsFor(const CameraPose& pose) {
    Eigen::Vector2d offset = pose.principal_point_offset_px
        ? *pose.principal_point_offset_px
        : Eigen::Vector2d::Zero();

    CameraIntrinsics intrinsics;
    if (pose.focal_length_px && *pose.focal_length_px > 0.0) {
        if (pose.image_width_px <= 0 || pose.image_height_px <= 0) {
            throw std::invalid_argument("Image size must be positive");
        }
        intrinsics.fx = *pose.focal_length_px;
        intrinsics.fy = *pose.focal_length_px;
        intrinsics.cx = pose.image_width_px / 2.0 + offset.x();
        intrinsics.cy = pose.image_height_px / 2.0 + offset.y();
        intrinsics.width = pose.image_width_px;
        intrinsics.height = pose.image_height_px;
    } else {
        intrinsics = CameraIntrinsics::fromFov(
            pose.image_width_px, pose.image_height_px,
            pose.horizontal_fov_deg, offset);
    }

    intrinsics.dist_coeffs = pose.distortion_coeffs;
    return intrinsics;
}

double verticalFovDeg(const CameraPose& pose) {
    double half_h = deg2rad(pose.horizontal_fov_deg) / 2.0;
    double aspect = double(pose.image_height_px) / double(pose.image_width_px);
    return rad2deg(2.0 * std::atan(std::tan(half_h) * aspect));
}

Eigen::Vector3d pixelToCameraRay(const PixelPoint& pixel, const CameraPose& pose) {
    CameraIntrinsics K = intrinsicsFor(pose);

    cv::Point2d p(pixel.x, pixel.y);
    if (K.hasDistortion()) {
        p = K.undistortPoint(p);
    }

    // tan of the angular offsets; image y grows downward, camera +Y is up
    double tan_h = (p.x - K.cx) / K.fx;
    double tan_v = (K.cy - p.y) / K.fy;

    return Eigen::Vector3d(tan_h, tan_v, -1.0).normalized();
}

Eigen::Vector2d pixelAngularOffsetDeg(const PixelPoint& pixel, const CameraPose& pose) {
    Eigen::Vector3d ray = pixelToCameraRay(pixel, pose);
    // ray = (tan_h, tan_v, -1) / norm
    double h = std::atan2(ray.x(), -ray.z());
    double v = std::atan2(ray.y(), -ray.z());
    return Eigen::Vector2d(rad2deg(h), rad2deg(v));
}

} // namespace drone_georef
