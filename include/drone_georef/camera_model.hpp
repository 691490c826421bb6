/**
 * @file camera_model.hpp
 * @brief Pinhole camera model: pixel to camera-space ray
 */

#pragma once

#include "common.hpp"
#include "calibration.hpp"
#include "data_types.hpp"
#include <Eigen/Dense>

namespace drone_georef {

/**
 * @brief Intrinsics implied by a pose
 *
 * Uses the calibrated focal length when present, otherwise derives it
 * from the horizontal FOV. The principal point is the image center plus
 * the calibrated offset, if any.
 *
 * @throws std::invalid_argument if image size or FOV violate the pose invariants
 */
CameraIntrinsics intrinsicsFor(const CameraPose& pose);

/**
 * @brief Vertical field of view from the horizontal one and the aspect ratio
 *
 * vfov = 2 atan(tan(hfov/2) * height/width)
 */
double verticalFovDeg(const CameraPose& pose);

/**
 * @brief Unit ray through a pixel, in the camera frame
 *
 * Camera frame: +X = image right, +Y = image up, boresight = -Z, so the
 * unnormalized ray is ((x - cx)/fx, (cy - y)/fy, -1). The image center
 * maps to (0, 0, -1). Distorted pixels are undistorted first when the
 * pose carries distortion coefficients.
 */
Eigen::Vector3d pixelToCameraRay(const PixelPoint& pixel, const CameraPose& pose);

/**
 * @brief Angular offset of a pixel from the boresight
 *
 * @return (horizontal, vertical) in degrees; horizontal positive to the
 *         right, vertical positive towards the top of the image
 */
Eigen::Vector2d pixelAngularOffsetDeg(const PixelPoint& pixel, const CameraPose& pose);

} // namespace drone_georef
