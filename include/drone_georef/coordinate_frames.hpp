/**
 * @file coordinate_frames.hpp
 * @brief Coordinate frame conventions and rotation utilities
 *
 * World frame: East-North-Up (ENU), local tangent plane at the camera.
 *
 * Camera frame: +X = image right, +Y = image up (towards row 0),
 * boresight = -Z. At the reference attitude (pitch -90, roll 0, yaw 0)
 * the camera frame coincides with ENU: the camera looks straight down
 * and the top of the image points north.
 *
 * Gimbal angles (degrees):
 *   - pitch: -90 = nadir, 0 = horizon, positive = above horizon
 *   - yaw:   compass heading, 0 = north, positive clockwise from above
 *   - roll:  positive = right side down
 */

#pragma once

#include "common.hpp"
#include <Eigen/Dense>
#include <Eigen/Geometry>

namespace drone_georef {

/**
 * @brief Convert a raw pitch reading to the canonical -90 = nadir convention
 */
double canonicalPitchDeg(double raw_pitch_deg, PitchConvention convention);

/**
 * @brief Wrap an angle to (-180, 180] degrees
 */
double wrapAngleDeg(double angle_deg);

/**
 * @brief Camera-to-World rotation from gimbal angles
 *
 * R_WC = Rz(-yaw) * Rx(pitch + 90) * Rz(-roll)
 *
 * Applied right to left: roll about the boresight, pitch about the
 * lateral axis, yaw about Up. All inputs in degrees.
 *
 * @return R_WC: v_W = R_WC * v_C
 */
Eigen::Matrix3d gimbalToWorldRotation(
    double pitch_deg,
    double roll_deg,
    double yaw_deg
);

/**
 * @brief Recover gimbal angles from a Camera-to-World rotation
 *
 * At nadir (gimbal lock) roll is reported as 0 and the combined
 * rotation is attributed to yaw.
 *
 * @return (pitch, roll, yaw) in degrees, yaw wrapped to (-180, 180]
 */
Eigen::Vector3d worldRotationToGimbal(const Eigen::Matrix3d& R_WC);

/**
 * @brief Rotation matrix about X-axis (radians)
 */
Eigen::Matrix3d Rx(double angle);

/**
 * @brief Rotation matrix about Z-axis (radians)
 */
Eigen::Matrix3d Rz(double angle);

} // namespace drone_georef
