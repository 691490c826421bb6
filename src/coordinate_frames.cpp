/**
 * @file coordinate_frames.cpp
 * @brief Implementation of coordinate frame transformations
 */

#include "drone_georef/coordinate_frames.hpp"
#include <algorithm>
#include <cmath>

namespace drone_georef {

Eigen::Matrix3d Rx(double angle) {
    double c = std::cos(angle);
    double s = std::sin(angle);
    Eigen::Matrix3d R;
    R << 1, 0, 0,
         0, c, -s,
         0, s, c;
    return R;
}

Eigen::Matrix3d Rz(double angle) {
    double c = std::cos(angle);
    double s = std::sin(angle);
    Eigen::Matrix3d R;
    R << c, -s, 0,
         s, c, 0,
         0, 0, 1;
    return R;
}

double canonicalPitchDeg(double raw_pitch_deg, PitchConvention convention) {
    switch (convention) {
        case PitchConvention::ZERO_IS_NADIR:
            return raw_pitch_deg - 90.0;
        case PitchConvention::NEG90_IS_NADIR:
        default:
            return raw_pitch_deg;
    }
}

double wrapAngleDeg(double angle_deg) {
    double wrapped = std::fmod(angle_deg, 360.0);
    if (wrapped > 180.0) {
        wrapped -= 360.0;
    } else if (wrapped <= -180.0) {
        wrapped += 360.0;
    }
    return wrapped;
}

Eigen::Matrix3d gimbalToWorldRotation(double pitch_deg, double roll_deg, double yaw_deg) {
    // Yaw is clockwise-positive (compass), Rz is counter-clockwise-positive.
    // Roll right-side-down is a negative rotation about the backward (+Z) axis.
    return Rz(-deg2rad(yaw_deg)) * Rx(deg2rad(pitch_deg + 90.0)) * Rz(-deg2rad(roll_deg));
}

Eigen::Vector3d worldRotationToGimbal(const Eigen::Matrix3d& R) {
    // R = Rz(a) @ Rx(t) @ Rz(b), a = -yaw, t = pitch + 90, b = -roll
    double t = std::acos(std::clamp(R(2, 2), -1.0, 1.0));
    double a, b;

    if (std::abs(std::sin(t)) > 1e-9) {
        b = std::atan2(R(2, 0), R(2, 1));
        a = std::atan2(R(0, 2), -R(1, 2));
    } else {
        // Gimbal lock: Rz(a) and Rz(b) share an axis
        b = 0.0;
        a = std::atan2(R(1, 0), R(0, 0));
    }

    double pitch = rad2deg(t) - 90.0;
    double roll = wrapAngleDeg(-rad2deg(b));
    double yaw = wrapAngleDeg(-rad2deg(a));
    return Eigen::Vector3d(pitch, roll, yaw);
}

} // namespace drone_georef
