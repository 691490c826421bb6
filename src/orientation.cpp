/**
 * @file orientation.cpp
 * @brief Implementation of OrientationComposer
 */

#include "drone_georef/orientation.hpp"

namespace drone_georef {

OrientationComposer::OrientationComposer(const Config& config)
    : config_(config) {
}

double OrientationComposer::effectiveYawDeg(const CameraPose& pose) const {
    double yaw = pose.gimbal_yaw_deg;
    if (config_.gimbal_yaw_relative && pose.aircraft_yaw_deg) {
        yaw += *pose.aircraft_yaw_deg;
    }
    return wrapAngleDeg(yaw);
}

Eigen::Matrix3d OrientationComposer::getR_WC(const CameraPose& pose) const {
    return gimbalToWorldRotation(
        pose.gimbal_pitch_deg,
        pose.gimbal_roll_deg,
        effectiveYawDeg(pose)
    );
}

Eigen::Vector3d OrientationComposer::cameraRayToWorldRay(
    const Eigen::Vector3d& ray_C,
    const CameraPose& pose
) const {
    return (getR_WC(pose) * ray_C).normalized();
}

Eigen::Vector3d cameraRayToWorldRay(const Eigen::Vector3d& ray_C, const CameraPose& pose) {
    static const OrientationComposer composer{Config()};
    return composer.cameraRayToWorldRay(ray_C, pose);
}

} // namespace drone_georef
