/**
 * @file orientation.hpp
 * @brief Composes gimbal angles into a camera-to-world rotation
 */

#pragma once

#include "common.hpp"
#include "config.hpp"
#include "coordinate_frames.hpp"
#include "data_types.hpp"
#include <Eigen/Dense>

namespace drone_georef {

/**
 * @brief Rotates camera-frame rays into the ENU world frame
 *
 * Convention: R_WC (Camera -> World), order yaw * pitch * roll.
 * Stateless apart from the configuration; safe to share between threads.
 */
class OrientationComposer {
public:
    explicit OrientationComposer(const Config& config);

    /**
     * @brief Heading used for the yaw rotation
     *
     * Gimbal yaw alone, unless the configuration marks gimbal yaw as
     * relative to the airframe and the pose reports an aircraft yaw.
     */
    double effectiveYawDeg(const CameraPose& pose) const;

    /**
     * @brief Get Camera-to-World rotation
     *
     * R_WC transforms vectors from Camera frame to World frame:
     *     v_W = R_WC @ v_C
     */
    Eigen::Matrix3d getR_WC(const CameraPose& pose) const;

    /**
     * @brief Rotate a camera-frame ray into the world frame
     *
     * Always returns a unit vector. The result may point at or above the
     * horizon (z >= 0); see pointsToGround().
     */
    Eigen::Vector3d cameraRayToWorldRay(const Eigen::Vector3d& ray_C,
                                        const CameraPose& pose) const;

private:
    Config config_;  // Store by value
};

/**
 * @brief cameraRayToWorldRay() with absolute gimbal yaw
 */
Eigen::Vector3d cameraRayToWorldRay(const Eigen::Vector3d& ray_C, const CameraPose& pose);

/**
 * @brief True if a world (ENU) ray descends towards the ground
 */
inline bool pointsToGround(const Eigen::Vector3d& ray_W) {
    return ray_W.z() < 0.0;
}

} // namespace drone_georef
