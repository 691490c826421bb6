/**
 * @file projector.cpp
 * @brief Implementation of flat-ground and terrain-aware projectors
 */

#include "drone_georef/projector.hpp"
#include "drone_georef/camera_model.hpp"
#include "drone_georef/coordinate_frames.hpp"
#include <cmath>
#include <iostream>
#include <limits>

namespace drone_georef {

// ============================================================================
// Free functions
// ============================================================================

std::optional<double> resolveSlantDistance(const CameraPose& pose) {
    if (pose.lrf_distance_m && std::isfinite(*pose.lrf_distance_m) &&
        *pose.lrf_distance_m > 0.0) {
        return *pose.lrf_distance_m;
    }
    return std::nullopt;
}

GeoPoint offsetToGeo(
    double latitude,
    double longitude,
    double east_m,
    double north_m,
    double polar_limit_deg
) {
    if (std::abs(latitude) > polar_limit_deg) {
        throw GeoreferenceError(
            GeoErrorKind::POLAR_SINGULARITY,
            "latitude " + std::to_string(latitude) + " beyond +/-" +
            std::to_string(polar_limit_deg) + " degrees");
    }

    double dlat = north_m / kMetersPerDegree;
    double dlon = east_m / (kMetersPerDegree * std::cos(deg2rad(latitude)));
    return GeoPoint(latitude + dlat, wrapAngleDeg(longitude + dlon));
}

Eigen::Vector2d geoToOffset(const GeoPoint& origin, const GeoPoint& point) {
    double north = (point.latitude - origin.latitude) * kMetersPerDegree;
    double east = wrapAngleDeg(point.longitude - origin.longitude) *
                  kMetersPerDegree * std::cos(deg2rad(origin.latitude));
    return Eigen::Vector2d(east, north);
}

// ============================================================================
// Projector
// ============================================================================

Projector::Projector(const Config& config)
    : config_(config), composer_(config) {
    config_.validate();
}

Eigen::Vector3d Projector::worldRay(const PixelPoint& pixel, const CameraPose& pose) const {
    return composer_.cameraRayToWorldRay(pixelToCameraRay(pixel, pose), pose);
}

GeoPoint Projector::projectPixel(const PixelPoint& pixel, const CameraPose& pose) const {
    return project(worldRay(pixel, pose), pose);
}

// ============================================================================
// FlatGroundProjector
// ============================================================================

FlatGroundProjector::FlatGroundProjector(const Config& config)
    : Projector(config) {
}

double FlatGroundProjector::slantDistance(const Eigen::Vector3d& ray_W,
                                          const CameraPose& pose) const {
    if (auto lrf = resolveSlantDistance(pose)) {
        return *lrf;
    }
    if (!pointsToGround(ray_W)) {
        throw GeoreferenceError(
            GeoErrorKind::NO_GROUND_INTERSECTION,
            "ray points at or above the horizon (z=" + std::to_string(ray_W.z()) + ")");
    }
    if (!(pose.altitude_m > 0.0)) {
        throw GeoreferenceError(
            GeoErrorKind::NO_GROUND_INTERSECTION,
            "camera is not above the ground plane (altitude " +
            std::to_string(pose.altitude_m) + "m)");
    }
    return pose.altitude_m / -ray_W.z();
}

GeoPoint FlatGroundProjector::project(const Eigen::Vector3d& ray_W,
                                      const CameraPose& pose) const {
    double t = slantDistance(ray_W, pose);
    return offsetToGeo(pose.latitude, pose.longitude,
                       ray_W.x() * t, ray_W.y() * t,
                       config_.polar_latitude_limit_deg);
}

// ============================================================================
// TerrainAwareProjector
// ============================================================================

std::map<std::string, double> TerrainSolution::toMap() const {
    std::map<std::string, double> m;
    m["latitude"] = point.latitude;
    m["longitude"] = point.longitude;
    m["elevation_m"] = point.elevation_m ? *point.elevation_m
                                         : std::numeric_limits<double>::quiet_NaN();
    m["iterations"] = iterations;
    m["residual_m"] = residual_m;
    m["converged"] = converged ? 1.0 : 0.0;
    m["used_lrf"] = used_lrf ? 1.0 : 0.0;
    return m;
}

TerrainAwareProjector::TerrainAwareProjector(const ElevationModel& dsm, const Config& config)
    : Projector(config), dsm_(dsm) {
}

TerrainSolution TerrainAwareProjector::solve(const Eigen::Vector3d& ray_W,
                                             const CameraPose& pose) const {
    const double polar = config_.polar_latitude_limit_deg;

    auto lrf = resolveSlantDistance(pose);

    // Camera elevation above the DSM datum; terrain seeded by the LRF target
    std::optional<double> camera_elev;
    if (pose.absolute_altitude_m) {
        camera_elev = *pose.absolute_altitude_m - config_.geoid_offset_m;
    }
    std::optional<double> terrain = pose.lrf_target_altitude_m;
    if (!camera_elev && terrain && lrf) {
        // The target lies one measured range down the optical axis
        Eigen::Vector3d boresight =
            composer_.cameraRayToWorldRay(Eigen::Vector3d(0.0, 0.0, -1.0), pose);
        if (pointsToGround(boresight)) {
            camera_elev = *terrain - boresight.z() * *lrf;
        }
    }
    if (!camera_elev) {
        auto under_camera = dsm_.elevationAt(pose.latitude, pose.longitude);
        if (under_camera) {
            if (!terrain) {
                terrain = *under_camera;
            }
            camera_elev = *under_camera + pose.altitude_m;
        }
    }

    TerrainSolution solution;

    // Measured range: no surface intersection needed
    if (lrf) {
        double d = *lrf;
        solution.point = offsetToGeo(pose.latitude, pose.longitude,
                                     ray_W.x() * d, ray_W.y() * d, polar);
        if (camera_elev) {
            solution.point.elevation_m = *camera_elev + ray_W.z() * d;
        }
        solution.converged = true;
        solution.used_lrf = true;
        return solution;
    }

    if (!pointsToGround(ray_W)) {
        throw GeoreferenceError(
            GeoErrorKind::NO_GROUND_INTERSECTION,
            "ray points at or above the horizon (z=" + std::to_string(ray_W.z()) + ")");
    }

    const double descent = -ray_W.z();
    const double initial_height = (camera_elev && terrain) ? *camera_elev - *terrain
                                                           : pose.altitude_m;
    if (!(initial_height > 0.0)) {
        throw GeoreferenceError(
            GeoErrorKind::NO_GROUND_INTERSECTION,
            "camera is not above the terrain (height " + std::to_string(initial_height) + "m)");
    }
    double t = initial_height / descent;  // flat-ground initial guess

    GeoPoint best;
    double best_abs = std::numeric_limits<double>::infinity();
    double best_residual = 0.0;

    for (int i = 1; i <= config_.terrain_max_iterations; ++i) {
        GeoPoint ground = offsetToGeo(pose.latitude, pose.longitude,
                                      ray_W.x() * t, ray_W.y() * t, polar);

        auto sample = dsm_.elevationAt(ground.latitude, ground.longitude);
        if (sample) {
            terrain = *sample;
        } else if (!terrain) {
            throw GeoreferenceError(
                GeoErrorKind::TERRAIN_UNAVAILABLE,
                "no DSM data at " + ground.toString());
        }

        if (!camera_elev) {
            camera_elev = *terrain + pose.altitude_m;
        }

        double ray_elev = *camera_elev - descent * t;
        double residual = ray_elev - *terrain;
        ground.elevation_m = *terrain;

        if (std::abs(residual) < best_abs) {
            best_abs = std::abs(residual);
            best_residual = residual;
            best = ground;
        }

        solution.iterations = i;
        if (std::abs(residual) < config_.terrain_convergence_m) {
            solution.point = ground;
            solution.residual_m = residual;
            solution.converged = true;
            return solution;
        }

        double height_above_terrain = *camera_elev - *terrain;
        if (height_above_terrain <= 0.0) {
            throw GeoreferenceError(
                GeoErrorKind::NO_GROUND_INTERSECTION,
                "terrain at " + ground.toString() + " rises above the camera");
        }
        t = height_above_terrain / descent;
    }

    solution.point = best;
    solution.residual_m = best_residual;
    solution.converged = false;
    return solution;
}

GeoPoint TerrainAwareProjector::project(const Eigen::Vector3d& ray_W,
                                        const CameraPose& pose) const {
    TerrainSolution solution = solve(ray_W, pose);
    if (!solution.converged) {
        throw GeoreferenceError(
            GeoErrorKind::NO_CONVERGENCE,
            "residual " + std::to_string(solution.residual_m) + "m after " +
            std::to_string(solution.iterations) + " iterations",
            solution.point);
    }
    return solution.point;
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<Projector> makeProjector(
    ProjectorKind kind,
    const Config& config,
    const ElevationModel* dsm
) {
    if (kind == ProjectorKind::TERRAIN_AWARE) {
        if (dsm != nullptr) {
            return std::make_unique<TerrainAwareProjector>(*dsm, config);
        }
        if (config.verbose) {
            std::cerr << "[makeProjector] TERRAIN_AWARE requested without a DSM, "
                      << "using FLAT_GROUND\n";
        }
    }
    return std::make_unique<FlatGroundProjector>(config);
}

} // namespace drone_georef
