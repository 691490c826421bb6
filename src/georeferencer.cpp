/**
 * @file georeferencer.cpp
 * @brief Implementation of the Georeferencer API
 */

#include "drone_georef/georeferencer.hpp"
#include "drone_georef/camera_model.hpp"
#include "drone_georef/orientation.hpp"
#include "drone_georef/parameter_extractor.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace drone_georef {

namespace {

/**
 * Terrain-aware projection with the recoverable errors resolved:
 * TERRAIN_UNAVAILABLE -> flat ground, NO_CONVERGENCE -> best estimate or
 * flat ground.
 */
class FallbackTerrainProjector : public Projector {
public:
    FallbackTerrainProjector(const ElevationModel& dsm, const Config& config)
        : Projector(config), terrain_(dsm, config), flat_(config) {}

    GeoPoint project(const Eigen::Vector3d& ray_W, const CameraPose& pose) const override {
        try {
            return terrain_.project(ray_W, pose);
        } catch (const GeoreferenceError& e) {
            if (!e.recoverable()) {
                throw;
            }
            if (e.kind() == GeoErrorKind::NO_CONVERGENCE &&
                config_.use_best_estimate_on_no_convergence && e.bestEstimate()) {
                if (config_.verbose) {
                    std::cerr << "[Georeferencer] " << e.what()
                              << ", using best terrain estimate\n";
                }
                return *e.bestEstimate();
            }
            if (config_.verbose) {
                std::cerr << "[Georeferencer] " << e.what()
                          << ", falling back to flat ground\n";
            }
            return flat_.project(ray_W, pose);
        }
    }

    ProjectorKind kind() const override { return ProjectorKind::TERRAIN_AWARE; }

private:
    TerrainAwareProjector terrain_;
    FlatGroundProjector flat_;
};

} // namespace

Georeferencer::Georeferencer(const Config& config)
    : config_(config) {
    config_.validate();
    flat_ = std::make_unique<FlatGroundProjector>(config_);

    if (config_.verbose) {
        std::cout << "[Georeferencer] Initialized\n";
        std::cout << "  Pitch convention: " << toString(config_.pitch_convention) << "\n";
        std::cout << "  Gimbal yaw relative: " << (config_.gimbal_yaw_relative ? "yes" : "no")
                  << "\n";
        std::cout << "  Terrain: " << config_.terrain_convergence_m << "m / "
                  << config_.terrain_max_iterations << " iterations\n";
    }
}

Georeferencer::~Georeferencer() = default;

// =============================================================================
// METADATA
// =============================================================================

CameraPose Georeferencer::poseFromMetadata(
    const nlohmann::json& raw,
    const CameraProfileStore* profiles
) const {
    return extractPrecisionPose(raw, config_, profiles);
}

// =============================================================================
// SINGLE POINT
// =============================================================================

void Georeferencer::checkPose(const CameraPose& pose) const {
    auto problems = validatePose(pose);
    if (problems.empty()) {
        return;
    }

    std::string message = "Invalid camera pose:";
    for (const auto& p : problems) {
        message += " " + p + ";";
    }
    throw std::invalid_argument(message);
}

GeoPoint Georeferencer::pixelToGeo(const PixelPoint& pixel, const CameraPose& pose) const {
    checkPose(pose);
    return flat_->projectPixel(pixel, pose);
}

GeoPoint Georeferencer::pixelToGeoWithDSM(
    const PixelPoint& pixel,
    const CameraPose& pose,
    const ElevationModel& dsm
) const {
    checkPose(pose);
    FallbackTerrainProjector projector(dsm, config_);
    return projector.projectPixel(pixel, pose);
}

// =============================================================================
// POLYGONS
// =============================================================================

std::unique_ptr<Projector> Georeferencer::selectProjector(
    ProjectorKind kind,
    const ElevationModel* dsm
) const {
    if (kind == ProjectorKind::TERRAIN_AWARE && dsm != nullptr) {
        return std::make_unique<FallbackTerrainProjector>(*dsm, config_);
    }
    return makeProjector(kind, config_, dsm);
}

PolygonResult Georeferencer::projectPolygon(
    const std::vector<PixelPoint>& pixels,
    const CameraPose& pose,
    ProjectorKind kind,
    const ElevationModel* dsm
) const {
    checkPose(pose);
    auto projector = selectProjector(kind, dsm);
    return drone_georef::projectPolygon(pixels, pose, *projector);
}

std::vector<PolygonResult> Georeferencer::projectPolygons(
    const std::vector<PolygonJob>& jobs,
    ProjectorKind kind,
    const ElevationModel* dsm
) const {
    for (const auto& job : jobs) {
        checkPose(job.pose);
    }
    auto projector = selectProjector(kind, dsm);
    return drone_georef::projectPolygons(jobs, *projector, config_.batch_threads);
}

PolygonResult Georeferencer::imageFootprint(
    const CameraPose& pose,
    ProjectorKind kind,
    const ElevationModel* dsm
) const {
    checkPose(pose);
    auto projector = selectProjector(kind, dsm);
    return drone_georef::imageFootprint(pose, *projector);
}

// =============================================================================
// STATUS
// =============================================================================

std::map<std::string, double> Georeferencer::describe(const CameraPose& pose) const {
    checkPose(pose);
    const double nan = std::numeric_limits<double>::quiet_NaN();

    std::map<std::string, double> info;

    CameraIntrinsics intrinsics = intrinsicsFor(pose);
    info["fx"] = intrinsics.fx;
    info["fy"] = intrinsics.fy;
    info["cx"] = intrinsics.cx;
    info["cy"] = intrinsics.cy;
    info["horizontal_fov_deg"] = rad2deg(2.0 * std::atan(intrinsics.width / (2.0 * intrinsics.fx)));
    info["vertical_fov_deg"] = verticalFovDeg(pose);

    OrientationComposer composer(config_);
    info["effective_yaw_deg"] = composer.effectiveYawDeg(pose);

    PixelPoint center(intrinsics.cx, intrinsics.cy);
    Eigen::Vector3d ray = flat_->worldRay(center, pose);
    info["center_ray_east"] = ray.x();
    info["center_ray_north"] = ray.y();
    info["center_ray_up"] = ray.z();

    info["gsd_center_m"] = nan;
    try {
        GeoPoint a = flat_->projectPixel(center, pose);
        GeoPoint b = flat_->projectPixel(PixelPoint(center.x + 1.0, center.y), pose);
        info["gsd_center_m"] = geoToOffset(a, b).norm();
    } catch (const GeoreferenceError& e) {
        if (config_.verbose) {
            std::cerr << "[Georeferencer] describe: " << e.what() << "\n";
        }
    }

    PolygonResult footprint = drone_georef::imageFootprint(pose, *flat_);
    info["footprint_area_m2"] = footprint.failed_vertices == 0
        ? polygonAreaSquareMeters(footprint.polygon) : nan;

    info["has_lrf"] = resolveSlantDistance(pose) ? 1.0 : 0.0;

    // Distance between the reported LRF target and the ranged optical axis
    info["lrf_target_offset_m"] = nan;
    if (resolveSlantDistance(pose) && pose.hasLrfTarget()) {
        try {
            GeoPoint ranged = flat_->projectPixel(center, pose);
            GeoPoint target(*pose.lrf_target_latitude, *pose.lrf_target_longitude);
            info["lrf_target_offset_m"] = geoToOffset(ranged, target).norm();
        } catch (const GeoreferenceError& e) {
            if (config_.verbose) {
                std::cerr << "[Georeferencer] describe: " << e.what() << "\n";
            }
        }
    }

    return info;
}

// =============================================================================
// Factory
// =============================================================================

std::unique_ptr<Georeferencer> createGeoreferencer(const std::string& config_path) {
    Config config = config_path.empty() ? Config() : loadConfig(config_path);
    return std::make_unique<Georeferencer>(config);
}

} // namespace drone_georef
