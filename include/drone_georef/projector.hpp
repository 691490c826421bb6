/**
 * @file projector.hpp
 * @brief Ground intersection of world rays: flat-ground and terrain-aware
 */

#pragma once

#include "common.hpp"
#include "config.hpp"
#include "data_types.hpp"
#include "elevation_model.hpp"
#include "errors.hpp"
#include "orientation.hpp"
#include <Eigen/Dense>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace drone_georef {

// ============================================================================
// Laser rangefinder override
// ============================================================================

/**
 * @brief Measured slant distance to the target, if usable
 *
 * @return lrf_distance_m when present, finite and positive; nullopt
 *         means the caller intersects a surface instead
 */
std::optional<double> resolveSlantDistance(const CameraPose& pose);

// ============================================================================
// Local tangent plane <-> geographic
// ============================================================================

/**
 * @brief Shift a geographic point by a local East/North offset
 *
 * Equirectangular approximation:
 *     dlat = north / M,  dlon = east / (M cos(lat)),  M = 2 pi R / 360
 *
 * The resulting longitude is wrapped to (-180, 180].
 *
 * @throws GeoreferenceError(POLAR_SINGULARITY) when |latitude| > polar_limit_deg
 */
GeoPoint offsetToGeo(
    double latitude,
    double longitude,
    double east_m,
    double north_m,
    double polar_limit_deg = 89.9
);

/**
 * @brief Inverse of offsetToGeo(): local (east, north) of a point, meters
 *
 * The longitude difference takes the short way across the antimeridian.
 */
Eigen::Vector2d geoToOffset(const GeoPoint& origin, const GeoPoint& point);

// ============================================================================
// Projectors
// ============================================================================

/**
 * @brief Resolves a world-space ray from the camera to a ground point
 *
 * Variants are selected explicitly by ProjectorKind. The laser
 * rangefinder override is checked by every variant before any surface
 * intersection. Projectors are immutable and may be shared between
 * threads.
 */
class Projector {
public:
    explicit Projector(const Config& config);
    virtual ~Projector() = default;

    /**
     * @brief Ground point hit by a world (ENU) ray leaving the camera
     * @throws GeoreferenceError
     */
    virtual GeoPoint project(const Eigen::Vector3d& ray_W, const CameraPose& pose) const = 0;

    virtual ProjectorKind kind() const = 0;

    /**
     * @brief Camera model + orientation + project() for one pixel
     * @throws GeoreferenceError
     */
    GeoPoint projectPixel(const PixelPoint& pixel, const CameraPose& pose) const;

    /**
     * @brief World ray through a pixel
     */
    Eigen::Vector3d worldRay(const PixelPoint& pixel, const CameraPose& pose) const;

    const Config& config() const { return config_; }

protected:
    Config config_;
    OrientationComposer composer_;
};

/**
 * @brief Intersects rays with a horizontal plane altitude_m below the camera
 */
class FlatGroundProjector : public Projector {
public:
    explicit FlatGroundProjector(const Config& config = Config());

    GeoPoint project(const Eigen::Vector3d& ray_W, const CameraPose& pose) const override;

    ProjectorKind kind() const override { return ProjectorKind::FLAT_GROUND; }

    /**
     * @brief Distance along the ray to the target (LRF or plane intersection)
     * @throws GeoreferenceError(NO_GROUND_INTERSECTION) without LRF if ray.z >= 0
     *         or altitude_m <= 0
     */
    double slantDistance(const Eigen::Vector3d& ray_W, const CameraPose& pose) const;
};

/**
 * @brief Outcome of one terrain ray march
 */
struct TerrainSolution {
    GeoPoint point;           ///< Best estimate (elevation set when known)
    int iterations = 0;       ///< DSM samples along the ray
    double residual_m = 0.0;  ///< Ray elevation minus terrain at the estimate
    bool converged = false;
    bool used_lrf = false;

    std::map<std::string, double> toMap() const;
};

/**
 * @brief Intersects rays with a digital surface model
 *
 * Iterates from the flat-ground estimate: sample terrain at the current
 * ground point, compare with the ray's elevation there, re-intersect with
 * the horizontal plane at the sampled height. Stops when the residual is
 * below Config::terrain_convergence_m or after
 * Config::terrain_max_iterations samples.
 *
 * Camera elevation, first available of:
 *   - absolute_altitude_m - Config::geoid_offset_m
 *   - LRF target altitude + range * descent of the optical axis
 *   - terrain under the camera + altitude_m
 *   - first terrain sample along the ray + altitude_m
 *
 * The LRF target altitude, when reported, is the initial terrain height and
 * stands in for DSM samples that are missing.
 *
 * Does not cache; each call performs one or more DSM lookups.
 */
class TerrainAwareProjector : public Projector {
public:
    TerrainAwareProjector(const ElevationModel& dsm, const Config& config = Config());

    /**
     * @throws GeoreferenceError: TERRAIN_UNAVAILABLE, NO_CONVERGENCE (with best
     *         estimate), NO_GROUND_INTERSECTION, POLAR_SINGULARITY
     */
    GeoPoint project(const Eigen::Vector3d& ray_W, const CameraPose& pose) const override;

    ProjectorKind kind() const override { return ProjectorKind::TERRAIN_AWARE; }

    /**
     * @brief Run the ray march and report diagnostics
     *
     * Exhausting the iteration budget is reported as converged = false,
     * not thrown.
     *
     * @throws GeoreferenceError: TERRAIN_UNAVAILABLE, NO_GROUND_INTERSECTION,
     *         POLAR_SINGULARITY
     */
    TerrainSolution solve(const Eigen::Vector3d& ray_W, const CameraPose& pose) const;

private:
    const ElevationModel& dsm_;
};

/**
 * @brief Create a projector variant
 *
 * TERRAIN_AWARE without a DSM yields a FlatGroundProjector. The DSM must
 * outlive the returned projector.
 */
std::unique_ptr<Projector> makeProjector(
    ProjectorKind kind,
    const Config& config,
    const ElevationModel* dsm = nullptr
);

} // namespace drone_georef
