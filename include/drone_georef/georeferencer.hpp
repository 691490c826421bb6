/**
 * @file georeferencer.hpp
 * @brief Georeferencing API: pixels and annotation polygons to WGS84
 */

#pragma once

#include "common.hpp"
#include "calibration.hpp"
#include "config.hpp"
#include "data_types.hpp"
#include "elevation_model.hpp"
#include "polygon_processor.hpp"
#include "projector.hpp"
#include <nlohmann/json_fwd.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace drone_georef {

/**
 * @brief Entry point for georeferencing drone imagery annotations
 *
 * Stateless apart from its Config: every call is independent and the
 * object may be shared between threads.
 *
 * Example usage:
 * ```cpp
 * auto georef = createGeoreferencer();
 *
 * CameraPose pose = georef->poseFromMetadata(exif_json);
 *
 * // Single point, flat ground
 * GeoPoint p = georef->pixelToGeo(PixelPoint(1200, 800), pose);
 *
 * // With a surface model; falls back to flat ground where it has no data
 * GeoPoint q = georef->pixelToGeoWithDSM(PixelPoint(1200, 800), pose, dsm);
 *
 * // Whole annotation
 * PolygonResult r = georef->projectPolygon(pixels, pose, ProjectorKind::TERRAIN_AWARE, &dsm);
 * if (r.failed()) {
 *     // keep the annotation with pixel coordinates only
 * }
 * ```
 */
class Georeferencer {
public:
    /**
     * @throws std::invalid_argument if the config is invalid
     */
    explicit Georeferencer(const Config& config = Config());

    ~Georeferencer();

    // =========================================================================
    // METADATA
    // =========================================================================

    /**
     * @brief Typed pose from raw capture metadata (precision fields included)
     * @param profiles Optional camera profiles for calibrated fields
     */
    CameraPose poseFromMetadata(
        const nlohmann::json& raw,
        const CameraProfileStore* profiles = nullptr
    ) const;

    // =========================================================================
    // SINGLE POINT
    // =========================================================================

    /**
     * @brief Flat-ground georeferencing of one pixel
     *
     * @throws std::invalid_argument if the pose is invalid
     * @throws GeoreferenceError (NO_GROUND_INTERSECTION, POLAR_SINGULARITY)
     */
    GeoPoint pixelToGeo(const PixelPoint& pixel, const CameraPose& pose) const;

    /**
     * @brief Terrain-aware georeferencing of one pixel
     *
     * TERRAIN_UNAVAILABLE falls back to flat ground. NO_CONVERGENCE returns
     * the best terrain estimate (or flat ground, see
     * Config::use_best_estimate_on_no_convergence).
     *
     * @throws std::invalid_argument if the pose is invalid
     * @throws GeoreferenceError (NO_GROUND_INTERSECTION, POLAR_SINGULARITY)
     */
    GeoPoint pixelToGeoWithDSM(
        const PixelPoint& pixel,
        const CameraPose& pose,
        const ElevationModel& dsm
    ) const;

    // =========================================================================
    // POLYGONS
    // =========================================================================

    /**
     * @brief Georeference an annotation polygon
     *
     * TERRAIN_AWARE uses the same fallbacks as pixelToGeoWithDSM() per
     * vertex; without a DSM it runs flat ground. Vertex failures are
     * counted in the result, never thrown.
     *
     * @throws std::invalid_argument if the pose is invalid
     */
    PolygonResult projectPolygon(
        const std::vector<PixelPoint>& pixels,
        const CameraPose& pose,
        ProjectorKind kind = ProjectorKind::FLAT_GROUND,
        const ElevationModel* dsm = nullptr
    ) const;

    /**
     * @brief Parallel projectPolygon() over many jobs, results in job order
     * @throws std::invalid_argument if any pose is invalid
     */
    std::vector<PolygonResult> projectPolygons(
        const std::vector<PolygonJob>& jobs,
        ProjectorKind kind = ProjectorKind::FLAT_GROUND,
        const ElevationModel* dsm = nullptr
    ) const;

    /**
     * @brief Ground footprint of the whole image
     * @throws std::invalid_argument if the pose is invalid
     */
    PolygonResult imageFootprint(
        const CameraPose& pose,
        ProjectorKind kind = ProjectorKind::FLAT_GROUND,
        const ElevationModel* dsm = nullptr
    ) const;

    // =========================================================================
    // STATUS
    // =========================================================================

    /**
     * @brief Camera geometry of a pose for debugging
     *
     * Keys: fx, fy, cx, cy, horizontal_fov_deg, vertical_fov_deg,
     * effective_yaw_deg, center_ray_east/north/up, gsd_center_m (NaN when
     * the centre ray misses the ground), footprint_area_m2 (NaN when any
     * corner misses), has_lrf, lrf_target_offset_m (horizontal distance
     * from the ranged optical axis to the reported LRF target; NaN without
     * range and target).
     */
    std::map<std::string, double> describe(const CameraPose& pose) const;

    const Config& config() const { return config_; }

private:
    void checkPose(const CameraPose& pose) const;

    std::unique_ptr<Projector> selectProjector(
        ProjectorKind kind,
        const ElevationModel* dsm
    ) const;

    Config config_;
    std::unique_ptr<FlatGroundProjector> flat_;
};

/**
 * @brief Convenience function to create a Georeferencer
 *
 * @param config_path JSON config file; empty for defaults
 * @throws std::runtime_error if the file cannot be read
 * @throws std::invalid_argument if a config value is invalid
 */
std::unique_ptr<Georeferencer> createGeoreferencer(const std::string& config_path = "");

} // namespace drone_georef
