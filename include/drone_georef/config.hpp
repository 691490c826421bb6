/**
 * @file config.hpp
 * @brief Georeferencing configuration parameters
 */

#pragma once

#include "common.hpp"
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace drone_georef {

/**
 * @brief Values used for capture metadata fields that are missing
 */
struct PoseDefaults {
    double altitude_m = 100.0;
    double gimbal_pitch_from_nadir_deg = 0.0;  ///< 0 = straight down, any convention
    double gimbal_roll_deg = 0.0;
    double gimbal_yaw_deg = 0.0;
    int image_width_px = 4000;
    int image_height_px = 3000;
    double horizontal_fov_deg = 84.0;
};

/**
 * @brief System configuration with all tunable parameters
 */
struct Config {
    // =========================================================================
    // METADATA INTERPRETATION
    // =========================================================================

    /// Zero reference of gimbal pitch in the upstream metadata
    PitchConvention pitch_convention = PitchConvention::NEG90_IS_NADIR;

    /// Gimbal yaw is relative to the airframe (add aircraft yaw)
    bool gimbal_yaw_relative = false;

    PoseDefaults default_pose;

    // =========================================================================
    // PROJECTION
    // =========================================================================

    double polar_latitude_limit_deg = 89.9;  ///< Beyond this, PolarSingularity

    /// Geoid undulation: AbsoluteAltitude minus the DSM height datum (meters)
    double geoid_offset_m = 0.0;

    // --- Terrain ray marching ---
    double terrain_convergence_m = 0.5;   ///< |ray elevation - terrain| threshold
    int terrain_max_iterations = 20;

    /// On NoConvergence return the best intermediate estimate instead of flat ground
    bool use_best_estimate_on_no_convergence = true;

    // =========================================================================
    // BATCH / DIAGNOSTICS
    // =========================================================================

    int batch_threads = 0;  ///< 0 = std::thread::hardware_concurrency()
    bool verbose = false;   ///< Print fallbacks and setup to stdout/stderr

    /**
     * @brief Check parameter ranges
     * @throws std::invalid_argument on the first invalid field
     */
    void validate() const;
};

/**
 * @brief Parse a pitch convention name ("NEG90_IS_NADIR" / "ZERO_IS_NADIR")
 * @throws std::invalid_argument for unknown names
 */
PitchConvention pitchConventionFromString(const std::string& name);

/**
 * @brief Build a Config from a JSON object
 *
 * Keys are optional; absent keys keep their defaults. The "default_pose"
 * key holds a nested object with PoseDefaults fields.
 *
 * @throws std::invalid_argument if a value is out of range
 */
Config configFromJson(const nlohmann::json& j);

/**
 * @brief Load Config from a JSON file
 * @throws std::runtime_error if the file cannot be opened or parsed
 */
Config loadConfig(const std::string& path);

} // namespace drone_georef
