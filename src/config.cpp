/**
 * @file config.cpp
 * @brief Configuration validation and JSON loading
 */

#include "drone_georef/config.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace drone_georef {

using json = nlohmann::json;

void Config::validate() const {
    if (!(polar_latitude_limit_deg > 0.0 && polar_latitude_limit_deg < 90.0)) {
        throw std::invalid_argument("polar_latitude_limit_deg must be in (0, 90)");
    }
    if (!std::isfinite(geoid_offset_m)) {
        throw std::invalid_argument("geoid_offset_m must be finite");
    }
    if (!(terrain_convergence_m > 0.0)) {
        throw std::invalid_argument("terrain_convergence_m must be positive");
    }
    if (terrain_max_iterations < 1) {
        throw std::invalid_argument("terrain_max_iterations must be >= 1");
    }
    if (batch_threads < 0) {
        throw std::invalid_argument("batch_threads must be >= 0");
    }
    if (!(default_pose.altitude_m > 0.0)) {
        throw std::invalid_argument("default altitude_m must be positive");
    }
    if (default_pose.image_width_px <= 0 || default_pose.image_height_px <= 0) {
        throw std::invalid_argument("default image size must be positive");
    }
    if (!(default_pose.horizontal_fov_deg > 0.0 && default_pose.horizontal_fov_deg < 180.0)) {
        throw std::invalid_argument("default horizontal_fov_deg must be in (0, 180)");
    }
}

PitchConvention pitchConventionFromString(const std::string& name) {
    if (name == "NEG90_IS_NADIR" || name == "neg90_is_nadir") {
        return PitchConvention::NEG90_IS_NADIR;
    }
    if (name == "ZERO_IS_NADIR" || name == "zero_is_nadir") {
        return PitchConvention::ZERO_IS_NADIR;
    }
    throw std::invalid_argument("Unknown pitch convention: " + name);
}

Config configFromJson(const json& j) {
    Config config;
    if (!j.is_object()) {
        throw std::invalid_argument("Config JSON must be an object");
    }

    if (j.contains("pitch_convention")) {
        config.pitch_convention =
            pitchConventionFromString(j["pitch_convention"].get<std::string>());
    }
    config.gimbal_yaw_relative = j.value("gimbal_yaw_relative", config.gimbal_yaw_relative);
    config.polar_latitude_limit_deg =
        j.value("polar_latitude_limit_deg", config.polar_latitude_limit_deg);
    config.geoid_offset_m = j.value("geoid_offset_m", config.geoid_offset_m);
    config.terrain_convergence_m = j.value("terrain_convergence_m", config.terrain_convergence_m);
    config.terrain_max_iterations =
        j.value("terrain_max_iterations", config.terrain_max_iterations);
    config.use_best_estimate_on_no_convergence =
        j.value("use_best_estimate_on_no_convergence",
                config.use_best_estimate_on_no_convergence);
    config.batch_threads = j.value("batch_threads", config.batch_threads);
    config.verbose = j.value("verbose", config.verbose);

    if (j.contains("default_pose")) {
        const json& d = j["default_pose"];
        PoseDefaults& p = config.default_pose;
        p.altitude_m = d.value("altitude_m", p.altitude_m);
        p.gimbal_pitch_from_nadir_deg =
            d.value("gimbal_pitch_from_nadir_deg", p.gimbal_pitch_from_nadir_deg);
        p.gimbal_roll_deg = d.value("gimbal_roll_deg", p.gimbal_roll_deg);
        p.gimbal_yaw_deg = d.value("gimbal_yaw_deg", p.gimbal_yaw_deg);
        p.image_width_px = d.value("image_width_px", p.image_width_px);
        p.image_height_px = d.value("image_height_px", p.image_height_px);
        p.horizontal_fov_deg = d.value("horizontal_fov_deg", p.horizontal_fov_deg);
    }

    config.validate();
    return config;
}

Config loadConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse config file " + path + ": " + e.what());
    }
    return configFromJson(j);
}

} // namespace drone_georef
