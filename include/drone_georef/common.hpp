/**
 * @file common.hpp
 * @brief Common enums, constants, and utilities for georeferencing
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <memory>
#include <optional>

namespace drone_georef {

// ============================================================================
// Constants
// ============================================================================

constexpr double kPi = 3.14159265358979323846;

/// WGS84 equatorial radius (meters)
constexpr double kEarthRadiusM = 6378137.0;

/// Meters per degree of arc on the equatorial great circle (2*pi*R/360)
constexpr double kMetersPerDegree = 2.0 * kPi * kEarthRadiusM / 360.0;

constexpr double kDegToRad = kPi / 180.0;
constexpr double kRadToDeg = 180.0 / kPi;

inline double deg2rad(double deg) { return deg * kDegToRad; }
inline double rad2deg(double rad) { return rad * kRadToDeg; }

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Zero reference of the gimbal pitch angle in upstream metadata
 */
enum class PitchConvention {
    NEG90_IS_NADIR,  ///< -90 = straight down, 0 = horizon (DJI, canonical)
    ZERO_IS_NADIR    ///< 0 = straight down, +90 = horizon
};

/**
 * @brief Ground intersection strategy
 */
enum class ProjectorKind {
    FLAT_GROUND,    ///< Horizontal plane at altitude below the camera
    TERRAIN_AWARE   ///< Ray marched against a digital surface model
};

/**
 * @brief Completeness of an asset's georeferencing metadata
 */
enum class GeoQuality {
    HIGH,
    MEDIUM,
    LOW,
    MISSING
};

// ============================================================================
// String conversions
// ============================================================================

inline std::string toString(PitchConvention convention) {
    switch (convention) {
        case PitchConvention::NEG90_IS_NADIR: return "NEG90_IS_NADIR";
        case PitchConvention::ZERO_IS_NADIR: return "ZERO_IS_NADIR";
        default: return "UNKNOWN";
    }
}

inline std::string toString(ProjectorKind kind) {
    switch (kind) {
        case ProjectorKind::FLAT_GROUND: return "FLAT_GROUND";
        case ProjectorKind::TERRAIN_AWARE: return "TERRAIN_AWARE";
        default: return "UNKNOWN";
    }
}

inline std::string toString(GeoQuality quality) {
    switch (quality) {
        case GeoQuality::HIGH: return "high";
        case GeoQuality::MEDIUM: return "medium";
        case GeoQuality::LOW: return "low";
        case GeoQuality::MISSING: return "missing";
        default: return "unknown";
    }
}

// ============================================================================
// Type aliases for clarity
// ============================================================================

using VertexIndex = int32_t;
using ProfileId = std::string;

} // namespace drone_georef
