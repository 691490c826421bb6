/**
 * @file errors.hpp
 * @brief Georeferencing failure kinds
 */

#pragma once

#include "data_types.hpp"
#include <optional>
#include <stdexcept>
#include <string>

namespace drone_georef {

/**
 * @brief Why a pixel could not be placed on the ground
 */
enum class GeoErrorKind {
    NO_GROUND_INTERSECTION,  ///< Ray at or above the horizon
    POLAR_SINGULARITY,       ///< Local flat-Earth approximation degenerate
    TERRAIN_UNAVAILABLE,     ///< DSM has no data at any sampled point
    NO_CONVERGENCE           ///< Terrain ray march exceeded its iteration budget
};

inline std::string toString(GeoErrorKind kind) {
    switch (kind) {
        case GeoErrorKind::NO_GROUND_INTERSECTION: return "NoGroundIntersection";
        case GeoErrorKind::POLAR_SINGULARITY: return "PolarSingularity";
        case GeoErrorKind::TERRAIN_UNAVAILABLE: return "TerrainUnavailable";
        case GeoErrorKind::NO_CONVERGENCE: return "NoConvergence";
        default: return "Unknown";
    }
}

/**
 * @brief True when the caller can fall back to flat-ground projection
 */
inline bool isRecoverable(GeoErrorKind kind) {
    return kind == GeoErrorKind::TERRAIN_UNAVAILABLE ||
           kind == GeoErrorKind::NO_CONVERGENCE;
}

/**
 * @brief Raised by projectors when a single pixel cannot be georeferenced
 *
 * NO_CONVERGENCE carries the lowest-residual intermediate estimate.
 */
class GeoreferenceError : public std::runtime_error {
public:
    GeoreferenceError(GeoErrorKind kind, const std::string& message,
                      std::optional<GeoPoint> best_estimate = std::nullopt)
        : std::runtime_error(toString(kind) + ": " + message),
          kind_(kind),
          best_estimate_(std::move(best_estimate)) {}

    GeoErrorKind kind() const noexcept { return kind_; }

    const std::optional<GeoPoint>& bestEstimate() const noexcept {
        return best_estimate_;
    }

    bool recoverable() const noexcept { return isRecoverable(kind_); }

private:
    GeoErrorKind kind_;
    std::optional<GeoPoint> best_estimate_;
};

} // namespace drone_georef
