/**
 * @file polygon_processor.hpp
 * @brief Annotation polygons to geographic polygons, with aggregates
 */

#pragma once

#include "common.hpp"
#include "data_types.hpp"
#include "projector.hpp"
#include <functional>
#include <vector>

namespace drone_georef {

/// Pose used for one vertex (per-vertex poses: mosaics, tests)
using VertexPoseProvider = std::function<CameraPose(VertexIndex)>;

/**
 * @brief One polygon of a batch
 */
struct PolygonJob {
    std::vector<PixelPoint> pixels;
    CameraPose pose;
};

/**
 * @brief Georeference every vertex of a pixel polygon
 *
 * A GeoreferenceError on one vertex skips that vertex and increments
 * failed_vertices; it never aborts the polygon. The output ring is closed
 * (first point repeated) when at least 3 vertices converted. The centroid
 * is the arithmetic mean of converted vertices, nullopt if none converted;
 * longitudes are averaged relative to the first vertex, so rings crossing
 * the antimeridian keep a centroid inside the ring.
 */
PolygonResult projectPolygon(
    const std::vector<PixelPoint>& pixels,
    const CameraPose& pose,
    const Projector& projector
);

/**
 * @brief projectPolygon() with a pose looked up per vertex
 */
PolygonResult projectPolygon(
    const std::vector<PixelPoint>& pixels,
    const VertexPoseProvider& pose_for_vertex,
    const Projector& projector
);

/**
 * @brief Project many polygons in parallel
 *
 * @param threads  Worker count, 0 = hardware concurrency
 * @return One result per job, in job order
 */
std::vector<PolygonResult> projectPolygons(
    const std::vector<PolygonJob>& jobs,
    const Projector& projector,
    int threads = 0
);

/**
 * @brief Pixel bounding box of a polygon (its center() is the annotation point)
 * @throws std::invalid_argument for an empty polygon
 */
PixelBox polygonToCenterBox(const std::vector<PixelPoint>& pixels);

/**
 * @brief Box corners, clockwise from top-left
 */
std::vector<PixelPoint> boundingBoxToPixelPolygon(const PixelBox& box);

/**
 * @brief Ground footprint of the four image corners
 */
PolygonResult imageFootprint(const CameraPose& pose, const Projector& projector);

/**
 * @brief Area of a geographic polygon in square meters
 *
 * Shoelace formula on the local tangent plane at the first vertex. A
 * closing duplicate vertex is ignored. Returns 0 for fewer than 3 vertices.
 */
double polygonAreaSquareMeters(const std::vector<GeoPoint>& polygon);

} // namespace drone_georef
