/**
 * @file polygon_processor.cpp
 * @brief Implementation of polygon georeferencing and aggregates
 */

#include "drone_georef/polygon_processor.hpp"
#include "drone_georef/coordinate_frames.hpp"
#include <algorithm>
#include <cmath>
#include <future>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace drone_georef {

namespace {

void finalize(PolygonResult& result) {
    if (result.polygon.empty()) {
        return;
    }

    // Longitudes unwrapped around the first vertex so rings across the
    // antimeridian average correctly
    const double lon0 = result.polygon.front().longitude;
    double lat_sum = 0.0;
    double lon_sum = 0.0;
    for (const auto& p : result.polygon) {
        lat_sum += p.latitude;
        lon_sum += wrapAngleDeg(p.longitude - lon0);
    }
    const double n = static_cast<double>(result.polygon.size());
    result.centroid = GeoPoint(lat_sum / n, wrapAngleDeg(lon0 + lon_sum / n));

    if (result.polygon.size() >= 3) {
        result.polygon.push_back(result.polygon.front());
    }
}

} // namespace

PolygonResult projectPolygon(
    const std::vector<PixelPoint>& pixels,
    const VertexPoseProvider& pose_for_vertex,
    const Projector& projector
) {
    PolygonResult result;
    result.total_vertices = static_cast<int>(pixels.size());
    result.polygon.reserve(pixels.size() + 1);

    for (size_t i = 0; i < pixels.size(); ++i) {
        try {
            CameraPose pose = pose_for_vertex(static_cast<VertexIndex>(i));
            result.polygon.push_back(projector.projectPixel(pixels[i], pose));
        } catch (const GeoreferenceError& e) {
            result.failed_vertices++;
            if (projector.config().verbose) {
                std::cerr << "[PolygonProcessor] vertex " << i << " skipped: "
                          << toString(e.kind()) << " (" << e.what() << ")\n";
            }
        }
    }

    finalize(result);
    return result;
}

PolygonResult projectPolygon(
    const std::vector<PixelPoint>& pixels,
    const CameraPose& pose,
    const Projector& projector
) {
    return projectPolygon(pixels, [&pose](VertexIndex) { return pose; }, projector);
}

std::vector<PolygonResult> projectPolygons(
    const std::vector<PolygonJob>& jobs,
    const Projector& projector,
    int threads
) {
    std::vector<PolygonResult> results(jobs.size());
    if (jobs.empty()) {
        return results;
    }

    size_t workers = threads > 0 ? static_cast<size_t>(threads)
                                 : std::max(1u, std::thread::hardware_concurrency());
    workers = std::min(workers, jobs.size());

    // Worker w handles jobs w, w + workers, ...; each writes only its own slots
    std::vector<std::future<void>> futures;
    futures.reserve(workers);
    for (size_t w = 0; w < workers; ++w) {
        futures.push_back(std::async(std::launch::async, [&, w]() {
            for (size_t i = w; i < jobs.size(); i += workers) {
                results[i] = projectPolygon(jobs[i].pixels, jobs[i].pose, projector);
            }
        }));
    }
    for (auto& f : futures) {
        f.get();
    }

    return results;
}

PixelBox polygonToCenterBox(const std::vector<PixelPoint>& pixels) {
    if (pixels.empty()) {
        throw std::invalid_argument("polygonToCenterBox: empty polygon");
    }

    double min_x = pixels.front().x, max_x = pixels.front().x;
    double min_y = pixels.front().y, max_y = pixels.front().y;
    for (const auto& p : pixels) {
        min_x = std::min(min_x, p.x);
        max_x = std::max(max_x, p.x);
        min_y = std::min(min_y, p.y);
        max_y = std::max(max_y, p.y);
    }

    PixelBox box;
    box.x = min_x;
    box.y = min_y;
    box.width = max_x - min_x;
    box.height = max_y - min_y;
    return box;
}

std::vector<PixelPoint> boundingBoxToPixelPolygon(const PixelBox& box) {
    return {
        PixelPoint(box.x, box.y),
        PixelPoint(box.x + box.width, box.y),
        PixelPoint(box.x + box.width, box.y + box.height),
        PixelPoint(box.x, box.y + box.height)
    };
}

PolygonResult imageFootprint(const CameraPose& pose, const Projector& projector) {
    PixelBox frame;
    frame.width = pose.image_width_px;
    frame.height = pose.image_height_px;
    return projectPolygon(boundingBoxToPixelPolygon(frame), pose, projector);
}

double polygonAreaSquareMeters(const std::vector<GeoPoint>& polygon) {
    size_t n = polygon.size();
    if (n >= 2 &&
        polygon.front().latitude == polygon.back().latitude &&
        polygon.front().longitude == polygon.back().longitude) {
        --n;
    }
    if (n < 3) {
        return 0.0;
    }

    const GeoPoint& origin = polygon.front();
    double twice_area = 0.0;
    for (size_t i = 0; i < n; ++i) {
        Eigen::Vector2d a = geoToOffset(origin, polygon[i]);
        Eigen::Vector2d b = geoToOffset(origin, polygon[(i + 1) % n]);
        twice_area += a.x() * b.y() - b.x() * a.y();
    }
    return std::abs(twice_area) / 2.0;
}

} // namespace drone_georef
