/**
 * @file georef_captures.cpp
 * @brief Batch georeferencing of annotated drone captures
 *
 * Folder layout:
 *   captures.json          [{ "filename": ..., "metadata": {...},
 *                             "annotations": [{ "id": ..., "points": [[x, y], ...] }] }]
 *   config.json            optional, Config keys
 *   camera_profiles.json   optional, calibrated camera profiles
 */

#include <drone_georef/georeferencer.hpp>
#include <drone_georef/parameter_extractor.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace drone_georef;

// ============================================================================
// Data Structures
// ============================================================================

struct Annotation {
    std::string id;
    std::vector<PixelPoint> points;
};

struct CaptureEntry {
    std::string filename;
    json metadata;
    std::vector<Annotation> annotations;
};

struct CaptureResult {
    std::string filename;
    GeoQuality quality = GeoQuality::MISSING;
    int annotations = 0;
    int georeferenced = 0;
    int vertices = 0;
    int failed_vertices = 0;
    double footprint_m2 = 0.0;
    double time_ms = 0.0;
};

// ============================================================================
// Helper Functions
// ============================================================================

json readJsonFile(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open " + path.string());
    }
    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse " + path.string() + ": " + e.what());
    }
    return j;
}

/**
 * Load captures.json from folder
 */
std::vector<CaptureEntry> loadCaptures(const fs::path& folder) {
    fs::path path = folder / "captures.json";
    if (!fs::exists(path)) {
        throw std::runtime_error("captures.json not found in " + folder.string());
    }

    json j = readJsonFile(path);
    if (!j.is_array()) {
        throw std::runtime_error("captures.json must be an array");
    }

    std::vector<CaptureEntry> entries;
    for (const auto& item : j) {
        CaptureEntry entry;
        entry.filename = item.value("filename", std::string("capture_") +
                                                std::to_string(entries.size()));
        entry.metadata = item.value("metadata", json::object());

        for (const auto& a : item.value("annotations", json::array())) {
            Annotation annotation;
            annotation.id = a.value("id", std::string());
            for (const auto& p : a.value("points", json::array())) {
                if (p.is_array() && p.size() >= 2) {
                    annotation.points.emplace_back(p[0].get<double>(), p[1].get<double>());
                } else if (p.is_object()) {
                    annotation.points.emplace_back(p.value("x", 0.0), p.value("y", 0.0));
                }
            }
            entry.annotations.push_back(annotation);
        }
        entries.push_back(entry);
    }
    return entries;
}

json geoToJson(const GeoPoint& p) {
    json j = {{"lat", p.latitude}, {"lon", p.longitude}};
    if (p.elevation_m) {
        j["elevation_m"] = *p.elevation_m;
    }
    return j;
}

void printSummary(const std::vector<CaptureResult>& results, double total_time) {
    int annotations = 0, georeferenced = 0, vertices = 0, failed = 0;
    std::map<std::string, int> quality_counts;
    double time_sum = 0.0;

    for (const auto& r : results) {
        annotations += r.annotations;
        georeferenced += r.georeferenced;
        vertices += r.vertices;
        failed += r.failed_vertices;
        quality_counts[toString(r.quality)]++;
        time_sum += r.time_ms;
    }

    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "SUMMARY\n";
    std::cout << std::string(60, '=') << "\n";
    std::cout << "Captures:            " << results.size() << "\n";
    std::cout << "Annotations:         " << annotations << "\n";
    std::cout << "Georeferenced:       " << georeferenced << "\n";
    std::cout << "Vertices:            " << vertices << "\n";
    std::cout << "Failed vertices:     " << failed << "\n";

    std::cout << "\nGeo quality breakdown:\n";
    for (const auto& [quality, count] : quality_counts) {
        double pct = results.empty() ? 0.0 : 100.0 * count / results.size();
        std::cout << "  " << quality << ": " << count << " captures ("
                  << std::fixed << std::setprecision(1) << pct << "%)\n";
    }

    if (!results.empty()) {
        std::cout << "\nPerformance:\n";
        std::cout << "  Total time:       " << std::fixed << std::setprecision(2)
                  << total_time << " s\n";
        std::cout << "  Avg per capture:  " << time_sum / results.size() << " ms\n";
    }
}

// ============================================================================
// Main Processing Function
// ============================================================================

int runCaptures(
    const fs::path& folder,
    ProjectorKind kind,
    const std::optional<double>& terrain_elevation,
    const std::string& output_path
) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "GEOREFERENCING - " << folder.filename().string() << "\n";
    std::cout << std::string(60, '=') << "\n\n";

    Config config;
    if (fs::exists(folder / "config.json")) {
        config = loadConfig((folder / "config.json").string());
        std::cout << "Loaded config.json\n";
    }

    CameraProfileStore profiles;
    if (fs::exists(folder / "camera_profiles.json")) {
        profiles = CameraProfileStore::loadFile((folder / "camera_profiles.json").string());
        std::cout << "Loaded " << profiles.size() << " camera profiles\n";
    }

    auto captures = loadCaptures(folder);
    std::cout << "Found " << captures.size() << " captures\n";
    if (captures.empty()) {
        std::cerr << "ERROR: No captures found!\n";
        return 1;
    }

    // Level terrain at a known elevation stands in for a surface model
    std::unique_ptr<ElevationModel> dsm;
    if (terrain_elevation) {
        dsm = std::make_unique<ConstantElevationModel>(*terrain_elevation);
    } else {
        dsm = std::make_unique<ConstantElevationModel>();
    }

    Georeferencer georef(config);
    std::cout << "Projector: " << toString(kind) << "\n";

    std::cout << "\n" << std::left << std::setw(28) << "Capture"
              << std::setw(10) << "Quality"
              << std::setw(8) << "Annot"
              << std::setw(10) << "Vertices"
              << std::setw(14) << "Footprint m2"
              << "ms\n";
    std::cout << std::string(76, '-') << "\n";

    std::vector<CaptureResult> results;
    json output = json::array();
    auto total_start = std::chrono::high_resolution_clock::now();

    for (const auto& capture : captures) {
        auto start = std::chrono::high_resolution_clock::now();

        CaptureResult result;
        result.filename = capture.filename;
        GeoQualityResult quality = evaluateGeoQuality(capture.metadata);
        result.quality = quality.quality;

        json capture_out = {{"filename", capture.filename},
                            {"geo_quality", toString(quality.quality)},
                            {"missing", quality.missing},
                            {"annotations", json::array()}};

        if (quality.quality == GeoQuality::MISSING) {
            std::cerr << "WARNING: " << capture.filename << " has no GPS, skipped\n";
            results.push_back(result);
            output.push_back(capture_out);
            continue;
        }

        CameraPose pose = georef.poseFromMetadata(capture.metadata, &profiles);
        auto problems = validatePose(pose);
        if (!problems.empty()) {
            std::cerr << "WARNING: " << capture.filename << ": " << problems.front()
                      << ", skipped\n";
            results.push_back(result);
            output.push_back(capture_out);
            continue;
        }

        PolygonResult footprint = georef.imageFootprint(pose, kind, dsm.get());
        result.footprint_m2 = polygonAreaSquareMeters(footprint.polygon);

        std::vector<PolygonJob> jobs;
        for (const auto& a : capture.annotations) {
            jobs.push_back({a.points, pose});
        }
        auto polygons = georef.projectPolygons(jobs, kind, dsm.get());

        for (size_t i = 0; i < polygons.size(); ++i) {
            const PolygonResult& p = polygons[i];
            result.annotations++;
            result.vertices += p.total_vertices;
            result.failed_vertices += p.failed_vertices;

            json a = {{"id", capture.annotations[i].id},
                      {"failed_vertices", p.failed_vertices},
                      {"polygon", json::array()}};
            if (p.centroid) {
                result.georeferenced++;
                a["centroid"] = geoToJson(*p.centroid);
            } else {
                a["centroid"] = nullptr;
            }
            for (const auto& g : p.polygon) {
                a["polygon"].push_back(geoToJson(g));
            }
            capture_out["annotations"].push_back(a);
        }

        auto end = std::chrono::high_resolution_clock::now();
        result.time_ms = std::chrono::duration<double, std::milli>(end - start).count();
        results.push_back(result);
        output.push_back(capture_out);

        std::cout << std::left << std::setw(28) << capture.filename.substr(0, 27)
                  << std::setw(10) << toString(result.quality)
                  << std::setw(8) << (std::to_string(result.georeferenced) + "/" +
                                      std::to_string(result.annotations))
                  << std::setw(10) << (std::to_string(result.vertices - result.failed_vertices) +
                                       "/" + std::to_string(result.vertices))
                  << std::setw(14) << std::fixed << std::setprecision(0) << result.footprint_m2
                  << std::setprecision(2) << result.time_ms << "\n";
    }

    auto total_end = std::chrono::high_resolution_clock::now();
    double total_time = std::chrono::duration<double>(total_end - total_start).count();

    printSummary(results, total_time);

    if (!output_path.empty()) {
        std::ofstream out(output_path);
        if (!out.is_open()) {
            std::cerr << "ERROR: Cannot write " << output_path << "\n";
            return 1;
        }
        out << output.dump(2) << "\n";
        std::cout << "\nResults written to " << output_path << "\n";
    }

    return 0;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char** argv) {
    std::string folder = "captures";
    std::string output;
    ProjectorKind kind = ProjectorKind::FLAT_GROUND;
    std::optional<double> terrain_elevation;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--folder" && i + 1 < argc) {
            folder = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            output = argv[++i];
        } else if (arg == "--terrain-elevation" && i + 1 < argc) {
            terrain_elevation = std::stod(argv[++i]);
            kind = ProjectorKind::TERRAIN_AWARE;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: " << argv[0] << " [options]\n\n";
            std::cout << "Options:\n";
            std::cout << "  --folder PATH             Capture folder (default: captures)\n";
            std::cout << "  --output FILE             Write georeferenced results as JSON\n";
            std::cout << "  --terrain-elevation M     Terrain-aware against level terrain at M meters\n";
            std::cout << "  --help, -h                Show this help\n";
            return 0;
        }
    }

    fs::path folder_path(folder);
    if (!fs::exists(folder_path)) {
        std::cerr << "ERROR: Folder not found: " << folder << "\n";
        return 1;
    }

    try {
        return runCaptures(folder_path, kind, terrain_elevation, output);
    } catch (const std::exception& e) {
        std::cerr << "EXCEPTION: " << e.what() << "\n";
        return 1;
    }
}
