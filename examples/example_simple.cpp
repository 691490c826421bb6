/**
 * @file example_simple.cpp
 * @brief Simple example showing basic georeferencer usage
 */

#include <drone_georef/georeferencer.hpp>
#include <drone_georef/parameter_extractor.hpp>
#include <nlohmann/json.hpp>
#include <iomanip>
#include <iostream>

using namespace drone_georef;

int main() {
    std::cout << "=== Drone Georeferencing Simple Example ===" << std::endl;
    std::cout << std::endl;

    // Metadata as extracted from a DJI capture (EXIF + XMP)
    nlohmann::json metadata = {
        {"GPSLatitude", -27.4698},
        {"GPSLongitude", 153.0251},
        {"drone-dji:RelativeAltitude", "+80.20"},
        {"drone-dji:GimbalPitchDegree", "-20.0"},
        {"drone-dji:GimbalRollDegree", "0.0"},
        {"drone-dji:GimbalYawDegree", "45.3"},
        {"ImageWidth", 4000},
        {"ImageHeight", 3000},
        {"FieldOfView", 84.0}
    };

    Config config;
    config.verbose = true;
    auto georef = std::make_unique<Georeferencer>(config);

    GeoQualityResult quality = evaluateGeoQuality(metadata);
    std::cout << "Geo quality: " << toString(quality.quality) << std::endl;
    for (const auto& field : quality.missing) {
        std::cout << "  missing: " << field << std::endl;
    }

    CameraPose pose = georef->poseFromMetadata(metadata);
    std::cout << pose.toString() << std::endl;
    std::cout << std::endl;

    // Single point: image center and a point near the bottom edge
    std::cout << std::fixed << std::setprecision(7);
    for (const PixelPoint& pixel : {PixelPoint(2000, 1500), PixelPoint(2000, 2900)}) {
        try {
            GeoPoint p = georef->pixelToGeo(pixel, pose);
            std::cout << "Pixel (" << pixel.x << ", " << pixel.y << ") -> "
                      << p.latitude << ", " << p.longitude << std::endl;
        } catch (const GeoreferenceError& e) {
            std::cout << "Pixel (" << pixel.x << ", " << pixel.y << ") -> "
                      << toString(e.kind()) << std::endl;
        }
    }

    // Level terrain 12 m above sea level
    ConstantElevationModel dsm(12.0);
    pose.absolute_altitude_m = 92.2;
    GeoPoint terrain = georef->pixelToGeoWithDSM(PixelPoint(2000, 2900), pose, dsm);
    std::cout << "With terrain:    " << terrain.toString() << std::endl;
    std::cout << std::endl;

    // Annotation polygon: the last vertex lies above the horizon at this pitch
    std::vector<PixelPoint> annotation = {
        {1800, 2600}, {2200, 2600}, {2200, 2900}, {1800, 2900}, {2000, 0}
    };
    PolygonResult result = georef->projectPolygon(annotation, pose);
    std::cout << result.toString() << std::endl;
    std::cout << "Area: " << std::setprecision(1)
              << polygonAreaSquareMeters(result.polygon) << " m2" << std::endl;

    std::cout << "\n--- CAMERA ---" << std::endl;
    for (const auto& [key, value] : georef->describe(pose)) {
        std::cout << "  " << key << ": " << std::setprecision(3) << value << std::endl;
    }

    std::cout << "\n=== Example Complete ===" << std::endl;
    return 0;
}
