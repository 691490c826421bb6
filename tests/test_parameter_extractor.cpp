#include "test_helpers.hpp"

#include <drone_georef/calibration.hpp>
#include <drone_georef/config.hpp>
#include <drone_georef/parameter_extractor.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <limits>

using namespace drone_georef;
using json = nlohmann::json;

namespace {

bool listsField(const GeoQualityResult& r, const std::string& field) {
  return std::find(r.missing.begin(), r.missing.end(), field) != r.missing.end();
}

} // namespace

TEST( ParameterExtractor, Defaults ) {
  CameraPose pose = extractPose(json::object());
  EXPECT_DOUBLE_EQ( pose.latitude, 0.0 );
  EXPECT_DOUBLE_EQ( pose.longitude, 0.0 );
  EXPECT_DOUBLE_EQ( pose.altitude_m, 100.0 );
  EXPECT_DOUBLE_EQ( pose.gimbal_pitch_deg, -90.0 );
  EXPECT_DOUBLE_EQ( pose.gimbal_roll_deg, 0.0 );
  EXPECT_DOUBLE_EQ( pose.gimbal_yaw_deg, 0.0 );
  EXPECT_EQ( pose.image_width_px, 4000 );
  EXPECT_EQ( pose.image_height_px, 3000 );
  EXPECT_DOUBLE_EQ( pose.horizontal_fov_deg, 84.0 );
  EXPECT_FALSE( pose.lrf_distance_m.has_value() );
  EXPECT_FALSE( pose.absolute_altitude_m.has_value() );
  EXPECT_FALSE( pose.aircraft_yaw_deg.has_value() );

  // Not an object at all
  EXPECT_NO_THROW( extractPose(json::array()) );
  EXPECT_NO_THROW( extractPose(json()) );
}

TEST( ParameterExtractor, KeyAliases ) {
  json raw = {
    {"GpsLatitude", "-27.4698"},
    {"gpsLongitude", 153.0251},
    {"drone-dji:RelativeAltitude", "+80.20"},
    {"drone-dji:AbsoluteAltitude", "+112.5"},
    {"drone-dji:GimbalPitchDegree", "-45.5"},
    {"drone-dji:GimbalRollDegree", "0.3"},
    {"drone-dji:GimbalYawDegree", "-12.0"},
    {"ExifImageWidth", 5472},
    {"ExifImageHeight", 3648},
    {"CameraFOV", 77},
    {"LRFTargetDistance", "95.4"}
  };

  CameraPose pose = extractPose(raw);
  EXPECT_DOUBLE_EQ( pose.latitude, -27.4698 );
  EXPECT_DOUBLE_EQ( pose.longitude, 153.0251 );
  EXPECT_DOUBLE_EQ( pose.altitude_m, 80.2 );
  ASSERT_TRUE( pose.absolute_altitude_m.has_value() );
  EXPECT_DOUBLE_EQ( *pose.absolute_altitude_m, 112.5 );
  EXPECT_DOUBLE_EQ( pose.gimbal_pitch_deg, -45.5 );
  EXPECT_DOUBLE_EQ( pose.gimbal_roll_deg, 0.3 );
  EXPECT_DOUBLE_EQ( pose.gimbal_yaw_deg, -12.0 );
  EXPECT_EQ( pose.image_width_px, 5472 );
  EXPECT_EQ( pose.image_height_px, 3648 );
  EXPECT_DOUBLE_EQ( pose.horizontal_fov_deg, 77.0 );
  ASSERT_TRUE( pose.lrf_distance_m.has_value() );
  EXPECT_DOUBLE_EQ( *pose.lrf_distance_m, 95.4 );
}

TEST( ParameterExtractor, NestedMetadataObject ) {
  json raw = {
    {"latitude", -33.86},
    {"metadata", {{"longitude", 151.21}, {"altitude", 42.0}, {"gimbalYaw", 180.0}}}
  };
  CameraPose pose = extractPose(raw);
  EXPECT_DOUBLE_EQ( pose.latitude, -33.86 );
  EXPECT_DOUBLE_EQ( pose.longitude, 151.21 );
  EXPECT_DOUBLE_EQ( pose.altitude_m, 42.0 );
  EXPECT_DOUBLE_EQ( pose.gimbal_yaw_deg, 180.0 );
}

TEST( ParameterExtractor, UnusableValuesFallBack ) {
  json raw = {
    {"GPSLatitude", "not a number"},
    {"Latitude", -10.0},
    {"RelativeAltitude", 0.0},
    {"ImageWidth", -1},
    {"FieldOfView", 200.0},
    {"LRFDistance", 0.0},
    {"GimbalPitchDegree", nullptr}
  };
  CameraPose pose = extractPose(raw);
  EXPECT_DOUBLE_EQ( pose.latitude, -10.0 );
  EXPECT_DOUBLE_EQ( pose.altitude_m, 100.0 );
  EXPECT_EQ( pose.image_width_px, 4000 );
  EXPECT_DOUBLE_EQ( pose.horizontal_fov_deg, 84.0 );
  EXPECT_FALSE( pose.lrf_distance_m.has_value() );
  EXPECT_DOUBLE_EQ( pose.gimbal_pitch_deg, -90.0 );
}

TEST( ParameterExtractor, OversizedImageDimensions ) {
  json raw = {
    {"GPSLatitude", -27.5},
    {"GPSLongitude", 152.9},
    {"ImageWidth", 4294967296.0},
    {"ImageHeight", "1e12"}
  };
  CameraPose pose = extractPose(raw);
  EXPECT_EQ( pose.image_width_px, 4000 );
  EXPECT_EQ( pose.image_height_px, 3000 );
  EXPECT_TRUE( validatePose(pose).empty() );
  EXPECT_TRUE( listsField(evaluateGeoQuality(raw), "image dimensions") );

  raw["ImageWidth"] = 2147483647.0;
  EXPECT_EQ( extractPose(raw).image_width_px, 2147483647 );
}

TEST( ParameterExtractor, LaserRangefinderTarget ) {
  json raw = {
    {"drone-dji:LRFTargetDistance", "+61.5"},
    {"drone-dji:LRFTargetLat", "-27.5004"},
    {"drone-dji:LRFTargetLon", "152.9002"},
    {"drone-dji:LRFTargetAlt", "12.3"}
  };
  CameraPose pose = extractPose(raw);
  ASSERT_TRUE( pose.hasLrfTarget() );
  EXPECT_DOUBLE_EQ( *pose.lrf_target_latitude, -27.5004 );
  EXPECT_DOUBLE_EQ( *pose.lrf_target_longitude, 152.9002 );
  ASSERT_TRUE( pose.lrf_target_altitude_m.has_value() );
  EXPECT_DOUBLE_EQ( *pose.lrf_target_altitude_m, 12.3 );
  EXPECT_DOUBLE_EQ( *pose.lrf_distance_m, 61.5 );

  // Position needs both halves, in range
  raw.erase("drone-dji:LRFTargetLon");
  EXPECT_FALSE( extractPose(raw).hasLrfTarget() );
  EXPECT_FALSE( extractPose(raw).lrf_target_latitude.has_value() );

  raw["LRFTargetLon"] = 200.0;
  EXPECT_FALSE( extractPose(raw).hasLrfTarget() );
  EXPECT_TRUE( extractPose(raw).lrf_target_altitude_m.has_value() );
}

TEST( ParameterExtractor, PitchConventionShim ) {
  Config config;
  config.pitch_convention = PitchConvention::ZERO_IS_NADIR;

  EXPECT_DOUBLE_EQ( extractPose({{"GimbalPitchDegree", 0.0}}, config).gimbal_pitch_deg, -90.0 );
  EXPECT_DOUBLE_EQ( extractPose({{"GimbalPitchDegree", 30.0}}, config).gimbal_pitch_deg, -60.0 );

  // Missing pitch is nadir whatever the convention
  EXPECT_DOUBLE_EQ( extractPose(json::object(), config).gimbal_pitch_deg, -90.0 );

  config.default_pose.gimbal_pitch_from_nadir_deg = 20.0;
  EXPECT_DOUBLE_EQ( extractPose(json::object(), config).gimbal_pitch_deg, -70.0 );
}

TEST( ParameterExtractor, YawFallsBackToFlightYaw ) {
  json raw = {{"FlightYawDegree", 120.0}};

  CameraPose pose = extractPose(raw);
  EXPECT_DOUBLE_EQ( pose.gimbal_yaw_deg, 120.0 );
  ASSERT_TRUE( pose.aircraft_yaw_deg.has_value() );
  EXPECT_DOUBLE_EQ( *pose.aircraft_yaw_deg, 120.0 );

  // Relative gimbal yaw: the airframe heading is added later, not copied
  Config config;
  config.gimbal_yaw_relative = true;
  pose = extractPose(raw, config);
  EXPECT_DOUBLE_EQ( pose.gimbal_yaw_deg, 0.0 );
  EXPECT_DOUBLE_EQ( *pose.aircraft_yaw_deg, 120.0 );

  raw["GimbalYawDegree"] = 15.0;
  EXPECT_DOUBLE_EQ( extractPose(raw).gimbal_yaw_deg, 15.0 );
}

TEST( ParameterExtractor, ConfiguredDefaults ) {
  Config config;
  config.default_pose.altitude_m = 60.0;
  config.default_pose.image_width_px = 1920;
  config.default_pose.image_height_px = 1080;
  config.default_pose.horizontal_fov_deg = 70.0;

  CameraPose pose = extractPose(json::object(), config);
  EXPECT_DOUBLE_EQ( pose.altitude_m, 60.0 );
  EXPECT_EQ( pose.image_width_px, 1920 );
  EXPECT_EQ( pose.image_height_px, 1080 );
  EXPECT_DOUBLE_EQ( pose.horizontal_fov_deg, 70.0 );
}

TEST( ParameterExtractor, DewarpData ) {
  auto k = parseDewarpCoefficients(
      "2020-07-23;3678.13,3677.52,10.16,27.08,-0.0268,0.0217,0.0009,-0.0011,-0.0206");
  ASSERT_EQ( k.size(), 5u );
  EXPECT_DOUBLE_EQ( k[0], -0.0268 );
  EXPECT_DOUBLE_EQ( k[4], -0.0206 );

  EXPECT_TRUE( parseDewarpCoefficients("").empty() );
  EXPECT_TRUE( parseDewarpCoefficients("2020-07-23;1,2,3").empty() );
  EXPECT_TRUE( parseDewarpCoefficients("2020-07-23;1,2,3,4,x,6,7,8,9").empty() );
}

TEST( ParameterExtractor, PrecisionFields ) {
  json raw = {
    {"GPSLatitude", -27.5},
    {"GPSLongitude", 152.9},
    {"ImageWidth", 5472},
    {"ImageHeight", 3648},
    {"drone-dji:CalibratedFocalLength", "3666.67"},
    {"drone-dji:CalibratedOpticalCenterX", "2750.0"},
    {"drone-dji:CalibratedOpticalCenterY", "1820.0"},
    {"drone-dji:DewarpData",
     "2020-07-23;3678.13,3677.52,10.16,27.08,-0.0268,0.0217,0.0009,-0.0011,-0.0206"}
  };

  CameraPose basic = extractPose(raw);
  EXPECT_FALSE( basic.focal_length_px.has_value() );
  EXPECT_TRUE( basic.distortion_coeffs.empty() );

  CameraPose pose = extractPrecisionPose(raw);
  ASSERT_TRUE( pose.focal_length_px.has_value() );
  EXPECT_DOUBLE_EQ( *pose.focal_length_px, 3666.67 );
  ASSERT_TRUE( pose.principal_point_offset_px.has_value() );
  EXPECT_DOUBLE_EQ( pose.principal_point_offset_px->x(), 14.0 );
  EXPECT_DOUBLE_EQ( pose.principal_point_offset_px->y(), -4.0 );
  EXPECT_EQ( pose.distortion_coeffs.size(), 5u );
}

TEST( ParameterExtractor, CameraProfileFillsMissingFields ) {
  CameraProfileStore store = CameraProfileStore::fromJson(json::parse(R"([
    {
      "id": "m3e",
      "name": "Mavic 3 Enterprise",
      "fov": 73.7,
      "calibratedFocalLength": 3700.0,
      "opticalCenterX": 2740.0,
      "opticalCenterY": 1830.0,
      "distortion": [-0.01, 0.02, 0.0, 0.0, 0.0]
    }
  ])"));
  ASSERT_EQ( store.size(), 1u );

  json raw = {
    {"ImageWidth", 5472},
    {"ImageHeight", 3648},
    {"FieldOfView", 80.0},
    {"cameraProfileId", "m3e"}
  };
  CameraPose pose = extractPrecisionPose(raw, Config(), &store);

  // Metadata wins where present
  EXPECT_DOUBLE_EQ( pose.horizontal_fov_deg, 80.0 );
  ASSERT_TRUE( pose.focal_length_px.has_value() );
  EXPECT_DOUBLE_EQ( *pose.focal_length_px, 3700.0 );
  ASSERT_TRUE( pose.principal_point_offset_px.has_value() );
  EXPECT_DOUBLE_EQ( pose.principal_point_offset_px->x(), 4.0 );
  EXPECT_DOUBLE_EQ( pose.principal_point_offset_px->y(), 6.0 );
  EXPECT_EQ( pose.distortion_coeffs.size(), 5u );

  raw.erase("FieldOfView");
  EXPECT_DOUBLE_EQ( extractPrecisionPose(raw, Config(), &store).horizontal_fov_deg, 73.7 );

  raw["cameraProfileId"] = "unknown";
  EXPECT_FALSE( extractPrecisionPose(raw, Config(), &store).focal_length_px.has_value() );
}

TEST( CameraProfileStore, DistortionCoefficientCount ) {
  EXPECT_THROW( CameraProfileStore::fromJson(json::parse(
                  R"([{"id": "p", "distortion": [0.1, 0.01, 0.0]}])")),
                std::invalid_argument );
  EXPECT_THROW( CameraProfileStore::fromJson(json::parse(
                  R"([{"id": "p", "distortion": [0.1, "0.01", 0.0, 0.0]}])")),
                std::invalid_argument );
  EXPECT_THROW( CameraProfileStore::fromJson(json::parse(
                  R"([{"id": "p", "distortion": 0.1}])")),
                std::invalid_argument );

  CameraProfileStore store = CameraProfileStore::fromJson(json::parse(R"([
    {"id": "four", "distortion": [0.1, 0.01, 0.0, 0.0]},
    {"id": "eight", "distortion": [0.1, 0.01, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0]},
    {"id": "none", "distortion": []},
    {"id": "null", "distortion": null}
  ])"));
  EXPECT_EQ( store.find("four")->dist_coeffs.size(), 4u );
  EXPECT_EQ( store.find("eight")->dist_coeffs.size(), 8u );
  EXPECT_TRUE( store.find("none")->dist_coeffs.empty() );
  EXPECT_TRUE( store.find("null")->dist_coeffs.empty() );

  EXPECT_TRUE( isSupportedDistortionCount(0) );
  EXPECT_TRUE( isSupportedDistortionCount(14) );
  EXPECT_FALSE( isSupportedDistortionCount(3) );
  EXPECT_FALSE( isSupportedDistortionCount(6) );
}

TEST( CameraProfileStore, InvalidInput ) {
  EXPECT_THROW( CameraProfileStore::fromJson(json::object()), std::invalid_argument );
  EXPECT_THROW( CameraProfileStore::fromJson(json::parse(R"([{"name": "x"}])")),
                std::invalid_argument );
  EXPECT_THROW( CameraProfileStore::loadFile("/nonexistent/profiles.json"), std::runtime_error );

  CameraProfileStore store;
  EXPECT_TRUE( store.empty() );
  EXPECT_FALSE( store.find("m3e").has_value() );
  EXPECT_THROW( store.add(CameraProfile()), std::invalid_argument );
}

TEST( GeoQuality, Levels ) {
  GeoQualityResult missing = evaluateGeoQuality({{"ImageWidth", 4000}});
  EXPECT_EQ( missing.quality, GeoQuality::MISSING );
  EXPECT_TRUE( listsField(missing, "gps") );

  json raw = {{"GPSLatitude", -27.5}, {"GPSLongitude", 152.9}};
  GeoQualityResult low = evaluateGeoQuality(raw);
  EXPECT_EQ( low.quality, GeoQuality::LOW );
  EXPECT_TRUE( listsField(low, "altitude") );
  EXPECT_TRUE( listsField(low, "image dimensions") );

  raw["ImageWidth"] = 4000;
  raw["ImageHeight"] = 3000;
  raw["RelativeAltitude"] = "+50.0";
  GeoQualityResult medium = evaluateGeoQuality(raw);
  EXPECT_EQ( medium.quality, GeoQuality::MEDIUM );
  EXPECT_TRUE( listsField(medium, "gimbal angles") );

  raw["GimbalPitchDegree"] = -90.0;
  raw["GimbalYawDegree"] = 0.0;
  EXPECT_EQ( evaluateGeoQuality(raw).quality, GeoQuality::MEDIUM );

  // A range alone is not a usable rangefinder fix
  json with_lrf = raw;
  with_lrf["LRFTargetDistance"] = 51.0;
  GeoQualityResult range_only = evaluateGeoQuality(with_lrf);
  EXPECT_EQ( range_only.quality, GeoQuality::MEDIUM );
  EXPECT_FALSE( range_only.has_lrf );

  with_lrf["drone-dji:LRFTargetLat"] = "-27.5003";
  EXPECT_EQ( evaluateGeoQuality(with_lrf).quality, GeoQuality::MEDIUM );

  with_lrf["drone-dji:LRFTargetLon"] = "152.9001";
  GeoQualityResult lrf = evaluateGeoQuality(with_lrf);
  EXPECT_EQ( lrf.quality, GeoQuality::HIGH );
  EXPECT_TRUE( lrf.has_lrf );
  EXPECT_FALSE( lrf.has_calibration );

  raw["CalibratedFocalLength"] = 3666.0;
  raw["CalibratedOpticalCenterX"] = 2000.0;
  raw["CalibratedOpticalCenterY"] = 1500.0;
  GeoQualityResult high = evaluateGeoQuality(raw);
  EXPECT_EQ( high.quality, GeoQuality::HIGH );
  EXPECT_TRUE( high.has_calibration );
  EXPECT_TRUE( high.missing.empty() );

  EXPECT_EQ( toString(GeoQuality::HIGH), "high" );
}

TEST( ValidatePose, Problems ) {
  EXPECT_TRUE( validatePose(test::nadirPose()).empty() );

  CameraPose pose = test::nadirPose();
  pose.latitude = 95.0;
  pose.horizontal_fov_deg = 0.0;
  pose.image_width_px = 0;
  EXPECT_EQ( validatePose(pose).size(), 3u );

  pose = test::nadirPose();
  pose.gimbal_yaw_deg = std::numeric_limits<double>::quiet_NaN();
  EXPECT_EQ( validatePose(pose).size(), 1u );

  pose = test::nadirPose();
  pose.distortion_coeffs = {0.1, 0.01, 0.0};
  EXPECT_EQ( validatePose(pose).size(), 1u );
  pose.distortion_coeffs = {0.1, 0.01, 0.0, 0.0, std::numeric_limits<double>::infinity()};
  EXPECT_EQ( validatePose(pose).size(), 1u );
  pose.distortion_coeffs = {0.1, 0.01, 0.0, 0.0, 0.0};
  EXPECT_TRUE( validatePose(pose).empty() );

  pose.lrf_target_latitude = 91.0;
  pose.lrf_target_longitude = 152.9;
  pose.lrf_target_altitude_m = std::numeric_limits<double>::quiet_NaN();
  EXPECT_EQ( validatePose(pose).size(), 2u );
}

TEST( Config, FromJson ) {
  Config config = configFromJson(json::parse(R"({
    "pitch_convention": "ZERO_IS_NADIR",
    "gimbal_yaw_relative": true,
    "terrain_convergence_m": 0.25,
    "terrain_max_iterations": 40,
    "batch_threads": 2,
    "geoid_offset_m": 30.0,
    "default_pose": { "altitude_m": 120.0, "horizontal_fov_deg": 73.7 }
  })"));

  EXPECT_EQ( config.pitch_convention, PitchConvention::ZERO_IS_NADIR );
  EXPECT_TRUE( config.gimbal_yaw_relative );
  EXPECT_DOUBLE_EQ( config.terrain_convergence_m, 0.25 );
  EXPECT_EQ( config.terrain_max_iterations, 40 );
  EXPECT_EQ( config.batch_threads, 2 );
  EXPECT_DOUBLE_EQ( config.geoid_offset_m, 30.0 );
  EXPECT_DOUBLE_EQ( Config().geoid_offset_m, 0.0 );
  EXPECT_DOUBLE_EQ( config.default_pose.altitude_m, 120.0 );
  EXPECT_DOUBLE_EQ( config.default_pose.horizontal_fov_deg, 73.7 );
  EXPECT_EQ( config.default_pose.image_width_px, 4000 );
  EXPECT_DOUBLE_EQ( config.polar_latitude_limit_deg, 89.9 );
}

TEST( Config, Invalid ) {
  EXPECT_THROW( configFromJson(json::parse(R"({"pitch_convention": "UP"})")),
                std::invalid_argument );
  EXPECT_THROW( configFromJson(json::parse(R"({"terrain_max_iterations": 0})")),
                std::invalid_argument );
  EXPECT_THROW( configFromJson(json::parse(R"({"polar_latitude_limit_deg": 90.0})")),
                std::invalid_argument );
  EXPECT_THROW( configFromJson(json::array()), std::invalid_argument );
  EXPECT_THROW( loadConfig("/nonexistent/config.json"), std::runtime_error );
}

TEST( Config, LoadFile ) {
  std::string path = ::testing::TempDir() + "drone_georef_config.json";
  {
    std::ofstream out(path);
    out << R"({"verbose": false, "use_best_estimate_on_no_convergence": false})";
  }
  Config config = loadConfig(path);
  EXPECT_FALSE( config.use_best_estimate_on_no_convergence );
  std::remove(path.c_str());
}
