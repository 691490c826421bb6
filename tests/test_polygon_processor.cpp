#include "test_helpers.hpp"

#include <drone_georef/polygon_processor.hpp>
#include <cmath>

using namespace drone_georef;
using namespace drone_georef::test;

TEST( PolygonProcessor, ClosedRingAndCentroid ) {
  FlatGroundProjector projector;
  CameraPose pose = nadirPose();
  std::vector<PixelPoint> square = {{1000, 500}, {3000, 500}, {3000, 2500}, {1000, 2500}};

  PolygonResult result = projectPolygon(square, pose, projector);
  EXPECT_EQ( result.total_vertices, 4 );
  EXPECT_EQ( result.failed_vertices, 0 );
  ASSERT_EQ( result.polygon.size(), 5u );
  EXPECT_TRUE( result.isClosed() );

  // Vertex order is preserved
  for (size_t i = 0; i < square.size(); ++i) {
    EXPECT_GEO_NEAR( result.polygon[i], projector.projectPixel(square[i], pose), 1e-12 );
  }

  // Symmetric about the image center -> centroid under the camera
  ASSERT_TRUE( result.centroid.has_value() );
  EXPECT_GEO_NEAR( *result.centroid, GeoPoint(pose.latitude, pose.longitude), 1e-9 );
}

TEST( PolygonProcessor, PartialFailure ) {
  FlatGroundProjector projector;
  std::vector<PixelPoint> pixels = {
    {1900, 1400}, {2100, 1400}, {2100, 1600}, {2000, 1700}, {1900, 1600}
  };

  // Vertices 1 and 3 are seen with the gimbal pointed skyward
  VertexPoseProvider pose_for_vertex = [](VertexIndex i) {
    return (i == 1 || i == 3) ? obliquePose(30.0) : nadirPose();
  };

  PolygonResult result = projectPolygon(pixels, pose_for_vertex, projector);
  EXPECT_EQ( result.total_vertices, 5 );
  EXPECT_EQ( result.failed_vertices, 2 );
  EXPECT_EQ( result.converted(), 3 );
  ASSERT_EQ( result.polygon.size(), 4u );
  EXPECT_TRUE( result.isClosed() );

  GeoPoint a = projector.projectPixel(pixels[0], nadirPose());
  GeoPoint b = projector.projectPixel(pixels[2], nadirPose());
  GeoPoint c = projector.projectPixel(pixels[4], nadirPose());
  ASSERT_TRUE( result.centroid.has_value() );
  EXPECT_NEAR( result.centroid->latitude, (a.latitude + b.latitude + c.latitude) / 3.0, 1e-12 );
  EXPECT_NEAR( result.centroid->longitude, (a.longitude + b.longitude + c.longitude) / 3.0,
               1e-12 );
}

TEST( PolygonProcessor, NothingConverts ) {
  FlatGroundProjector projector;
  std::vector<PixelPoint> pixels = {{1900, 1400}, {2100, 1400}, {2000, 1600}};

  PolygonResult result = projectPolygon(pixels, obliquePose(30.0), projector);
  EXPECT_EQ( result.failed_vertices, 3 );
  EXPECT_TRUE( result.polygon.empty() );
  EXPECT_FALSE( result.centroid.has_value() );
  EXPECT_TRUE( result.failed() );

  PolygonResult empty = projectPolygon({}, nadirPose(), projector);
  EXPECT_EQ( empty.total_vertices, 0 );
  EXPECT_TRUE( empty.failed() );
}

TEST( PolygonProcessor, CameraBelowGroundPlaneIsContained ) {
  FlatGroundProjector projector;
  std::vector<PixelPoint> pixels = {{1000, 500}, {3000, 500}, {3000, 2500}};

  PolygonResult result;
  ASSERT_NO_THROW( result = projectPolygon(pixels, nadirPose(-10.0), projector) );
  EXPECT_EQ( result.failed_vertices, 3 );
  EXPECT_FALSE( result.centroid.has_value() );
}

TEST( PolygonProcessor, AntimeridianCentroid ) {
  FlatGroundProjector projector;
  CameraPose pose = nadirPose();
  pose.longitude = 179.9999;
  std::vector<PixelPoint> square = {{1000, 500}, {3000, 500}, {3000, 2500}, {1000, 2500}};

  PolygonResult result = projectPolygon(square, pose, projector);
  ASSERT_EQ( result.failed_vertices, 0 );
  // The ring straddles the antimeridian
  EXPECT_GT( result.polygon[0].longitude, 179.0 );
  EXPECT_LT( result.polygon[1].longitude, -179.0 );
  for (const auto& p : result.polygon) {
    EXPECT_LE( std::abs(p.longitude), 180.0 );
  }

  ASSERT_TRUE( result.centroid.has_value() );
  EXPECT_GEO_NEAR( *result.centroid, GeoPoint(pose.latitude, pose.longitude), 1e-9 );

  PolygonResult reference = projectPolygon(square, nadirPose(), projector);
  EXPECT_NEAR( polygonAreaSquareMeters(result.polygon),
               polygonAreaSquareMeters(reference.polygon), 1e-3 );
}

TEST( PolygonProcessor, SingleVertex ) {
  FlatGroundProjector projector;
  CameraPose pose = nadirPose();
  PixelPoint pixel(2500, 1200);

  PolygonResult result = projectPolygon({pixel}, pose, projector);
  ASSERT_EQ( result.polygon.size(), 1u );
  EXPECT_FALSE( result.isClosed() );
  ASSERT_TRUE( result.centroid.has_value() );
  EXPECT_GEO_NEAR( *result.centroid, result.polygon.front(), 1e-12 );
  EXPECT_GEO_NEAR( result.polygon.front(), projector.projectPixel(pixel, pose), 1e-12 );
}

TEST( PolygonProcessor, TwoVerticesStayOpen ) {
  FlatGroundProjector projector;
  PolygonResult result = projectPolygon({{1000, 1000}, {3000, 2000}}, nadirPose(), projector);
  EXPECT_EQ( result.polygon.size(), 2u );
  EXPECT_FALSE( result.isClosed() );
}

TEST( PolygonProcessor, CenterBox ) {
  std::vector<PixelPoint> pixels = {{120, 40}, {300, 90}, {200, 260}, {90, 100}};
  PixelBox box = polygonToCenterBox(pixels);
  EXPECT_DOUBLE_EQ( box.x, 90.0 );
  EXPECT_DOUBLE_EQ( box.y, 40.0 );
  EXPECT_DOUBLE_EQ( box.width, 210.0 );
  EXPECT_DOUBLE_EQ( box.height, 220.0 );
  EXPECT_DOUBLE_EQ( box.center().x, 195.0 );
  EXPECT_DOUBLE_EQ( box.center().y, 150.0 );

  EXPECT_THROW( polygonToCenterBox({}), std::invalid_argument );

  auto corners = boundingBoxToPixelPolygon(box);
  ASSERT_EQ( corners.size(), 4u );
  EXPECT_DOUBLE_EQ( corners[0].x, 90.0 );
  EXPECT_DOUBLE_EQ( corners[0].y, 40.0 );
  EXPECT_DOUBLE_EQ( corners[1].x, 300.0 );
  EXPECT_DOUBLE_EQ( corners[2].y, 260.0 );
  EXPECT_DOUBLE_EQ( corners[3].x, 90.0 );
}

TEST( PolygonProcessor, FootprintScalesWithAltitudeSquared ) {
  FlatGroundProjector projector;

  PolygonResult low = imageFootprint(nadirPose(50.0), projector);
  PolygonResult high = imageFootprint(nadirPose(100.0), projector);
  ASSERT_EQ( low.failed_vertices, 0 );
  ASSERT_EQ( high.failed_vertices, 0 );

  double a_low = polygonAreaSquareMeters(low.polygon);
  double a_high = polygonAreaSquareMeters(high.polygon);
  EXPECT_NEAR( a_high / a_low, 4.0, 1e-3 );

  // Ground width 2 h tan(42), height scaled by the aspect ratio
  double width = 2.0 * 100.0 * std::tan(deg2rad(42.0));
  EXPECT_NEAR( a_high, width * width * 0.75, width * width * 0.75 * 1e-3 );
}

TEST( PolygonProcessor, AreaOfDegeneratePolygons ) {
  EXPECT_DOUBLE_EQ( polygonAreaSquareMeters({}), 0.0 );
  EXPECT_DOUBLE_EQ( polygonAreaSquareMeters({GeoPoint(0, 0), GeoPoint(0, 1e-4)}), 0.0 );

  // Closing vertex does not change the area
  std::vector<GeoPoint> open = {GeoPoint(0, 0), GeoPoint(0, 1e-3), GeoPoint(1e-3, 1e-3)};
  std::vector<GeoPoint> closed = open;
  closed.push_back(open.front());
  EXPECT_DOUBLE_EQ( polygonAreaSquareMeters(open), polygonAreaSquareMeters(closed) );
  EXPECT_NEAR( polygonAreaSquareMeters(open),
               0.5 * (1e-3 * kMetersPerDegree) * (1e-3 * kMetersPerDegree), 1e-6 );
}

TEST( PolygonProcessor, BatchPreservesOrder ) {
  FlatGroundProjector projector;

  std::vector<PolygonJob> jobs;
  for (int i = 0; i < 25; ++i) {
    CameraPose pose = nadirPose();
    pose.latitude = -27.5 + i * 0.01;
    // Every fifth job looks at the sky
    if (i % 5 == 4) {
      pose.gimbal_pitch_deg = 30.0;
    }
    jobs.push_back({{{1900, 1400}, {2100, 1400}, {2100, 1600}, {1900, 1600}}, pose});
  }

  auto results = projectPolygons(jobs, projector, 4);
  ASSERT_EQ( results.size(), jobs.size() );
  for (size_t i = 0; i < jobs.size(); ++i) {
    if (i % 5 == 4) {
      EXPECT_TRUE( results[i].failed() );
      continue;
    }
    ASSERT_TRUE( results[i].centroid.has_value() );
    EXPECT_NEAR( results[i].centroid->latitude, jobs[i].pose.latitude, 1e-9 );
  }

  // Default worker count, and nothing to do
  EXPECT_EQ( projectPolygons(jobs, projector).size(), jobs.size() );
  EXPECT_TRUE( projectPolygons({}, projector, 4).empty() );
}
