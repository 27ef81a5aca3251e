#include "floodmap/geometry/affine.hpp"
#include "floodmap/geometry/geometry.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace floodmap::geometry;

namespace {

Polygon square(double x0, double y0, double x1, double y1) {
  Polygon p;
  p.outer = box_to_ring({x0, y0, x1, y1});
  return p;
}

} // namespace

TEST_CASE("polygon_area_subtracts_holes") {
  Polygon p = square(0, 0, 10, 10);
  p.holes.push_back(box_to_ring({2, 2, 4, 4}));
  REQUIRE(polygon_area(p) == Catch::Approx(96.0));
}

TEST_CASE("point_in_polygon_counts_boundary_and_excludes_holes") {
  Polygon p = square(0, 0, 10, 10);
  p.holes.push_back(box_to_ring({2, 2, 4, 4}));

  REQUIRE(point_in_polygon({5, 5}, p));
  REQUIRE(point_in_polygon({0, 5}, p));
  REQUIRE_FALSE(point_in_polygon({3, 3}, p));
  REQUIRE_FALSE(point_in_polygon({11, 5}, p));
}

TEST_CASE("polygon_contains_ring_requires_full_containment") {
  Polygon p = square(0, 0, 10, 10);

  REQUIRE(polygon_contains_ring(p, box_to_ring({2, 2, 4, 4})));
  REQUIRE(polygon_contains_ring(p, box_to_ring({0, 0, 10, 10})));
  REQUIRE_FALSE(polygon_contains_ring(p, box_to_ring({8, 8, 12, 12})));

  p.holes.push_back(box_to_ring({5, 5, 6, 6}));
  REQUIRE_FALSE(polygon_contains_ring(p, box_to_ring({4, 4, 7, 7})));
}

TEST_CASE("polygon_contains_ring_rejects_ring_across_concave_notch") {
  // U shape: notch between x 4..6 above y 4.
  Polygon u;
  u.outer = {{0, 0}, {10, 0}, {10, 10}, {6, 10}, {6, 4}, {4, 4}, {4, 10}, {0, 10}};

  REQUIRE(polygon_contains_ring(u, box_to_ring({1, 1, 9, 3})));
  REQUIRE_FALSE(polygon_contains_ring(u, box_to_ring({1, 5, 9, 8})));
}

TEST_CASE("intersection_area_of_overlapping_squares") {
  const Polygon p = square(0, 0, 10, 10);
  REQUIRE(intersection_area(p, {5, 5, 15, 15}) == Catch::Approx(25.0));
  REQUIRE(intersection_area(p, {20, 20, 30, 30}) == Catch::Approx(0.0));
  REQUIRE(intersection_area(p, {-5, -5, 20, 20}) == Catch::Approx(100.0));
}

TEST_CASE("segment_intersects_box_detects_crossing_and_miss") {
  const Box b{0, 0, 4, 4};
  REQUIRE(segment_intersects_box({-1, 2}, {5, 2}, b));
  REQUIRE(segment_intersects_box({1, 1}, {2, 2}, b));
  REQUIRE(segment_intersects_box({-2, 0}, {0, -2}, b) == false);
  REQUIRE_FALSE(segment_intersects_box({5, 5}, {6, 9}, b));
}

TEST_CASE("line_intersects_polygon_for_river_crossing_footprint") {
  const Polygon p = square(0, 0, 10, 10);
  REQUIRE(line_intersects_polygon({{-5, 5}, {15, 5}}, p));
  REQUIRE(line_intersects_polygon({{2, 2}, {3, 3}}, p));
  REQUIRE_FALSE(line_intersects_polygon({{-5, -5}, {-1, 20}}, p));
}

TEST_CASE("affine_inverse_roundtrips_pixel_corner") {
  AffineTransform t;
  t.a = 10.0;
  t.c = 500000.0;
  t.e = -10.0;
  t.f = 4200000.0;

  const Point w = t.apply(3.0, 7.0);
  REQUIRE(w.x == Catch::Approx(500030.0));
  REQUIRE(w.y == Catch::Approx(4199930.0));

  const Point px = t.inverse().apply(w);
  REQUIRE(px.x == Catch::Approx(3.0));
  REQUIRE(px.y == Catch::Approx(7.0));

  const AffineTransform s = t.shifted(2.0, 1.0);
  REQUIRE(s.apply(0.0, 0.0).x == Catch::Approx(500020.0));
  REQUIRE(s.apply(0.0, 0.0).y == Catch::Approx(4199990.0));
}
