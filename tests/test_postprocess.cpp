#include "floodmap/config/configuration.hpp"
#include "floodmap/postprocess/postprocess.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace floodmap;

namespace {

constexpr uint8_t kBg = 0;
constexpr uint8_t kPw = 1;
constexpr uint8_t kFl = 2;

// Left half background, top-right flood, bottom-right permanent water.
ClassMap quadrants(int n) {
  ClassMap m(n, n);
  for (int y = 0; y < n; ++y) {
    for (int x = 0; x < n; ++x) {
      m(y, x) = x < n / 2 ? kBg : (y < n / 2 ? kFl : kPw);
    }
  }
  return m;
}

ClassMap all_valid(const ClassMap& m) {
  return ClassMap::Ones(m.rows(), m.cols());
}

} // namespace

TEST_CASE("majority_filter_removes_isolated_pixel") {
  ClassMap m = ClassMap::Constant(20, 20, kBg);
  m(10, 10) = kFl;

  const ClassMap out = postprocess::majority_filter(m, all_valid(m), 2);
  REQUIRE((out.array() == kBg).all());
}

TEST_CASE("majority_filter_keeps_straight_boundaries") {
  const ClassMap m = quadrants(20);
  const ClassMap out = postprocess::majority_filter(m, all_valid(m), 2);
  REQUIRE(out == m);
}

TEST_CASE("majority_filter_ignores_invalid_pixels") {
  ClassMap m = ClassMap::Constant(5, 5, kBg);
  ClassMap valid = ClassMap::Ones(5, 5);
  // Counting the invalid rows would tie flood with permanent water and the
  // lower class would win.
  for (int x = 0; x < 5; ++x) {
    m(1, x) = kPw;
    valid(1, x) = 0;
    m(3, x) = kPw;
    valid(3, x) = 0;
  }
  m(2, 2) = kFl;
  m(2, 1) = kFl;

  const ClassMap out = postprocess::majority_filter(m, valid, 1);
  REQUIRE(out(2, 2) == kFl);
  REQUIRE(out(1, 2) == kPw);
}

TEST_CASE("remove_small_regions_fills_small_closed_blob") {
  ClassMap m = ClassMap::Constant(30, 30, kBg);
  // 3x3 flood blob, and a 10x10 one that is above the area threshold.
  m.block(5, 5, 3, 3).setConstant(kFl);
  m.block(15, 15, 10, 10).setConstant(kFl);

  config::PostprocessConfig cfg;
  postprocess::PostprocessStats stats;
  postprocess::remove_small_regions(m, all_valid(m), cfg, &stats);

  REQUIRE((m.block(5, 5, 3, 3).array() == kBg).all());
  REQUIRE((m.block(15, 15, 10, 10).array() == kFl).all());
  REQUIRE(stats.regions_filled == 1);
}

TEST_CASE("remove_small_regions_replaces_single_pixel_with_neighbourhood_majority") {
  ClassMap m = ClassMap::Constant(12, 12, kBg);
  m(6, 6) = kPw;

  config::PostprocessConfig cfg;
  postprocess::PostprocessStats stats;
  postprocess::remove_small_regions(m, all_valid(m), cfg, &stats);

  REQUIRE(m(6, 6) == kBg);
  REQUIRE(stats.single_pixels == 1);
}

TEST_CASE("remove_small_regions_removes_both_pixels_of_two_pixel_specks") {
  ClassMap m = ClassMap::Constant(12, 12, kBg);
  m(3, 3) = kFl;
  m(3, 4) = kFl;
  m(7, 8) = kPw;
  m(8, 8) = kPw;

  config::PostprocessConfig cfg;
  postprocess::PostprocessStats stats;
  postprocess::remove_small_regions(m, all_valid(m), cfg, &stats);

  REQUIRE((m.array() == kBg).all());
  REQUIRE(stats.regions_filled == 2);
  REQUIRE(stats.single_pixels == 0);
}

TEST_CASE("remove_small_regions_skips_regions_touching_the_border") {
  ClassMap m = ClassMap::Constant(12, 12, kBg);
  m.block(0, 0, 3, 3).setConstant(kFl);

  config::PostprocessConfig cfg;
  postprocess::PostprocessStats stats;
  postprocess::remove_small_regions(m, all_valid(m), cfg, &stats);

  REQUIRE((m.block(0, 0, 3, 3).array() == kFl).all());
  REQUIRE(stats.open_contours_skipped >= 1);
  REQUIRE(stats.regions_filled == 0);
}

TEST_CASE("postprocess_preserves_nodata_and_adds_none") {
  ClassMap raw = quadrants(20);
  raw.col(0).setConstant(kClassNodata);
  raw.row(19).setConstant(kClassNodata);
  raw(10, 2) = kFl;

  config::PostprocessConfig cfg;
  const ClassMap out = postprocess::postprocess_classes(raw, kClassNodata, cfg);

  for (int y = 0; y < 20; ++y) {
    for (int x = 0; x < 20; ++x) {
      REQUIRE((raw(y, x) == kClassNodata) == (out(y, x) == kClassNodata));
    }
  }
  REQUIRE(out(10, 2) == kBg);
}

TEST_CASE("postprocess_second_pass_changes_nothing") {
  ClassMap raw = quadrants(20);
  raw.block(14, 3, 3, 3).setConstant(kFl);
  raw(4, 4) = kPw;
  raw(5, 15) = kBg;

  config::PostprocessConfig cfg;
  const ClassMap once = postprocess::postprocess_classes(raw, kClassNodata, cfg);
  const ClassMap twice = postprocess::postprocess_classes(once, kClassNodata, cfg);

  REQUIRE(once == quadrants(20));
  REQUIRE(twice == once);
}
