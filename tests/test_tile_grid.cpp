#include "floodmap/core/errors.hpp"
#include "floodmap/grid/tile_grid.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace floodmap;
using floodmap::grid::LatticeId;

namespace {

// North-up 10 m grid.
geometry::AffineTransform utm_transform() {
  geometry::AffineTransform t;
  t.a = 10.0;
  t.c = 500000.0;
  t.e = -10.0;
  t.f = 4200000.0;
  return t;
}

geometry::Polygon pixel_footprint(const geometry::AffineTransform& t, double w, double h) {
  geometry::Polygon p;
  p.outer = geometry::transform_ring(geometry::box_to_ring({0.0, 0.0, w, h}), t);
  return p;
}

void require_translated(const geometry::Polygon& a, const geometry::Polygon& b, double dx,
                        double dy) {
  REQUIRE(a.outer.size() == b.outer.size());
  for (size_t i = 0; i < a.outer.size(); ++i) {
    REQUIRE(b.outer[i].x - a.outer[i].x == dx);
    REQUIRE(b.outer[i].y - a.outer[i].y == dy);
  }
}

} // namespace

TEST_CASE("build_lattices_shrinks_envelope_and_sizes_all_four_lattices") {
  const auto t = utm_transform();
  // 34 px envelope shrinks to 32 px: 4 primary tiles of 8 px, 3 offset tiles.
  const auto set = grid::build_lattices(pixel_footprint(t, 34.0, 26.0), t, 8);

  REQUIRE(set.tile_size == 8);
  REQUIRE(set.primary().nx == 4);
  REQUIRE(set.primary().ny == 3);
  REQUIRE(set.width == 32);
  REQUIRE(set.height == 24);

  REQUIRE(set.lattice(LatticeId::OFFSET_X).nx == 3);
  REQUIRE(set.lattice(LatticeId::OFFSET_X).ny == 3);
  REQUIRE(set.lattice(LatticeId::OFFSET_Y).nx == 4);
  REQUIRE(set.lattice(LatticeId::OFFSET_Y).ny == 2);
  REQUIRE(set.lattice(LatticeId::OFFSET_XY).nx == 3);
  REQUIRE(set.lattice(LatticeId::OFFSET_XY).ny == 2);

  REQUIRE(set.transform.c == Catch::Approx(500010.0));
  REQUIRE(set.transform.f == Catch::Approx(4199990.0));
}

TEST_CASE("offset_lattice_tiles_are_exact_half_tile_translations") {
  const auto t = utm_transform();
  const auto set = grid::build_lattices(pixel_footprint(t, 34.0, 34.0), t, 8);

  const TileCoord c{1, 2};
  const auto primary = set.tile_polygon(LatticeId::PRIMARY, c);

  // Half a tile is 4 px = 40 m; y runs south.
  require_translated(primary, set.tile_polygon(LatticeId::OFFSET_X, c), 40.0, 0.0);
  require_translated(primary, set.tile_polygon(LatticeId::OFFSET_Y, c), 0.0, -40.0);
  require_translated(primary, set.tile_polygon(LatticeId::OFFSET_XY, c), 40.0, -40.0);

  const auto next = set.tile_polygon(LatticeId::PRIMARY, {2, 2});
  require_translated(primary, next, 80.0, 0.0);
}

TEST_CASE("tile_in_bounds_follows_validity_polygon") {
  const auto t = utm_transform();
  geometry::Polygon tri;
  // Lower-left triangle in pixel space, same envelope as a 34 px square.
  tri.outer = geometry::transform_ring({{0.0, 0.0}, {34.0, 34.0}, {0.0, 34.0}}, t);

  const auto set = grid::build_lattices(tri, t, 8);
  REQUIRE(set.primary().nx == 4);

  REQUIRE(set.tile_in_bounds(LatticeId::PRIMARY, {0, 3}));
  REQUIRE_FALSE(set.tile_in_bounds(LatticeId::PRIMARY, {3, 0}));
  REQUIRE_FALSE(set.tile_in_bounds(LatticeId::PRIMARY, {4, 0}));
  REQUIRE_FALSE(set.tile_in_bounds(LatticeId::PRIMARY, {-1, 0}));
}

TEST_CASE("build_lattices_rejects_unusable_footprints") {
  const auto t = utm_transform();

  SECTION("footprint_smaller_than_a_tile") {
    REQUIRE_THROWS_AS(grid::build_lattices(pixel_footprint(t, 6.0, 40.0), t, 8),
                      InvalidFootprint);
  }
  SECTION("odd_tile_size") {
    REQUIRE_THROWS_AS(grid::build_lattices(pixel_footprint(t, 40.0, 40.0), t, 7),
                      InvalidFootprint);
  }
  SECTION("degenerate_polygon") {
    geometry::Polygon line;
    line.outer = {{500000.0, 4200000.0}, {500100.0, 4200000.0}};
    REQUIRE_THROWS_AS(grid::build_lattices(line, t, 8), InvalidFootprint);
  }
}

TEST_CASE("pixel_window_of_offset_cell_starts_half_a_tile_in") {
  const auto t = utm_transform();
  const auto set = grid::build_lattices(pixel_footprint(t, 34.0, 34.0), t, 8);

  const auto w = set.lattice(LatticeId::OFFSET_XY).pixel_window({1, 0});
  REQUIRE(w.col_off == 12);
  REQUIRE(w.row_off == 4);
  REQUIRE(w.width == 8);
  REQUIRE(w.height == 8);
}
