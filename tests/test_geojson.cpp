#include "floodmap/core/errors.hpp"
#include "floodmap/geometry/geometry.hpp"
#include "floodmap/io/geojson.hpp"

#include <filesystem>
#include <fstream>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

namespace fs = std::filesystem;
using namespace floodmap;

namespace {

fs::path write_temp(const std::string& name, const std::string& text) {
  const fs::path path = fs::temp_directory_path() / name;
  std::ofstream out(path);
  out << text;
  return path;
}

} // namespace

TEST_CASE("read_footprint_keeps_largest_multipolygon_part") {
  const fs::path path = write_temp("floodmap_test_footprint.geojson", R"({
    "type": "FeatureCollection",
    "features": [{
      "type": "Feature",
      "properties": {},
      "geometry": {
        "type": "MultiPolygon",
        "coordinates": [
          [[[0, 0], [1, 0], [1, 1], [0, 1], [0, 0]]],
          [[[10, 10], [20, 10], [20, 20], [10, 20], [10, 10]]]
        ]
      }
    }]
  })");

  const geometry::Polygon fp = io::read_footprint(path);
  REQUIRE(fp.outer.size() == 4);
  REQUIRE(geometry::polygon_area(fp) == Catch::Approx(100.0));
  fs::remove(path);
}

TEST_CASE("read_footprint_without_polygon_is_geojson_error") {
  const fs::path path = write_temp("floodmap_test_no_polygon.geojson",
                                   R"({"type": "LineString", "coordinates": [[0, 0], [1, 1]]})");
  REQUIRE_THROWS_AS(io::read_footprint(path), GeoJsonError);
  fs::remove(path);

  const fs::path broken = write_temp("floodmap_test_broken.geojson", "{ not json");
  REQUIRE_THROWS_AS(io::read_footprint(broken), GeoJsonError);
  fs::remove(broken);
}

TEST_CASE("read_rivers_splits_multilines_and_reads_size") {
  const fs::path path = write_temp("floodmap_test_rivers.geojson", R"({
    "type": "FeatureCollection",
    "features": [
      {"type": "Feature", "properties": {"riv_tc_usu": 812.5},
       "geometry": {"type": "MultiLineString",
                    "coordinates": [[[0, 0], [5, 5]], [[5, 5], [9, 5], [12, 8]]]}},
      {"type": "Feature", "properties": {"name": "creek"},
       "geometry": {"type": "LineString", "coordinates": [[1, 1], [2, 1]]}}
    ]
  })");

  const auto rivers = io::read_rivers(path, "riv_tc_usu");
  REQUIRE(rivers.size() == 3);
  REQUIRE(rivers[0].size == Catch::Approx(812.5));
  REQUIRE(rivers[1].line.size() == 3);
  REQUIRE(rivers[1].size == Catch::Approx(812.5));
  REQUIRE(rivers[2].size == Catch::Approx(0.0));
  fs::remove(path);
}

TEST_CASE("visit_layer_feeds_back_as_prescribed_tiles") {
  std::vector<search::VisitRecord> visits(3);
  visits[0].coord = {0, 0};
  visits[0].footprint.outer = geometry::box_to_ring({0, 0, 4, 4});
  visits[0].disposition = TileDisposition::FLOODED;
  visits[0].counts.flood = 5;
  visits[0].counts.background = 11;
  visits[1].coord = {1, 0};
  visits[1].footprint.outer = geometry::box_to_ring({4, 0, 8, 4});
  visits[1].disposition = TileDisposition::OUTSIDE;
  visits[2].coord = {0, 1};
  visits[2].footprint.outer = geometry::box_to_ring({0, 4, 4, 8});
  visits[2].disposition = TileDisposition::DRY;

  const fs::path path = fs::temp_directory_path() / "floodmap_test_visits.geojson";
  io::write_visit_layer(path, visits, "EPSG:32633");

  const auto tiles = io::read_prescribed_tiles(path);
  REQUIRE(tiles.size() == 2);
  REQUIRE(tiles[0].outer.size() == 4);
  REQUIRE(geometry::polygon_area(tiles[0]) == Catch::Approx(16.0));
  REQUIRE(geometry::bounds(tiles[1]).min_y == Catch::Approx(4.0));
  fs::remove(path);
}
