#include "floodmap/config/configuration.hpp"
#include "floodmap/core/errors.hpp"

#include <filesystem>
#include <fstream>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

namespace fs = std::filesystem;
using floodmap::config::Config;

TEST_CASE("config_defaults_validate") {
  Config cfg;
  REQUIRE_NOTHROW(cfg.validate());
  REQUIRE(cfg.search.tile_size == 224);
  REQUIRE(cfg.search.max_visits == 2500);
  REQUIRE(cfg.search.flood_fraction == Catch::Approx(0.05f));
  REQUIRE(cfg.seeding.min_river_size == Catch::Approx(500.0));
  REQUIRE(cfg.seeding.max_seed_tiles == 200);
  REQUIRE(cfg.edge_heuristic.max_zero_fraction == Catch::Approx(0.05f));
}

TEST_CASE("config_from_yaml_overrides_only_given_keys") {
  const YAML::Node node = YAML::Load(
      "search:\n"
      "  tile_size: 64\n"
      "  max_visits: 10\n"
      "seeding:\n"
      "  river_size_property: upstream_area\n"
      "postprocess:\n"
      "  enabled: false\n"
      "runtime_limits:\n"
      "  parallel_workers: 2\n");

  const Config cfg = Config::from_yaml(node);
  REQUIRE(cfg.search.tile_size == 64);
  REQUIRE(cfg.search.max_visits == 10);
  REQUIRE(cfg.search.expand_radius == 3);
  REQUIRE(cfg.seeding.river_size_property == "upstream_area");
  REQUIRE_FALSE(cfg.postprocess.enabled);
  REQUIRE(cfg.postprocess.majority_radius == 2);
  REQUIRE(cfg.runtime_limits.parallel_workers == 2);
}

TEST_CASE("config_save_and_load_preserve_values") {
  const fs::path path = fs::temp_directory_path() / "floodmap_test_config.yaml";

  Config cfg;
  cfg.search.tile_size = 128;
  cfg.seeding.prescribed_overlap_fraction = 0.25f;
  cfg.classifier.model_path = "model.onnx";
  cfg.save(path);

  const Config loaded = Config::load(path);
  REQUIRE(loaded.search.tile_size == 128);
  REQUIRE(loaded.seeding.prescribed_overlap_fraction == Catch::Approx(0.25f));
  REQUIRE(loaded.classifier.model_path == "model.onnx");

  fs::remove(path);
}

TEST_CASE("config_validate_rejects_odd_tile_size") {
  Config cfg;
  cfg.search.tile_size = 225;
  REQUIRE_THROWS_AS(cfg.validate(), floodmap::ValidationError);
}

TEST_CASE("config_validate_requires_secondary_model_for_averaging") {
  Config cfg;
  cfg.classifier.type = "averaged";
  cfg.classifier.elevation_path = "dem.fits";
  REQUIRE_THROWS_AS(cfg.validate(), floodmap::ValidationError);

  cfg.classifier.secondary_model_path = "secondary.onnx";
  REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("config_validate_requires_elevation_path_when_model_uses_elevation") {
  Config cfg;
  cfg.classifier.requires_elevation = true;
  REQUIRE_THROWS_AS(cfg.validate(), floodmap::ValidationError);
}

TEST_CASE("config_load_missing_file_is_config_error") {
  REQUIRE_THROWS_AS(Config::load(fs::temp_directory_path() / "floodmap_no_such_config.yaml"),
                    floodmap::ConfigError);
}

TEST_CASE("config_load_bad_value_is_config_error") {
  const fs::path path = fs::temp_directory_path() / "floodmap_test_bad_config.yaml";
  {
    std::ofstream out(path);
    out << "search:\n  tile_size: many\n";
  }
  REQUIRE_THROWS_AS(Config::load(path), floodmap::ConfigError);
  fs::remove(path);
}
