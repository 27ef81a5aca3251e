#pragma once

#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace floodmap::config {

namespace fs = std::filesystem;

struct SearchConfig {
  int tile_size = 224;          // pixels, must be even
  int max_visits = 2500;        // hard cap on popped tiles
  float flood_fraction = 0.05f; // tile counts as flooded above this
  float permanent_water_max_fraction = 0.5f;
  float background_min_fraction = 0.1f;
  int expand_radius = 3;        // ±tiles enqueued around a flooded tile
  int progress_every = 200;     // visits between counter lines (0 = off)
  int min_flooded_tiles = 50;   // below this the run reports no major flooding
};

struct SeedingConfig {
  double min_river_size = 500.0;
  int max_seed_tiles = 200;
  int seed_radius = 2;
  float prescribed_overlap_fraction = 0.01f;
  std::string river_size_property = "riv_tc_usu";
};

struct EdgeHeuristicConfig {
  float zero_value = 1.0e-5f;
  float max_zero_fraction = 0.05f;
};

struct PostprocessConfig {
  bool enabled = true;
  int majority_radius = 2;
  double min_region_area = 50.0; // px^2
  int region_padding = 2;
};

struct ClassifierConfig {
  std::string type = "single"; // single | averaged
  std::string model_path;
  int model_inputs = 0;        // trailing input rasters fed to the model, 0 = all
  bool requires_elevation = false;
  std::string secondary_model_path;
  int secondary_inputs = 2;
  bool secondary_requires_elevation = true;
  std::string elevation_path;
  int num_classes = 3;
};

struct OutputConfig {
  bool export_inputs = false;
  bool keep_raw = true;
};

struct RuntimeLimitsConfig {
  int parallel_workers = 4;
};

struct Config {
  SearchConfig search;
  SeedingConfig seeding;
  EdgeHeuristicConfig edge_heuristic;
  PostprocessConfig postprocess;
  ClassifierConfig classifier;
  OutputConfig output;
  RuntimeLimitsConfig runtime_limits;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

} // namespace floodmap::config
