#include "floodmap/classify/classifiers.hpp"
#include "floodmap/config/configuration.hpp"
#include "floodmap/core/errors.hpp"
#include "floodmap/core/events.hpp"
#include "floodmap/core/types.hpp"
#include "floodmap/core/utils.hpp"
#include "floodmap/grid/tile_grid.hpp"
#include "floodmap/io/geojson.hpp"
#include "floodmap/io/raster.hpp"
#include "floodmap/postprocess/postprocess.hpp"
#include "floodmap/search/frontier_seeder.hpp"
#include "floodmap/search/search_engine.hpp"

#include "runner_shared.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

namespace fs = std::filesystem;

namespace {

namespace core = floodmap::core;
namespace config = floodmap::config;
namespace grid = floodmap::grid;
namespace io = floodmap::io;
namespace search = floodmap::search;
namespace classify = floodmap::classify;
namespace postprocess = floodmap::postprocess;

using floodmap::Phase;
using floodmap::TileCoord;
using floodmap::runner::TeeBuf;

struct RunOptions {
  std::string config_path;
  std::vector<std::string> inputs;
  std::string footprint_path;
  std::string rivers_path;
  std::string prescribed_path;
  std::string runs_dir;
  std::string name = "floodmap";
  int max_visits = 0;
  bool dry_run = false;
};

// Ends the current phase and the run with an error event.
int fail_phase(core::EventEmitter &emitter, const std::string &run_id,
               Phase phase, const std::exception &e, std::ostream &log_file) {
  emitter.phase_end(run_id, phase, "error", {{"error", e.what()}}, log_file);
  emitter.error(run_id, e.what(), log_file);
  emitter.run_end(run_id, false, "error", {}, log_file);
  std::cerr << "Error during " << floodmap::phase_to_string(phase) << ": "
            << e.what() << std::endl;
  return 1;
}

int run_command(const RunOptions &opt) {
  fs::path cfg_path(opt.config_path);
  if (!fs::exists(cfg_path)) {
    std::cerr << "Error: Config file not found: " << opt.config_path
              << std::endl;
    return 1;
  }

  config::Config cfg;
  try {
    cfg = config::Config::load(cfg_path);
    if (opt.max_visits > 0) {
      cfg.search.max_visits = opt.max_visits;
    }
    cfg.validate();
  } catch (const std::exception &e) {
    std::cerr << "Error: failed to load/validate config: " << e.what()
              << std::endl;
    return 1;
  }

  for (const auto &p : opt.inputs) {
    if (!fs::exists(p)) {
      std::cerr << "Error: Input raster not found: " << p << std::endl;
      return 1;
    }
  }
  if (!fs::exists(opt.footprint_path)) {
    std::cerr << "Error: Footprint not found: " << opt.footprint_path
              << std::endl;
    return 1;
  }

  const std::string run_id = core::get_run_id();
  const fs::path run_dir = fs::path(opt.runs_dir) / run_id;
  const fs::path out_dir = run_dir / "outputs";
  fs::create_directories(run_dir / "logs");
  fs::create_directories(out_dir);
  core::copy_config(cfg_path, run_dir / "config.yaml");

  std::ofstream event_log_file(run_dir / "logs" / "run_events.jsonl");
  TeeBuf tee_buf(std::cout.rdbuf(), event_log_file.rdbuf());
  std::ostream log_file(&tee_buf);

  std::vector<fs::path> input_paths(opt.inputs.begin(), opt.inputs.end());

  core::EventEmitter emitter;
  emitter.run_start(
      run_id,
      {{"config_path", opt.config_path},
       {"config_sha256", core::sha256_file(cfg_path)},
       {"inputs", opt.inputs},
       {"input_bytes", floodmap::runner::format_bytes(
                           floodmap::runner::estimate_total_file_bytes(
                               input_paths))},
       {"footprint", opt.footprint_path},
       {"rivers", opt.rivers_path},
       {"prescribed_tiles", opt.prescribed_path},
       {"run_dir", run_dir.string()},
       {"dry_run", opt.dry_run}},
      log_file);

  std::cout << "Run ID: " << run_id << std::endl;
  std::cout << "Inputs: " << opt.inputs.size() << std::endl;
  std::cout << "Output: " << run_dir.string() << std::endl;

  // Phase 0: VALIDATE_INPUTS
  emitter.phase_start(run_id, Phase::VALIDATE_INPUTS, log_file);
  std::vector<std::unique_ptr<io::GeoRaster>> rasters;
  std::vector<const io::GeoRaster *> raster_ptrs;
  floodmap::geometry::Polygon footprint;
  std::vector<io::RiverSegment> rivers;
  std::vector<floodmap::geometry::Polygon> prescribed;
  try {
    for (const auto &p : opt.inputs) {
      rasters.push_back(io::GeoRaster::open_read(p));
      raster_ptrs.push_back(rasters.back().get());
    }
    io::check_rasters_match(raster_ptrs);
    footprint = io::read_footprint(opt.footprint_path);
    if (!opt.prescribed_path.empty()) {
      prescribed = io::read_prescribed_tiles(opt.prescribed_path);
    } else if (!opt.rivers_path.empty()) {
      rivers = io::read_rivers(opt.rivers_path,
                               cfg.seeding.river_size_property);
    }
  } catch (const std::exception &e) {
    return fail_phase(emitter, run_id, Phase::VALIDATE_INPUTS, e, log_file);
  }
  if (opt.prescribed_path.empty() && opt.rivers_path.empty()) {
    emitter.warning(run_id,
                    "no river network given, seeding falls back to the "
                    "lattice center",
                    log_file);
  }
  emitter.phase_end(run_id, Phase::VALIDATE_INPUTS, "ok",
                    {{"num_inputs", rasters.size()},
                     {"crs", rasters.back()->crs()},
                     {"num_rivers", rivers.size()},
                     {"num_prescribed", prescribed.size()}},
                    log_file);

  // Phase 1: TILE_GRID
  emitter.phase_start(run_id, Phase::TILE_GRID, log_file);
  grid::LatticeSet lattices;
  try {
    lattices = grid::build_lattices(footprint, rasters.back()->transform(),
                                    cfg.search.tile_size);
  } catch (const std::exception &e) {
    return fail_phase(emitter, run_id, Phase::TILE_GRID, e, log_file);
  }
  std::cout << "[GRID] " << lattices.primary().nx << "x"
            << lattices.primary().ny << " tiles of " << lattices.tile_size
            << " px, output " << lattices.width << "x" << lattices.height
            << " px" << std::endl;
  for (int i = 1; i < grid::kNumLattices; ++i) {
    const auto id = static_cast<grid::LatticeId>(i);
    std::cout << "[GRID]   " << grid::lattice_to_string(id) << ": "
              << lattices.lattice(id).nx << "x" << lattices.lattice(id).ny
              << std::endl;
  }
  emitter.phase_end(run_id, Phase::TILE_GRID, "ok",
                    {{"nx", lattices.primary().nx},
                     {"ny", lattices.primary().ny},
                     {"tile_size", lattices.tile_size},
                     {"width", lattices.width},
                     {"height", lattices.height}},
                    log_file);

  if (opt.dry_run) {
    std::cout << "Dry run - no search" << std::endl;
    emitter.run_end(run_id, true, "ok", {{"dry_run", true}}, log_file);
    return 0;
  }

  // Phase 2: SEED_FRONTIER
  emitter.phase_start(run_id, Phase::SEED_FRONTIER, log_file);
  std::vector<TileCoord> initial;
  std::string seed_rule;
  if (!opt.prescribed_path.empty()) {
    initial = search::prescribed_tile_coords(
        prescribed, lattices, cfg.seeding.prescribed_overlap_fraction);
    seed_rule = search::seed_rule_to_string(search::SeedRule::PRESCRIBED);
  } else {
    const search::SeedResult seeds =
        search::seed_frontier(rivers, lattices, cfg.seeding);
    initial = seeds.tiles;
    seed_rule = search::seed_rule_to_string(seeds.rule);
  }
  std::cout << "[SEED] " << initial.size() << " initial tiles (" << seed_rule
            << ")" << std::endl;
  emitter.phase_end(run_id, Phase::SEED_FRONTIER, "ok",
                    {{"rule", seed_rule}, {"num_tiles", initial.size()}},
                    log_file);

  // Phase 3: FLOOD_SEARCH
  emitter.phase_start(run_id, Phase::FLOOD_SEARCH, log_file);
  const fs::path final_path = out_dir / (opt.name + ".fits");
  const fs::path raw_path = out_dir / (opt.name + "-raw.fits");
  const fs::path visit_path = out_dir / (opt.name + "-visit.geojson");
  search::SearchResult result;
  try {
    auto classifier =
        classify::make_classifier(cfg.classifier, cfg.search.tile_size);
    auto classes = io::GeoRaster::create_class(
        raw_path, lattices.width, lattices.height, lattices.transform,
        rasters.back()->crs(), floodmap::kClassNodata);

    const fs::path export_prefix =
        cfg.output.export_inputs ? out_dir / opt.name : fs::path();
    const int max_visits = cfg.search.max_visits;

    search::FloodSearch engine(lattices, *classifier, raster_ptrs, cfg);
    result = engine.run(
        initial, *classes, export_prefix, &std::cout,
        [&](const search::SearchCounters &c, size_t open) {
          emitter.phase_progress(
              run_id, Phase::FLOOD_SEARCH, c.visited, max_visits,
              "open=" + std::to_string(open) +
                  " flooded=" + std::to_string(c.flooded) +
                  " large_water=" + std::to_string(c.large_water) +
                  " outside=" + std::to_string(c.outside),
              log_file);
        });

    io::write_visit_layer(visit_path, result.visits, rasters.back()->crs());
  } catch (const std::exception &e) {
    return fail_phase(emitter, run_id, Phase::FLOOD_SEARCH, e, log_file);
  }

  std::vector<std::string> export_names;
  for (const auto &p : result.export_paths) {
    export_names.push_back(p.filename().string());
  }
  emitter.phase_end(run_id, Phase::FLOOD_SEARCH,
                    result.hit_visit_cap ? "capped" : "ok",
                    {{"visited", result.counters.visited},
                     {"flooded", result.counters.flooded},
                     {"large_water", result.counters.large_water},
                     {"outside", result.counters.outside},
                     {"open", result.open_at_exit},
                     {"offset_classifications",
                      result.offset_classifications},
                     {"visit_layer", visit_path.filename().string()},
                     {"exports", export_names}},
                    log_file);
  if (result.hit_visit_cap) {
    emitter.warning(run_id,
                    "visit cap of " + std::to_string(cfg.search.max_visits) +
                        " reached with " + std::to_string(result.open_at_exit) +
                        " tiles still open",
                    log_file);
  }

  // Phase 4: POSTPROCESS
  emitter.phase_start(run_id, Phase::POSTPROCESS, log_file);
  std::cout << "[POSTPROCESS] " << raw_path.filename().string() << " -> "
            << final_path.filename().string() << std::endl;
  postprocess::PostprocessStats pp;
  try {
    pp = postprocess::postprocess_raster(raw_path, final_path, cfg.postprocess);
    if (!cfg.output.keep_raw) {
      fs::remove(raw_path);
    }
  } catch (const std::exception &e) {
    return fail_phase(emitter, run_id, Phase::POSTPROCESS, e, log_file);
  }
  emitter.phase_end(run_id, Phase::POSTPROCESS, "ok",
                    {{"pixels_smoothed", pp.pixels_smoothed},
                     {"regions_filled", pp.regions_filled},
                     {"single_pixels", pp.single_pixels},
                     {"open_contours_skipped", pp.open_contours_skipped}},
                    log_file);

  if (!result.major_flooding) {
    std::cout << "No major flooding: " << result.counters.flooded
              << " flooded tiles (< " << cfg.search.min_flooded_tiles << ")"
              << std::endl;
  }

  emitter.run_end(run_id, true, "ok",
                  {{"floodmap", final_path.filename().string()},
                   {"visited", result.counters.visited},
                   {"flooded", result.counters.flooded},
                   {"major_flooding", result.major_flooding}},
                  log_file);
  return 0;
}

int postprocess_command(const std::string &config_path,
                        const std::string &raw_path,
                        const std::string &out_path) {
  config::Config cfg;
  try {
    if (!config_path.empty()) {
      cfg = config::Config::load(config_path);
    }
    cfg.validate();
  } catch (const std::exception &e) {
    std::cerr << "Error: failed to load/validate config: " << e.what()
              << std::endl;
    return 1;
  }

  try {
    const auto stats =
        postprocess::postprocess_raster(raw_path, out_path, cfg.postprocess);
    std::cout << "[POSTPROCESS] smoothed " << stats.pixels_smoothed
              << " px, filled " << stats.regions_filled << " regions, "
              << stats.single_pixels << " single pixels" << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error during POSTPROCESS: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"Flood-map tile search runner"};
  app.require_subcommand(1);

  RunOptions run_opt;
  auto run_cmd = app.add_subcommand("run", "Search, classify and postprocess");
  run_cmd->add_option("--config", run_opt.config_path, "Path to config.yaml")
      ->required();
  run_cmd->add_option("--input", run_opt.inputs,
                      "Input rasters; the last one defines the output grid")
      ->required();
  run_cmd->add_option("--footprint", run_opt.footprint_path,
                      "Validity footprint (GeoJSON)")
      ->required();
  run_cmd->add_option("--rivers", run_opt.rivers_path,
                      "River network (GeoJSON)");
  run_cmd->add_option("--prescribed-tiles", run_opt.prescribed_path,
                      "Visit layer of a previous run; bypasses seeding");
  run_cmd->add_option("--runs-dir", run_opt.runs_dir, "Runs directory")
      ->required();
  run_cmd->add_option("--name", run_opt.name, "Output file stem");
  run_cmd->add_option("--max-visits", run_opt.max_visits,
                      "Override search.max_visits (0 = config value)");
  run_cmd->add_flag("--dry-run", run_opt.dry_run,
                    "Validate inputs and build the grid only");

  std::string pp_config, pp_raw, pp_out;
  auto pp_cmd = app.add_subcommand("postprocess",
                                   "Clean a raw class raster");
  pp_cmd->add_option("--config", pp_config, "Path to config.yaml");
  pp_cmd->add_option("--raw", pp_raw, "Raw class raster")->required();
  pp_cmd->add_option("--out", pp_out, "Output class raster")->required();

  CLI11_PARSE(app, argc, argv);

  if (run_cmd->parsed()) {
    return run_command(run_opt);
  }
  if (pp_cmd->parsed()) {
    return postprocess_command(pp_config, pp_raw, pp_out);
  }
  return 1;
}
