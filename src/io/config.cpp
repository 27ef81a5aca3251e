#include "floodmap/config/configuration.hpp"
#include "floodmap/core/errors.hpp"

#include <fstream>

namespace floodmap::config {

static bool in_unit_interval(float v) {
    return v >= 0.0f && v <= 1.0f;
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    try {
        return from_yaml(YAML::LoadFile(path.string()));
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    if (node["search"]) {
        auto s = node["search"];
        if (s["tile_size"]) cfg.search.tile_size = s["tile_size"].as<int>();
        if (s["max_visits"]) cfg.search.max_visits = s["max_visits"].as<int>();
        if (s["flood_fraction"]) cfg.search.flood_fraction = s["flood_fraction"].as<float>();
        if (s["permanent_water_max_fraction"]) {
            cfg.search.permanent_water_max_fraction = s["permanent_water_max_fraction"].as<float>();
        }
        if (s["background_min_fraction"]) {
            cfg.search.background_min_fraction = s["background_min_fraction"].as<float>();
        }
        if (s["expand_radius"]) cfg.search.expand_radius = s["expand_radius"].as<int>();
        if (s["progress_every"]) cfg.search.progress_every = s["progress_every"].as<int>();
        if (s["min_flooded_tiles"]) cfg.search.min_flooded_tiles = s["min_flooded_tiles"].as<int>();
    }

    if (node["seeding"]) {
        auto s = node["seeding"];
        if (s["min_river_size"]) cfg.seeding.min_river_size = s["min_river_size"].as<double>();
        if (s["max_seed_tiles"]) cfg.seeding.max_seed_tiles = s["max_seed_tiles"].as<int>();
        if (s["seed_radius"]) cfg.seeding.seed_radius = s["seed_radius"].as<int>();
        if (s["prescribed_overlap_fraction"]) {
            cfg.seeding.prescribed_overlap_fraction = s["prescribed_overlap_fraction"].as<float>();
        }
        if (s["river_size_property"]) {
            cfg.seeding.river_size_property = s["river_size_property"].as<std::string>();
        }
    }

    if (node["edge_heuristic"]) {
        auto e = node["edge_heuristic"];
        if (e["zero_value"]) cfg.edge_heuristic.zero_value = e["zero_value"].as<float>();
        if (e["max_zero_fraction"]) cfg.edge_heuristic.max_zero_fraction = e["max_zero_fraction"].as<float>();
    }

    if (node["postprocess"]) {
        auto p = node["postprocess"];
        if (p["enabled"]) cfg.postprocess.enabled = p["enabled"].as<bool>();
        if (p["majority_radius"]) cfg.postprocess.majority_radius = p["majority_radius"].as<int>();
        if (p["min_region_area"]) cfg.postprocess.min_region_area = p["min_region_area"].as<double>();
        if (p["region_padding"]) cfg.postprocess.region_padding = p["region_padding"].as<int>();
    }

    if (node["classifier"]) {
        auto c = node["classifier"];
        if (c["type"]) cfg.classifier.type = c["type"].as<std::string>();
        if (c["model_path"]) cfg.classifier.model_path = c["model_path"].as<std::string>();
        if (c["model_inputs"]) cfg.classifier.model_inputs = c["model_inputs"].as<int>();
        if (c["requires_elevation"]) cfg.classifier.requires_elevation = c["requires_elevation"].as<bool>();
        if (c["secondary_model_path"]) {
            cfg.classifier.secondary_model_path = c["secondary_model_path"].as<std::string>();
        }
        if (c["secondary_inputs"]) cfg.classifier.secondary_inputs = c["secondary_inputs"].as<int>();
        if (c["secondary_requires_elevation"]) {
            cfg.classifier.secondary_requires_elevation = c["secondary_requires_elevation"].as<bool>();
        }
        if (c["elevation_path"]) cfg.classifier.elevation_path = c["elevation_path"].as<std::string>();
        if (c["num_classes"]) cfg.classifier.num_classes = c["num_classes"].as<int>();
    }

    if (node["output"]) {
        auto o = node["output"];
        if (o["export_inputs"]) cfg.output.export_inputs = o["export_inputs"].as<bool>();
        if (o["keep_raw"]) cfg.output.keep_raw = o["keep_raw"].as<bool>();
    }

    if (node["runtime_limits"]) {
        auto r = node["runtime_limits"];
        if (r["parallel_workers"]) cfg.runtime_limits.parallel_workers = r["parallel_workers"].as<int>();
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["search"]["tile_size"] = search.tile_size;
    node["search"]["max_visits"] = search.max_visits;
    node["search"]["flood_fraction"] = search.flood_fraction;
    node["search"]["permanent_water_max_fraction"] = search.permanent_water_max_fraction;
    node["search"]["background_min_fraction"] = search.background_min_fraction;
    node["search"]["expand_radius"] = search.expand_radius;
    node["search"]["progress_every"] = search.progress_every;
    node["search"]["min_flooded_tiles"] = search.min_flooded_tiles;

    node["seeding"]["min_river_size"] = seeding.min_river_size;
    node["seeding"]["max_seed_tiles"] = seeding.max_seed_tiles;
    node["seeding"]["seed_radius"] = seeding.seed_radius;
    node["seeding"]["prescribed_overlap_fraction"] = seeding.prescribed_overlap_fraction;
    node["seeding"]["river_size_property"] = seeding.river_size_property;

    node["edge_heuristic"]["zero_value"] = edge_heuristic.zero_value;
    node["edge_heuristic"]["max_zero_fraction"] = edge_heuristic.max_zero_fraction;

    node["postprocess"]["enabled"] = postprocess.enabled;
    node["postprocess"]["majority_radius"] = postprocess.majority_radius;
    node["postprocess"]["min_region_area"] = postprocess.min_region_area;
    node["postprocess"]["region_padding"] = postprocess.region_padding;

    node["classifier"]["type"] = classifier.type;
    node["classifier"]["model_path"] = classifier.model_path;
    node["classifier"]["model_inputs"] = classifier.model_inputs;
    node["classifier"]["requires_elevation"] = classifier.requires_elevation;
    node["classifier"]["secondary_model_path"] = classifier.secondary_model_path;
    node["classifier"]["secondary_inputs"] = classifier.secondary_inputs;
    node["classifier"]["secondary_requires_elevation"] = classifier.secondary_requires_elevation;
    node["classifier"]["elevation_path"] = classifier.elevation_path;
    node["classifier"]["num_classes"] = classifier.num_classes;

    node["output"]["export_inputs"] = output.export_inputs;
    node["output"]["keep_raw"] = output.keep_raw;

    node["runtime_limits"]["parallel_workers"] = runtime_limits.parallel_workers;

    return node;
}

void Config::validate() const {
    if (search.tile_size <= 0 || (search.tile_size % 2) != 0) {
        throw ValidationError("search.tile_size must be a positive even number");
    }
    if (search.max_visits < 1) {
        throw ValidationError("search.max_visits must be >= 1");
    }
    if (!in_unit_interval(search.flood_fraction)) {
        throw ValidationError("search.flood_fraction must be in [0,1]");
    }
    if (!in_unit_interval(search.permanent_water_max_fraction)) {
        throw ValidationError("search.permanent_water_max_fraction must be in [0,1]");
    }
    if (!in_unit_interval(search.background_min_fraction)) {
        throw ValidationError("search.background_min_fraction must be in [0,1]");
    }
    if (search.expand_radius < 0) {
        throw ValidationError("search.expand_radius must be >= 0");
    }
    if (search.progress_every < 0) {
        throw ValidationError("search.progress_every must be >= 0");
    }
    if (search.min_flooded_tiles < 0) {
        throw ValidationError("search.min_flooded_tiles must be >= 0");
    }

    if (seeding.min_river_size < 0.0) {
        throw ValidationError("seeding.min_river_size must be >= 0");
    }
    if (seeding.max_seed_tiles < 1) {
        throw ValidationError("seeding.max_seed_tiles must be >= 1");
    }
    if (seeding.seed_radius < 0) {
        throw ValidationError("seeding.seed_radius must be >= 0");
    }
    if (!in_unit_interval(seeding.prescribed_overlap_fraction)) {
        throw ValidationError("seeding.prescribed_overlap_fraction must be in [0,1]");
    }
    if (seeding.river_size_property.empty()) {
        throw ValidationError("seeding.river_size_property must not be empty");
    }

    if (edge_heuristic.zero_value < 0.0f) {
        throw ValidationError("edge_heuristic.zero_value must be >= 0");
    }
    if (!in_unit_interval(edge_heuristic.max_zero_fraction)) {
        throw ValidationError("edge_heuristic.max_zero_fraction must be in [0,1]");
    }

    if (postprocess.majority_radius < 0) {
        throw ValidationError("postprocess.majority_radius must be >= 0");
    }
    if (postprocess.min_region_area < 0.0) {
        throw ValidationError("postprocess.min_region_area must be >= 0");
    }
    if (postprocess.region_padding < 0) {
        throw ValidationError("postprocess.region_padding must be >= 0");
    }

    if (classifier.type != "single" && classifier.type != "averaged") {
        throw ValidationError("classifier.type must be 'single' or 'averaged'");
    }
    if (classifier.model_inputs < 0 || classifier.secondary_inputs < 0) {
        throw ValidationError("classifier.*_inputs must be >= 0");
    }
    if (classifier.num_classes != 3) {
        throw ValidationError("classifier.num_classes must be 3 (background, permanent water, flood)");
    }
    if (classifier.type == "averaged" && classifier.secondary_model_path.empty()) {
        throw ValidationError("classifier.secondary_model_path is required for type 'averaged'");
    }
    const bool needs_dem = classifier.requires_elevation ||
                           (classifier.type == "averaged" && classifier.secondary_requires_elevation);
    if (needs_dem && classifier.elevation_path.empty()) {
        throw ValidationError("classifier.elevation_path is required when a model uses elevation");
    }

    if (runtime_limits.parallel_workers < 1) {
        throw ValidationError("runtime_limits.parallel_workers must be >= 1");
    }
}

} // namespace floodmap::config
