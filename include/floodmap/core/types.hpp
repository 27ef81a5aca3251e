#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace floodmap {

namespace fs = std::filesystem;

// Matrix types
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using ClassMap = Eigen::Matrix<uint8_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// One raster's bands for one tile, each band shaped [H, W].
using BandStack = std::vector<Matrix2Df>;

// Per-class logits for one tile, shaped [classes][H, W].
using ClassLogits = std::vector<Matrix2Df>;

// Class ids written to the output raster
enum class WaterClass : uint8_t {
    BACKGROUND = 0,
    PERMANENT_WATER = 1,
    FLOOD = 2
};

constexpr int kNumWaterClasses = 3;
constexpr uint8_t kClassNodata = 255;

// Integer cell index in a tile lattice
struct TileCoord {
    int x = 0;
    int y = 0;

    bool operator==(const TileCoord& o) const { return x == o.x && y == o.y; }
    bool operator!=(const TileCoord& o) const { return !(*this == o); }
    bool operator<(const TileCoord& o) const {
        return x < o.x || (x == o.x && y < o.y);
    }
};

// Per-tile class pixel counts
struct ClassCounts {
    int64_t background = 0;
    int64_t permanent_water = 0;
    int64_t flood = 0;

    int64_t total() const { return background + permanent_water + flood; }
};

// Outcome of one tile visit
enum class TileDisposition {
    OUTSIDE,            // out of bounds, no classification, or edge heuristic
    LARGE_WATER_BODY,
    FLOODED,
    DRY
};

inline std::string disposition_to_string(TileDisposition d) {
    switch (d) {
        case TileDisposition::OUTSIDE: return "outside";
        case TileDisposition::LARGE_WATER_BODY: return "large_water_body";
        case TileDisposition::FLOODED: return "flooded";
        case TileDisposition::DRY: return "dry";
        default: return "unknown";
    }
}

inline TileDisposition string_to_disposition(const std::string& s) {
    if (s == "large_water_body") return TileDisposition::LARGE_WATER_BODY;
    if (s == "flooded") return TileDisposition::FLOODED;
    if (s == "dry") return TileDisposition::DRY;
    return TileDisposition::OUTSIDE;
}

// Runner phase enumeration
enum class Phase {
    VALIDATE_INPUTS = 0,
    TILE_GRID = 1,
    SEED_FRONTIER = 2,
    FLOOD_SEARCH = 3,
    POSTPROCESS = 4,
    DONE = 5
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::VALIDATE_INPUTS: return "VALIDATE_INPUTS";
        case Phase::TILE_GRID: return "TILE_GRID";
        case Phase::SEED_FRONTIER: return "SEED_FRONTIER";
        case Phase::FLOOD_SEARCH: return "FLOOD_SEARCH";
        case Phase::POSTPROCESS: return "POSTPROCESS";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace floodmap
