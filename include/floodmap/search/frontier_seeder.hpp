#pragma once

#include "floodmap/config/configuration.hpp"
#include "floodmap/core/types.hpp"
#include "floodmap/grid/tile_grid.hpp"
#include "floodmap/io/geojson.hpp"

#include <string>
#include <vector>

namespace floodmap::search {

enum class SeedRule {
    MAJOR_RIVERS,   // rivers above the size threshold
    ANY_RIVERS,     // rivers of any size
    LATTICE_CENTER, // no river touches the footprint
    PRESCRIBED      // tiles handed in by the caller
};

std::string seed_rule_to_string(SeedRule rule);

struct SeedResult {
    SeedRule rule = SeedRule::LATTICE_CENTER;
    std::vector<TileCoord> base_tiles; // before neighbourhood expansion
    std::vector<TileCoord> tiles;      // initial frontier, deduplicated
};

// Cells within ±radius of `c` (inclusive) clipped to [0, nx) x [0, ny),
// x-major order.
std::vector<TileCoord> window_around(const TileCoord& c, int radius, int nx, int ny);

// Primary-lattice cells touched by rivers of size > min_size that intersect
// the validity footprint, x-major, at most max_tiles. A negative min_size
// disables the size filter.
std::vector<TileCoord> tiles_along_rivers(const std::vector<io::RiverSegment>& rivers,
                                          const grid::LatticeSet& lattices, double min_size,
                                          int max_tiles);

SeedResult seed_frontier(const std::vector<io::RiverSegment>& rivers,
                         const grid::LatticeSet& lattices, const config::SeedingConfig& cfg);

// Primary-lattice cells where the summed overlap of every prescribed tile
// exceeds overlap_fraction of the cell area, x-major.
std::vector<TileCoord> prescribed_tile_coords(const std::vector<geometry::Polygon>& tiles,
                                              const grid::LatticeSet& lattices,
                                              double overlap_fraction);

} // namespace floodmap::search
