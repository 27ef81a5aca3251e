#pragma once

#include "floodmap/core/types.hpp"
#include "floodmap/geometry/affine.hpp"
#include "floodmap/geometry/geometry.hpp"
#include "floodmap/io/raster.hpp"

#include <array>
#include <string>

namespace floodmap::grid {

enum class LatticeId {
    PRIMARY = 0,
    OFFSET_X = 1,   // shifted half a tile along x
    OFFSET_Y = 2,   // shifted half a tile along y
    OFFSET_XY = 3   // shifted half a tile along both axes
};

constexpr int kNumLattices = 4;

std::string lattice_to_string(LatticeId id);

// Regular lattice of square tiles. Positions are in pixels of the output grid.
struct TileLattice {
    LatticeId id = LatticeId::PRIMARY;
    int origin_col = 0;
    int origin_row = 0;
    int tile_size = 0;
    int nx = 0;
    int ny = 0;

    bool contains(const TileCoord& c) const {
        return c.x >= 0 && c.y >= 0 && c.x < nx && c.y < ny;
    }

    int cell_count() const { return nx * ny; }

    io::PixelWindow pixel_window(const TileCoord& c) const {
        return {origin_col + c.x * tile_size, origin_row + c.y * tile_size, tile_size, tile_size};
    }

    geometry::Box pixel_box(const TileCoord& c) const {
        const auto w = pixel_window(c);
        return {static_cast<double>(w.col_off), static_cast<double>(w.row_off),
                static_cast<double>(w.col_off + w.width),
                static_cast<double>(w.row_off + w.height)};
    }
};

// The primary lattice and its three half-tile offsets, all on one pixel grid.
struct LatticeSet {
    std::array<TileLattice, kNumLattices> lattices;
    int tile_size = 0;

    // Output raster grid: origin at the snapped envelope corner.
    geometry::AffineTransform transform;
    int width = 0;
    int height = 0;

    // Validity polygon as given, and the snapped pixel envelope in world space.
    geometry::Polygon footprint;
    geometry::Polygon aligned_footprint;

    const TileLattice& lattice(LatticeId id) const {
        return lattices[static_cast<size_t>(id)];
    }
    const TileLattice& primary() const { return lattice(LatticeId::PRIMARY); }

    // World-space tile footprint.
    geometry::Polygon tile_polygon(LatticeId id, const TileCoord& c) const;

    // Tile lies inside both the aligned envelope and the validity polygon.
    bool tile_in_bounds(LatticeId id, const TileCoord& c) const;
};

// Throws InvalidFootprint when the shrunk envelope is empty or smaller than a tile.
LatticeSet build_lattices(const geometry::Polygon& footprint,
                          const geometry::AffineTransform& reference, int tile_size);

} // namespace floodmap::grid
