#include "floodmap/grid/tile_grid.hpp"
#include "floodmap/core/errors.hpp"

#include <cmath>

namespace floodmap::grid {

// Absorbs round-off from the inverse transform before snapping to pixels.
static constexpr double kSnapTolerance = 1.0e-6;

static double snap(double v) {
    const double r = std::round(v);
    return std::fabs(v - r) < kSnapTolerance ? r : v;
}

std::string lattice_to_string(LatticeId id) {
    switch (id) {
        case LatticeId::PRIMARY: return "primary";
        case LatticeId::OFFSET_X: return "offset_x";
        case LatticeId::OFFSET_Y: return "offset_y";
        case LatticeId::OFFSET_XY: return "offset_xy";
        default: return "unknown";
    }
}

geometry::Polygon LatticeSet::tile_polygon(LatticeId id, const TileCoord& c) const {
    geometry::Polygon poly;
    poly.outer = geometry::transform_ring(geometry::box_to_ring(lattice(id).pixel_box(c)),
                                          transform);
    return poly;
}

bool LatticeSet::tile_in_bounds(LatticeId id, const TileCoord& c) const {
    const TileLattice& lat = lattice(id);
    if (!lat.contains(c)) return false;
    const geometry::Polygon tile = tile_polygon(id, c);
    return geometry::polygon_contains_ring(aligned_footprint, tile.outer) &&
           geometry::polygon_contains_ring(footprint, tile.outer);
}

LatticeSet build_lattices(const geometry::Polygon& footprint,
                          const geometry::AffineTransform& reference, int tile_size) {
    if (tile_size <= 0 || tile_size % 2 != 0) {
        throw InvalidFootprint("tile size must be a positive even number, got " +
                               std::to_string(tile_size));
    }
    if (footprint.outer.size() < 3) {
        throw InvalidFootprint("footprint polygon has fewer than 3 vertices");
    }
    if (!reference.is_invertible()) {
        throw InvalidFootprint("reference transform is not invertible");
    }

    const auto px = geometry::transform_ring(footprint.outer, reference.inverse());
    const auto box = geometry::bounds(px);

    // Pull the envelope in by one pixel so every tile keeps a pixel of margin
    // against rasters whose footprints differ slightly.
    const int xlo = static_cast<int>(std::ceil(snap(box.min_x))) + 1;
    const int ylo = static_cast<int>(std::ceil(snap(box.min_y))) + 1;
    const int xhi = static_cast<int>(std::floor(snap(box.max_x))) - 1;
    const int yhi = static_cast<int>(std::floor(snap(box.max_y))) - 1;

    const int w_px = xhi - xlo;
    const int h_px = yhi - ylo;
    if (w_px <= 0 || h_px <= 0) {
        throw InvalidFootprint("shrunk envelope is " + std::to_string(w_px) + "x" +
                               std::to_string(h_px) + " px");
    }

    const int s = tile_size;
    const int half = s / 2;
    const int nx = w_px / s;
    const int ny = h_px / s;
    if (nx <= 0 || ny <= 0) {
        throw InvalidFootprint("envelope of " + std::to_string(w_px) + "x" +
                               std::to_string(h_px) + " px holds no " + std::to_string(s) +
                               " px tile");
    }

    LatticeSet set;
    set.tile_size = s;
    set.transform = reference.shifted(xlo, ylo);
    set.width = nx * s;
    set.height = ny * s;
    set.footprint = footprint;

    const geometry::Box envelope{0.0, 0.0, static_cast<double>(w_px), static_cast<double>(h_px)};
    set.aligned_footprint.outer =
        geometry::transform_ring(geometry::box_to_ring(envelope), set.transform);

    set.lattices[0] = {LatticeId::PRIMARY, 0, 0, s, nx, ny};
    set.lattices[1] = {LatticeId::OFFSET_X, half, 0, s, (w_px - s) / s, ny};
    set.lattices[2] = {LatticeId::OFFSET_Y, 0, half, s, nx, (h_px - s) / s};
    set.lattices[3] = {LatticeId::OFFSET_XY, half, half, s, (w_px - s) / s, (h_px - s) / s};

    return set;
}

} // namespace floodmap::grid
