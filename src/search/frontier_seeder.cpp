#include "floodmap/search/frontier_seeder.hpp"

#include <algorithm>
#include <cmath>

namespace floodmap::search {

std::string seed_rule_to_string(SeedRule rule) {
    switch (rule) {
        case SeedRule::MAJOR_RIVERS: return "major_rivers";
        case SeedRule::ANY_RIVERS: return "any_rivers";
        case SeedRule::LATTICE_CENTER: return "lattice_center";
        case SeedRule::PRESCRIBED: return "prescribed";
        default: return "unknown";
    }
}

std::vector<TileCoord> window_around(const TileCoord& c, int radius, int nx, int ny) {
    std::vector<TileCoord> out;
    const int x0 = std::max(0, c.x - radius);
    const int x1 = std::min(nx - 1, c.x + radius);
    const int y0 = std::max(0, c.y - radius);
    const int y1 = std::min(ny - 1, c.y + radius);
    if (x1 < x0 || y1 < y0) return out;

    out.reserve(static_cast<size_t>((x1 - x0 + 1) * (y1 - y0 + 1)));
    for (int x = x0; x <= x1; ++x) {
        for (int y = y0; y <= y1; ++y) {
            out.push_back({x, y});
        }
    }
    return out;
}

std::vector<TileCoord> tiles_along_rivers(const std::vector<io::RiverSegment>& rivers,
                                          const grid::LatticeSet& lattices, double min_size,
                                          int max_tiles) {
    const grid::TileLattice& lat = lattices.primary();
    const int nx = lat.nx;
    const int ny = lat.ny;
    const double s = static_cast<double>(lat.tile_size);
    const geometry::AffineTransform to_px = lattices.transform.inverse();

    // Indexed x * ny + y.
    std::vector<uint8_t> hit(static_cast<size_t>(nx) * ny, 0);

    for (const auto& river : rivers) {
        if (min_size >= 0.0 && !(river.size > min_size)) continue;
        if (!geometry::line_intersects_polygon(river.line, lattices.footprint)) continue;

        const auto line = geometry::transform_line(river.line, to_px);
        if (line.size() == 1) {
            const int cx = static_cast<int>(std::floor(line[0].x / s));
            const int cy = static_cast<int>(std::floor(line[0].y / s));
            if (lat.contains({cx, cy})) hit[static_cast<size_t>(cx) * ny + cy] = 1;
            continue;
        }

        for (size_t i = 0; i + 1 < line.size(); ++i) {
            const geometry::Point& a = line[i];
            const geometry::Point& b = line[i + 1];
            // Touching a cell edge counts, so widen the candidate range by one.
            const int cx0 = std::max(0, static_cast<int>(std::floor(std::min(a.x, b.x) / s)) - 1);
            const int cx1 = std::min(nx - 1, static_cast<int>(std::floor(std::max(a.x, b.x) / s)));
            const int cy0 = std::max(0, static_cast<int>(std::floor(std::min(a.y, b.y) / s)) - 1);
            const int cy1 = std::min(ny - 1, static_cast<int>(std::floor(std::max(a.y, b.y) / s)));
            for (int cx = cx0; cx <= cx1; ++cx) {
                for (int cy = cy0; cy <= cy1; ++cy) {
                    const size_t idx = static_cast<size_t>(cx) * ny + cy;
                    if (hit[idx]) continue;
                    if (geometry::segment_intersects_box(a, b, lat.pixel_box({cx, cy}))) {
                        hit[idx] = 1;
                    }
                }
            }
        }
    }

    std::vector<TileCoord> out;
    for (int x = 0; x < nx; ++x) {
        for (int y = 0; y < ny; ++y) {
            if (static_cast<int>(out.size()) >= max_tiles) return out;
            if (hit[static_cast<size_t>(x) * ny + y]) out.push_back({x, y});
        }
    }
    return out;
}

SeedResult seed_frontier(const std::vector<io::RiverSegment>& rivers,
                         const grid::LatticeSet& lattices, const config::SeedingConfig& cfg) {
    const grid::TileLattice& lat = lattices.primary();
    SeedResult result;

    result.base_tiles = tiles_along_rivers(rivers, lattices, cfg.min_river_size, cfg.max_seed_tiles);
    result.rule = SeedRule::MAJOR_RIVERS;

    if (result.base_tiles.empty()) {
        result.base_tiles = tiles_along_rivers(rivers, lattices, 0.0, cfg.max_seed_tiles);
        result.rule = SeedRule::ANY_RIVERS;
    }

    if (result.base_tiles.empty()) {
        result.base_tiles = {TileCoord{lat.nx / 2, lat.ny / 2}};
        result.rule = SeedRule::LATTICE_CENTER;
    }

    std::vector<uint8_t> queued(static_cast<size_t>(lat.nx) * lat.ny, 0);
    auto push = [&](const TileCoord& c) {
        const size_t idx = static_cast<size_t>(c.x) * lat.ny + c.y;
        if (!queued[idx]) {
            queued[idx] = 1;
            result.tiles.push_back(c);
        }
    };

    for (const auto& c : result.base_tiles) push(c);
    for (const auto& c : result.base_tiles) {
        for (const auto& n : window_around(c, cfg.seed_radius, lat.nx, lat.ny)) push(n);
    }
    return result;
}

std::vector<TileCoord> prescribed_tile_coords(const std::vector<geometry::Polygon>& tiles,
                                              const grid::LatticeSet& lattices,
                                              double overlap_fraction) {
    const grid::TileLattice& lat = lattices.primary();
    const geometry::AffineTransform to_px = lattices.transform.inverse();
    const double s = static_cast<double>(lat.tile_size);
    const double cell_area = s * s;

    std::vector<double> overlap(static_cast<size_t>(lat.nx) * lat.ny, 0.0);

    // Prescribed tiles come from an earlier search, so they do not overlap each
    // other and summing per-tile overlaps equals the overlap with their union.
    for (const auto& tile : tiles) {
        const geometry::Polygon px = geometry::transform_polygon(tile, to_px);
        const geometry::Box b = geometry::bounds(px);
        const int cx0 = std::max(0, static_cast<int>(std::floor(b.min_x / s)));
        const int cx1 = std::min(lat.nx - 1, static_cast<int>(std::floor(b.max_x / s)));
        const int cy0 = std::max(0, static_cast<int>(std::floor(b.min_y / s)));
        const int cy1 = std::min(lat.ny - 1, static_cast<int>(std::floor(b.max_y / s)));
        for (int cx = cx0; cx <= cx1; ++cx) {
            for (int cy = cy0; cy <= cy1; ++cy) {
                overlap[static_cast<size_t>(cx) * lat.ny + cy] +=
                    geometry::intersection_area(px, lat.pixel_box({cx, cy}));
            }
        }
    }

    std::vector<TileCoord> out;
    for (int x = 0; x < lat.nx; ++x) {
        for (int y = 0; y < lat.ny; ++y) {
            if (overlap[static_cast<size_t>(x) * lat.ny + y] > overlap_fraction * cell_area) {
                out.push_back({x, y});
            }
        }
    }
    return out;
}

} // namespace floodmap::search
