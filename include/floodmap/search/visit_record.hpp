#pragma once

#include "floodmap/core/types.hpp"
#include "floodmap/geometry/geometry.hpp"

namespace floodmap::search {

// One popped tile: where it was, what happened to it, what it contained.
struct VisitRecord {
    TileCoord coord;
    geometry::Polygon footprint;
    TileDisposition disposition = TileDisposition::OUTSIDE;
    ClassCounts counts;
};

} // namespace floodmap::search
