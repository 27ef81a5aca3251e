#pragma once

#include "floodmap/core/types.hpp"
#include "floodmap/geometry/geometry.hpp"
#include "floodmap/search/visit_record.hpp"

#include <string>
#include <vector>

namespace floodmap::io {

struct RiverSegment {
    geometry::LineString line;
    double size = 0.0;
};

// Validity footprint. MultiPolygons collapse to their largest part.
geometry::Polygon read_footprint(const fs::path& path);

// River network, one segment per LineString part. Features without a numeric
// `size_property` get size 0.
std::vector<RiverSegment> read_rivers(const fs::path& path, const std::string& size_property);

// Tile footprints of a previous run. Features marked `outside` are skipped.
std::vector<geometry::Polygon> read_prescribed_tiles(const fs::path& path);

void write_visit_layer(const fs::path& path, const std::vector<search::VisitRecord>& visits,
                       const std::string& crs);

} // namespace floodmap::io
