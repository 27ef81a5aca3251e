#pragma once

#include "floodmap/config/configuration.hpp"
#include "floodmap/core/types.hpp"

#include <vector>

namespace floodmap::search {

// False when the tile most likely straddles the edge of valid source data:
// some raster patch holds NaN, or too many of its values are near zero.
bool passes_edge_heuristic(const std::vector<BandStack>& patches,
                           const config::EdgeHeuristicConfig& cfg);

// Per-pixel arg-max over classes; ties resolve to the lower class id.
ClassMap argmax_classes(const ClassLogits& logits);

ClassCounts count_classes(const ClassMap& classes);

// LARGE_WATER_BODY, FLOODED or DRY, in that priority.
TileDisposition classify_disposition(const ClassCounts& counts, const config::SearchConfig& cfg);

} // namespace floodmap::search
