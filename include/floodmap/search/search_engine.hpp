#pragma once

#include "floodmap/classify/classifier.hpp"
#include "floodmap/config/configuration.hpp"
#include "floodmap/grid/tile_grid.hpp"
#include "floodmap/io/raster.hpp"
#include "floodmap/search/blending.hpp"
#include "floodmap/search/logit_cache.hpp"
#include "floodmap/search/search_state.hpp"
#include "floodmap/search/visit_record.hpp"

#include <functional>
#include <memory>
#include <ostream>
#include <vector>

namespace floodmap::search {

struct SearchResult {
    std::vector<VisitRecord> visits;  // in visit order
    SearchCounters counters;
    size_t open_at_exit = 0;
    bool hit_visit_cap = false;
    bool major_flooding = false;
    size_t offset_classifications = 0;
    std::vector<fs::path> export_paths;
};

using SearchProgressFn = std::function<void(const SearchCounters&, size_t open)>;

// Breadth-first flood fill over the primary lattice.
//
// Each popped tile is classified, blended with the offset-lattice cells that
// overlap it, written to the class raster and, when flooded, used to enqueue
// its ±expand_radius neighbourhood. Offset cells are classified on demand by
// up to runtime_limits.parallel_workers threads and cached for the run.
class FloodSearch {
public:
    FloodSearch(const grid::LatticeSet& lattices, const classify::Classifier& classifier,
                std::vector<const io::GeoRaster*> inputs, const config::Config& cfg);

    // `classes` must share the lattice output grid. A non-empty export_prefix
    // writes the classified input patches to "<export_prefix>-input<i>.fits".
    SearchResult run(const std::vector<TileCoord>& initial, io::GeoRaster& classes,
                     const fs::path& export_prefix = {}, std::ostream* progress_out = nullptr,
                     SearchProgressFn progress_cb = nullptr);

    const OffsetLogitCache& offset_cache() const { return cache_; }

private:
    NeighborLogits fetch_neighbors(const TileCoord& c);
    LogitsPtr classify_offset(grid::LatticeId lattice, const TileCoord& c);

    void export_patches(const io::PixelWindow& window, const std::vector<BandStack>& patches,
                        const fs::path& export_prefix, io::GeoRaster& classes,
                        SearchResult& result);

    const grid::LatticeSet& lattices_;
    const classify::Classifier& classifier_;
    std::vector<const io::GeoRaster*> inputs_;
    config::Config cfg_;

    OffsetLogitCache cache_;
    BlendWeightCache weights_;
    std::vector<std::unique_ptr<io::GeoRaster>> exports_;
};

void print_search_counters(std::ostream& out, const SearchCounters& counters, size_t open);

} // namespace floodmap::search
