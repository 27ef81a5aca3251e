#pragma once

#include "floodmap/core/types.hpp"
#include "floodmap/grid/tile_grid.hpp"
#include "floodmap/search/blending.hpp"

#include <atomic>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <tuple>

namespace floodmap::search {

// Lazily filled logits of offset-lattice cells, keyed by (lattice, coordinate).
//
// Each key is computed at most once. Concurrent requests for a key that is
// still being computed wait for the first caller's result. A null entry is a
// valid result and means the cell has no usable classification.
class OffsetLogitCache {
public:
    using ComputeFn = std::function<LogitsPtr(grid::LatticeId, const TileCoord&)>;

    LogitsPtr get_or_compute(grid::LatticeId lattice, const TileCoord& coord,
                             const ComputeFn& compute);

    bool contains(grid::LatticeId lattice, const TileCoord& coord) const;
    size_t size() const;
    size_t computations() const { return computations_.load(); }

private:
    using Key = std::tuple<int, int, int>;

    mutable std::mutex mutex_;
    std::map<Key, std::shared_future<LogitsPtr>> entries_;
    std::atomic<size_t> computations_{0};
};

} // namespace floodmap::search
