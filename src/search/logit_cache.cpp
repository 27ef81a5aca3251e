#include "floodmap/search/logit_cache.hpp"

namespace floodmap::search {

LogitsPtr OffsetLogitCache::get_or_compute(grid::LatticeId lattice, const TileCoord& coord,
                                           const ComputeFn& compute) {
    const Key key{static_cast<int>(lattice), coord.x, coord.y};

    std::promise<LogitsPtr> promise;
    std::shared_future<LogitsPtr> pending;
    bool owner = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            pending = it->second;
        } else {
            pending = promise.get_future().share();
            entries_.emplace(key, pending);
            owner = true;
        }
    }

    if (!owner) {
        return pending.get();
    }

    ++computations_;
    try {
        LogitsPtr result = compute(lattice, coord);
        promise.set_value(result);
        return result;
    } catch (...) {
        promise.set_exception(std::current_exception());
        throw;
    }
}

bool OffsetLogitCache::contains(grid::LatticeId lattice, const TileCoord& coord) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(Key{static_cast<int>(lattice), coord.x, coord.y}) > 0;
}

size_t OffsetLogitCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace floodmap::search
