#include "floodmap/search/search_state.hpp"
#include "floodmap/core/errors.hpp"

#include <algorithm>

namespace floodmap::search {

SearchState::SearchState(int nx, int ny)
    : nx_(nx),
      ny_(ny),
      visited_(static_cast<size_t>(std::max(nx, 0)) * static_cast<size_t>(std::max(ny, 0)), 0),
      enqueued_(visited_.size(), 0) {}

bool SearchState::push(const TileCoord& c) {
    if (!in_bounds(c)) return false;
    const size_t idx = index(c);
    if (visited_[idx] || enqueued_[idx]) return false;
    enqueued_[idx] = 1;
    frontier_.push_back(c);
    return true;
}

TileCoord SearchState::pop() {
    if (frontier_.empty()) {
        throw FloodmapError("pop from an empty frontier");
    }
    const TileCoord c = frontier_.front();
    frontier_.pop_front();
    const size_t idx = index(c);
    enqueued_[idx] = 0;
    visited_[idx] = 1;
    ++counters_.visited;
    return c;
}

bool SearchState::visited(const TileCoord& c) const {
    return in_bounds(c) && visited_[index(c)] != 0;
}

bool SearchState::enqueued(const TileCoord& c) const {
    return in_bounds(c) && enqueued_[index(c)] != 0;
}

void SearchState::record(TileDisposition d) {
    switch (d) {
        case TileDisposition::OUTSIDE: ++counters_.outside; break;
        case TileDisposition::LARGE_WATER_BODY: ++counters_.large_water; break;
        case TileDisposition::FLOODED: ++counters_.flooded; break;
        case TileDisposition::DRY: break;
    }
}

} // namespace floodmap::search
