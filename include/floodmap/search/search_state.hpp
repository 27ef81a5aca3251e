#pragma once

#include "floodmap/core/types.hpp"

#include <deque>
#include <vector>

namespace floodmap::search {

struct SearchCounters {
    int visited = 0;
    int flooded = 0;
    int large_water = 0;
    int outside = 0;
};

// FIFO frontier over one lattice with O(1) membership masks.
//
// A coordinate enters the frontier only when it is inside the lattice, not
// visited and not already queued, so no coordinate is ever visited twice.
class SearchState {
public:
    SearchState(int nx, int ny);

    int nx() const { return nx_; }
    int ny() const { return ny_; }

    bool push(const TileCoord& c);

    bool empty() const { return frontier_.empty(); }
    size_t open() const { return frontier_.size(); }

    // Removes the front tile and marks it visited.
    TileCoord pop();

    bool visited(const TileCoord& c) const;
    bool enqueued(const TileCoord& c) const;

    void record(TileDisposition d);

    const SearchCounters& counters() const { return counters_; }

private:
    bool in_bounds(const TileCoord& c) const {
        return c.x >= 0 && c.y >= 0 && c.x < nx_ && c.y < ny_;
    }
    size_t index(const TileCoord& c) const {
        return static_cast<size_t>(c.x) * static_cast<size_t>(ny_) + static_cast<size_t>(c.y);
    }

    int nx_;
    int ny_;
    std::deque<TileCoord> frontier_;
    std::vector<uint8_t> visited_;
    std::vector<uint8_t> enqueued_;
    SearchCounters counters_;
};

} // namespace floodmap::search
