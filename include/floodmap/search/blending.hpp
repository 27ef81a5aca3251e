#pragma once

#include "floodmap/core/types.hpp"
#include "floodmap/grid/tile_grid.hpp"

#include <array>
#include <map>
#include <memory>
#include <mutex>
#include <utility>

namespace floodmap::search {

using LogitsPtr = std::shared_ptr<const ClassLogits>;

// Neighbour positions around a primary tile, numbered as cells of a row-major
// 3x3 block. Index 4 is the tile itself.
enum class Direction {
    TOP_LEFT = 0,
    UP = 1,
    TOP_RIGHT = 2,
    LEFT = 3,
    RIGHT = 5,
    BOTTOM_LEFT = 6,
    DOWN = 7,
    BOTTOM_RIGHT = 8
};

constexpr std::array<Direction, 8> kAllDirections = {
    Direction::TOP_LEFT, Direction::UP,          Direction::TOP_RIGHT, Direction::LEFT,
    Direction::RIGHT,    Direction::BOTTOM_LEFT, Direction::DOWN,      Direction::BOTTOM_RIGHT};

// Offset-lattice cell that covers the half or quarter of primary tile `c`
// nearest direction `d`.
std::pair<grid::LatticeId, TileCoord> neighbor_cell(Direction d, const TileCoord& c);

// Up to eight neighbour logit stacks; null means absent.
struct NeighborLogits {
    std::array<LogitsPtr, 9> cells;

    LogitsPtr& operator[](Direction d) { return cells[static_cast<size_t>(d)]; }
    const LogitsPtr& operator[](Direction d) const { return cells[static_cast<size_t>(d)]; }

    int present() const;
};

// Weight masks for one tile shape. weights[i][j] is the bilinear
// interpolation of a 3x3 control grid that is 1 at control point (i, j) and 0
// elsewhere, with control rows at 0, h/2 - 0.5, h - 1 (columns alike).
// weights[1][1] is the tile's own weight; the others belong to neighbours.
// The nine masks sum to 1 at every pixel.
struct BlendWeights {
    int height = 0;
    int width = 0;
    std::array<std::array<Matrix2Df, 3>, 3> weights;

    const Matrix2Df& own() const { return weights[1][1]; }
    const Matrix2Df& at(Direction d) const {
        const int idx = static_cast<int>(d);
        return weights[idx / 3][idx % 3];
    }
};

BlendWeights compute_blend_weights(int height, int width);

// Computes weight masks once per tile shape and hands out shared copies.
class BlendWeightCache {
public:
    std::shared_ptr<const BlendWeights> get(int height, int width);

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::pair<int, int>, std::shared_ptr<const BlendWeights>> cache_;
};

// own * W_own + sum over present neighbours of (mirrored neighbour slice * W_dir).
// Absent neighbours contribute nothing; their share of the weight is dropped,
// not handed to the own tile. Tile dimensions must be even.
ClassLogits blend_logits(const ClassLogits& own, const NeighborLogits& neighbors,
                         const BlendWeights& weights);

} // namespace floodmap::search
