#include "floodmap/search/blending.hpp"
#include "floodmap/core/errors.hpp"

#include <string>

namespace floodmap::search {

namespace {

// Linear hat functions over the control points 0, n/2 - 0.5, n - 1.
std::array<Eigen::VectorXf, 3> hat_profiles(int n) {
    const double p0 = 0.0;
    const double p1 = static_cast<double>(n / 2) - 0.5;
    const double p2 = static_cast<double>(n - 1);

    std::array<Eigen::VectorXf, 3> out;
    for (auto& v : out) v = Eigen::VectorXf::Zero(n);

    for (int i = 0; i < n; ++i) {
        const double t = static_cast<double>(i);
        if (t <= p1) {
            const double u = (t - p0) / (p1 - p0);
            out[0](i) = static_cast<float>(1.0 - u);
            out[1](i) = static_cast<float>(u);
        } else {
            const double u = (t - p1) / (p2 - p1);
            out[1](i) = static_cast<float>(1.0 - u);
            out[2](i) = static_cast<float>(u);
        }
    }
    return out;
}

// Row or column span inside the own tile for part k (0 = first half,
// 1 = whole, 2 = second half) and the mirrored span inside the neighbour.
struct Span {
    int own_start;
    int src_start;
    int length;
};

Span span_for(int k, int n) {
    const int half = n / 2;
    switch (k) {
        case 0: return {0, half, half};
        case 2: return {half, 0, n - half};
        default: return {0, 0, n};
    }
}

} // namespace

std::pair<grid::LatticeId, TileCoord> neighbor_cell(Direction d, const TileCoord& c) {
    switch (d) {
        case Direction::LEFT: return {grid::LatticeId::OFFSET_X, {c.x - 1, c.y}};
        case Direction::RIGHT: return {grid::LatticeId::OFFSET_X, {c.x, c.y}};
        case Direction::UP: return {grid::LatticeId::OFFSET_Y, {c.x, c.y - 1}};
        case Direction::DOWN: return {grid::LatticeId::OFFSET_Y, {c.x, c.y}};
        case Direction::TOP_LEFT: return {grid::LatticeId::OFFSET_XY, {c.x - 1, c.y - 1}};
        case Direction::TOP_RIGHT: return {grid::LatticeId::OFFSET_XY, {c.x, c.y - 1}};
        case Direction::BOTTOM_LEFT: return {grid::LatticeId::OFFSET_XY, {c.x - 1, c.y}};
        case Direction::BOTTOM_RIGHT: return {grid::LatticeId::OFFSET_XY, {c.x, c.y}};
    }
    return {grid::LatticeId::PRIMARY, c};
}

int NeighborLogits::present() const {
    int n = 0;
    for (Direction d : kAllDirections) {
        if ((*this)[d]) ++n;
    }
    return n;
}

BlendWeights compute_blend_weights(int height, int width) {
    if (height < 2 || width < 2 || height % 2 != 0 || width % 2 != 0) {
        throw ValidationError("blend weights need even tile dimensions, got " +
                              std::to_string(height) + "x" + std::to_string(width));
    }

    const auto wy = hat_profiles(height);
    const auto wx = hat_profiles(width);

    BlendWeights out;
    out.height = height;
    out.width = width;
    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
            out.weights[i][j] = wy[i] * wx[j].transpose();
        }
    }
    return out;
}

std::shared_ptr<const BlendWeights> BlendWeightCache::get(int height, int width) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto key = std::make_pair(height, width);
    auto it = cache_.find(key);
    if (it != cache_.end()) {
        return it->second;
    }
    auto weights = std::make_shared<const BlendWeights>(compute_blend_weights(height, width));
    cache_.emplace(key, weights);
    return weights;
}

size_t BlendWeightCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

ClassLogits blend_logits(const ClassLogits& own, const NeighborLogits& neighbors,
                         const BlendWeights& weights) {
    const int h = weights.height;
    const int w = weights.width;

    for (const auto& band : own) {
        if (band.rows() != h || band.cols() != w) {
            throw ClassifierError("logits shaped " + std::to_string(band.rows()) + "x" +
                                  std::to_string(band.cols()) + ", expected " +
                                  std::to_string(h) + "x" + std::to_string(w));
        }
    }

    ClassLogits out;
    out.reserve(own.size());
    for (const auto& band : own) {
        out.emplace_back(band.cwiseProduct(weights.own()));
    }

    for (Direction d : kAllDirections) {
        const LogitsPtr& n = neighbors[d];
        if (!n) continue;

        if (n->size() != own.size()) {
            throw ClassifierError("neighbour logits carry " + std::to_string(n->size()) +
                                  " classes, expected " + std::to_string(own.size()));
        }

        const int idx = static_cast<int>(d);
        const Span rows = span_for(idx / 3, h);
        const Span cols = span_for(idx % 3, w);
        const Matrix2Df& wmask = weights.at(d);

        for (size_t c = 0; c < own.size(); ++c) {
            const Matrix2Df& src = (*n)[c];
            if (src.rows() != h || src.cols() != w) {
                throw ClassifierError("neighbour logits do not match the tile shape");
            }
            out[c].block(rows.own_start, cols.own_start, rows.length, cols.length) +=
                src.block(rows.src_start, cols.src_start, rows.length, cols.length)
                    .cwiseProduct(
                        wmask.block(rows.own_start, cols.own_start, rows.length, cols.length));
        }
    }
    return out;
}

} // namespace floodmap::search
