#pragma once

#include "floodmap/core/types.hpp"
#include "floodmap/geometry/geometry.hpp"
#include "floodmap/io/raster.hpp"

#include <optional>
#include <vector>

namespace floodmap::classify {

// Oracle output for one tile.
struct TileClassification {
    // Patches of the rasters the model consumed, one BandStack per raster.
    std::vector<BandStack> inputs;
    std::optional<Matrix2Df> elevation;
    // Absent when the tile cannot be classified (e.g. no elevation coverage).
    std::optional<ClassLogits> logits;

    bool has_logits() const { return logits.has_value(); }
};

// Tile in, logits or nothing out. Implementations must tolerate concurrent
// calls.
class Classifier {
public:
    virtual ~Classifier() = default;

    virtual TileClassification classify(const std::vector<const io::GeoRaster*>& inputs,
                                        const geometry::Polygon& tile) const = 0;
};

// A loaded network. `channels` holds [C][H, W], the result [classes][H, W].
class FloodModel {
public:
    virtual ~FloodModel() = default;

    virtual int num_classes() const = 0;
    virtual ClassLogits predict(const BandStack& channels) = 0;
};

// Auxiliary elevation resampled onto a tile.
class ElevationSource {
public:
    virtual ~ElevationSource() = default;

    // std::nullopt when the source does not cover the tile.
    virtual std::optional<Matrix2Df> elevation_for(const geometry::Polygon& tile, int height,
                                                   int width) const = 0;
};

} // namespace floodmap::classify
