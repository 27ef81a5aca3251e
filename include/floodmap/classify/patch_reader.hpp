#pragma once

#include "floodmap/core/types.hpp"
#include "floodmap/geometry/geometry.hpp"
#include "floodmap/io/raster.hpp"

#include <vector>

namespace floodmap::classify {

// Reads the tile window from every raster through that raster's own transform
// and returns [tile_size, tile_size] bands. Pixels outside a raster are NaN.
std::vector<BandStack> read_tile_patches(const std::vector<const io::GeoRaster*>& rasters,
                                         const geometry::Polygon& tile, int tile_size);

// Bilinear resample of one band to [height, width].
Matrix2Df resample_band(const Matrix2Df& band, int height, int width);

} // namespace floodmap::classify
