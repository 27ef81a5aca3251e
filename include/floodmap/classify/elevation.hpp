#pragma once

#include "floodmap/classify/classifier.hpp"

#include <memory>

namespace floodmap::classify {

// Elevation taken from the first band of a georeferenced raster.
class RasterElevationSource : public ElevationSource {
public:
    explicit RasterElevationSource(std::unique_ptr<io::GeoRaster> dem);

    std::optional<Matrix2Df> elevation_for(const geometry::Polygon& tile, int height,
                                           int width) const override;

private:
    std::unique_ptr<io::GeoRaster> dem_;
};

} // namespace floodmap::classify
