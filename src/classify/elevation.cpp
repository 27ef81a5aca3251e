#include "floodmap/classify/elevation.hpp"
#include "floodmap/classify/patch_reader.hpp"
#include "floodmap/core/errors.hpp"

namespace floodmap::classify {

RasterElevationSource::RasterElevationSource(std::unique_ptr<io::GeoRaster> dem)
    : dem_(std::move(dem)) {
    if (!dem_) {
        throw ClassifierError("elevation source without a raster");
    }
}

std::optional<Matrix2Df> RasterElevationSource::elevation_for(const geometry::Polygon& tile,
                                                              int height, int width) const {
    const io::PixelWindow window = io::window_for_polygon(dem_->transform(), tile);
    if (window.width <= 0 || window.height <= 0) {
        return std::nullopt;
    }

    BandStack bands = dem_->read_window(window);
    if (bands.empty() || bands[0].hasNaN()) {
        // Partial or no coverage
        return std::nullopt;
    }
    return resample_band(bands[0], height, width);
}

} // namespace floodmap::classify
