#include "floodmap/classify/patch_reader.hpp"

#include <opencv2/opencv.hpp>

namespace floodmap::classify {

Matrix2Df resample_band(const Matrix2Df& band, int height, int width) {
    if (band.rows() == height && band.cols() == width) {
        return band;
    }
    cv::Mat src(static_cast<int>(band.rows()), static_cast<int>(band.cols()), CV_32F,
                const_cast<float*>(band.data()));
    Matrix2Df out(height, width);
    cv::Mat dst(height, width, CV_32F, out.data());
    cv::resize(src, dst, cv::Size(width, height), 0.0, 0.0, cv::INTER_LINEAR);
    return out;
}

std::vector<BandStack> read_tile_patches(const std::vector<const io::GeoRaster*>& rasters,
                                         const geometry::Polygon& tile, int tile_size) {
    std::vector<BandStack> patches;
    patches.reserve(rasters.size());
    for (const io::GeoRaster* raster : rasters) {
        const io::PixelWindow window = io::window_for_polygon(raster->transform(), tile);
        BandStack bands = raster->read_window(window);
        for (auto& band : bands) {
            band = resample_band(band, tile_size, tile_size);
        }
        patches.push_back(std::move(bands));
    }
    return patches;
}

} // namespace floodmap::classify
