#pragma once

#include "floodmap/core/types.hpp"
#include "floodmap/geometry/affine.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace floodmap::io {

// Integer pixel window, offsets may be negative for windows hanging off a raster.
struct PixelWindow {
    int col_off = 0;
    int row_off = 0;
    int width = 0;
    int height = 0;

    bool operator==(const PixelWindow& o) const {
        return col_off == o.col_off && row_off == o.row_off && width == o.width &&
               height == o.height;
    }
};

// Window covering a world-space polygon, snapped to the nearest pixel edges.
PixelWindow window_for_polygon(const geometry::AffineTransform& transform,
                               const geometry::Polygon& poly);

// Multi-band georeferenced raster stored as a FITS cube.
//
// NAXIS1 = width, NAXIS2 = height, NAXIS3 = bands. The pixel -> world
// transform lives in AFFINE_A..AFFINE_F and the reference system in CRS.
// 8-bit class rasters carry BLANK as their nodata value.
//
// All operations on one handle are serialized.
class GeoRaster {
public:
    static std::unique_ptr<GeoRaster> open_read(const fs::path& path);
    static std::unique_ptr<GeoRaster> open_update(const fs::path& path);

    // Float cube pre-filled with NaN.
    static std::unique_ptr<GeoRaster> create_float(const fs::path& path, int width, int height,
                                                   int bands,
                                                   const geometry::AffineTransform& transform,
                                                   const std::string& crs);

    // Single-band 8-bit raster pre-filled with `nodata`.
    static std::unique_ptr<GeoRaster> create_class(const fs::path& path, int width, int height,
                                                   const geometry::AffineTransform& transform,
                                                   const std::string& crs,
                                                   uint8_t nodata = kClassNodata);

    ~GeoRaster();

    GeoRaster(const GeoRaster&) = delete;
    GeoRaster& operator=(const GeoRaster&) = delete;

    const fs::path& path() const { return path_; }
    int width() const { return width_; }
    int height() const { return height_; }
    int bands() const { return bands_; }
    bool is_class_raster() const { return is_byte_; }
    uint8_t nodata() const { return nodata_; }
    const geometry::AffineTransform& transform() const { return transform_; }
    const std::string& crs() const { return crs_; }

    // Float read of every band. Pixels outside the raster are NaN.
    BandStack read_window(const PixelWindow& window) const;
    BandStack read_all() const;

    // First band as class ids. Pixels outside the raster are nodata.
    ClassMap read_class_window(const PixelWindow& window) const;
    ClassMap read_class_all() const;

    // The window must lie fully inside the raster.
    void write_window(const PixelWindow& window, const BandStack& data);
    void write_class_window(const PixelWindow& window, const ClassMap& data);

    void flush();

private:
    GeoRaster(void* handle, fs::path path, bool writable);

    void load_header();
    void require_writable() const;
    void require_inside(const PixelWindow& window) const;

    void* fptr_ = nullptr; // fitsfile*
    fs::path path_;
    bool writable_ = false;
    int width_ = 0;
    int height_ = 0;
    int bands_ = 1;
    bool is_byte_ = false;
    uint8_t nodata_ = kClassNodata;
    geometry::AffineTransform transform_;
    std::string crs_;
    mutable std::mutex mutex_;
};

// Pairwise resolution and CRS check, throws RasterMismatchError.
void check_rasters_match(const std::vector<const GeoRaster*>& rasters);

} // namespace floodmap::io
