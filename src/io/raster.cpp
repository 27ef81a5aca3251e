#include "floodmap/io/raster.hpp"
#include "floodmap/core/errors.hpp"

#include <fitsio.h>
#include <algorithm>
#include <cmath>
#include <limits>

namespace floodmap::io {

namespace {

constexpr const char* kAffineKeys[6] = {"AFFINE_A", "AFFINE_B", "AFFINE_C",
                                        "AFFINE_D", "AFFINE_E", "AFFINE_F"};

// Rows written per call when pre-filling a new raster.
constexpr int kFillRowChunk = 256;

std::string fits_status_text(int status) {
    char text[FLEN_STATUS];
    fits_get_errstatus(status, text);
    return std::string(text);
}

fitsfile* as_fits(void* handle) {
    return static_cast<fitsfile*>(handle);
}

void throw_on_status(int status, const std::string& what, const fs::path& path) {
    if (status) {
        throw FitsError(what + ": " + path.string() + " (" + fits_status_text(status) + ")");
    }
}

void write_georef(fitsfile* fptr, const geometry::AffineTransform& t, const std::string& crs,
                  const fs::path& path) {
    int status = 0;
    const double coeffs[6] = {t.a, t.b, t.c, t.d, t.e, t.f};
    for (int i = 0; i < 6; ++i) {
        double val = coeffs[i];
        fits_update_key(fptr, TDOUBLE, kAffineKeys[i], &val, nullptr, &status);
    }
    if (!crs.empty()) {
        fits_update_key_longstr(fptr, "CRS", crs.c_str(), "coordinate reference system",
                                &status);
    }
    throw_on_status(status, "Cannot write georeferencing keywords", path);
}

// Intersection of a window with [0, width) x [0, height).
bool clip_window(const PixelWindow& w, int width, int height, PixelWindow& out) {
    const int c0 = std::max(0, w.col_off);
    const int r0 = std::max(0, w.row_off);
    const int c1 = std::min(width, w.col_off + w.width);
    const int r1 = std::min(height, w.row_off + w.height);
    if (c1 <= c0 || r1 <= r0) return false;
    out = {c0, r0, c1 - c0, r1 - r0};
    return true;
}

} // namespace

PixelWindow window_for_polygon(const geometry::AffineTransform& transform,
                               const geometry::Polygon& poly) {
    const auto px = geometry::transform_ring(poly.outer, transform.inverse());
    const auto box = geometry::bounds(px);
    PixelWindow w;
    w.col_off = static_cast<int>(std::lround(box.min_x));
    w.row_off = static_cast<int>(std::lround(box.min_y));
    w.width = static_cast<int>(std::lround(box.max_x)) - w.col_off;
    w.height = static_cast<int>(std::lround(box.max_y)) - w.row_off;
    return w;
}

GeoRaster::GeoRaster(void* handle, fs::path path, bool writable)
    : fptr_(handle), path_(std::move(path)), writable_(writable) {}

GeoRaster::~GeoRaster() {
    if (fptr_) {
        int status = 0;
        fits_close_file(as_fits(fptr_), &status);
    }
}

std::unique_ptr<GeoRaster> GeoRaster::open_read(const fs::path& path) {
    fitsfile* fptr = nullptr;
    int status = 0;
    if (fits_open_file(&fptr, path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string() + " (" +
                        fits_status_text(status) + ")");
    }
    std::unique_ptr<GeoRaster> raster(new GeoRaster(fptr, path, false));
    raster->load_header();
    return raster;
}

std::unique_ptr<GeoRaster> GeoRaster::open_update(const fs::path& path) {
    fitsfile* fptr = nullptr;
    int status = 0;
    if (fits_open_file(&fptr, path.string().c_str(), READWRITE, &status)) {
        throw FitsError("Cannot open FITS file for update: " + path.string() + " (" +
                        fits_status_text(status) + ")");
    }
    std::unique_ptr<GeoRaster> raster(new GeoRaster(fptr, path, true));
    raster->load_header();
    return raster;
}

std::unique_ptr<GeoRaster> GeoRaster::create_float(const fs::path& path, int width, int height,
                                                   int bands,
                                                   const geometry::AffineTransform& transform,
                                                   const std::string& crs) {
    if (width <= 0 || height <= 0 || bands <= 0) {
        throw FitsError("Invalid raster dimensions for " + path.string());
    }

    fitsfile* fptr = nullptr;
    int status = 0;
    const std::string filepath = "!" + path.string();
    if (fits_create_file(&fptr, filepath.c_str(), &status)) {
        throw FitsError("Cannot create FITS file: " + path.string() + " (" +
                        fits_status_text(status) + ")");
    }
    std::unique_ptr<GeoRaster> raster(new GeoRaster(fptr, path, true));

    long naxes[3] = {width, height, bands};
    fits_create_img(fptr, FLOAT_IMG, bands > 1 ? 3 : 2, naxes, &status);
    throw_on_status(status, "Cannot create FITS image", path);
    write_georef(fptr, transform, crs, path);

    raster->width_ = width;
    raster->height_ = height;
    raster->bands_ = bands;
    raster->is_byte_ = false;
    raster->transform_ = transform;
    raster->crs_ = crs;

    std::vector<float> fill(static_cast<size_t>(width) * kFillRowChunk,
                            std::numeric_limits<float>::quiet_NaN());
    for (int b = 0; b < bands; ++b) {
        for (int r = 0; r < height; r += kFillRowChunk) {
            const int rows = std::min(kFillRowChunk, height - r);
            long fpixel[3] = {1, r + 1, b + 1};
            long lpixel[3] = {width, r + rows, b + 1};
            fits_write_subset(fptr, TFLOAT, fpixel, lpixel, fill.data(), &status);
            throw_on_status(status, "Cannot initialize FITS pixel data", path);
        }
    }
    return raster;
}

std::unique_ptr<GeoRaster> GeoRaster::create_class(const fs::path& path, int width, int height,
                                                   const geometry::AffineTransform& transform,
                                                   const std::string& crs, uint8_t nodata) {
    if (width <= 0 || height <= 0) {
        throw FitsError("Invalid raster dimensions for " + path.string());
    }

    fitsfile* fptr = nullptr;
    int status = 0;
    const std::string filepath = "!" + path.string();
    if (fits_create_file(&fptr, filepath.c_str(), &status)) {
        throw FitsError("Cannot create FITS file: " + path.string() + " (" +
                        fits_status_text(status) + ")");
    }
    std::unique_ptr<GeoRaster> raster(new GeoRaster(fptr, path, true));

    long naxes[2] = {width, height};
    fits_create_img(fptr, BYTE_IMG, 2, naxes, &status);
    throw_on_status(status, "Cannot create FITS image", path);

    int blank = nodata;
    fits_update_key(fptr, TINT, "BLANK", &blank, "nodata class", &status);
    throw_on_status(status, "Cannot write BLANK keyword", path);
    write_georef(fptr, transform, crs, path);

    raster->width_ = width;
    raster->height_ = height;
    raster->bands_ = 1;
    raster->is_byte_ = true;
    raster->nodata_ = nodata;
    raster->transform_ = transform;
    raster->crs_ = crs;

    std::vector<unsigned char> fill(static_cast<size_t>(width) * kFillRowChunk, nodata);
    for (int r = 0; r < height; r += kFillRowChunk) {
        const int rows = std::min(kFillRowChunk, height - r);
        long fpixel[2] = {1, r + 1};
        long lpixel[2] = {width, r + rows};
        fits_write_subset(fptr, TBYTE, fpixel, lpixel, fill.data(), &status);
        throw_on_status(status, "Cannot initialize FITS pixel data", path);
    }
    return raster;
}

void GeoRaster::load_header() {
    fitsfile* fptr = as_fits(fptr_);
    int status = 0;
    int naxis = 0;
    int bitpix = 0;
    long naxes[3] = {0, 0, 0};

    fits_get_img_param(fptr, 3, &bitpix, &naxis, naxes, &status);
    throw_on_status(status, "Cannot read FITS image parameters", path_);

    if (naxis < 2) {
        throw FitsError("FITS file has less than 2 dimensions: " + path_.string());
    }

    width_ = static_cast<int>(naxes[0]);
    height_ = static_cast<int>(naxes[1]);
    bands_ = naxis >= 3 ? static_cast<int>(naxes[2]) : 1;
    is_byte_ = bitpix == BYTE_IMG;

    if (is_byte_) {
        int blank = kClassNodata;
        fits_read_key(fptr, TINT, "BLANK", &blank, nullptr, &status);
        if (status == KEY_NO_EXIST) {
            status = 0;
            blank = kClassNodata;
        }
        throw_on_status(status, "Cannot read BLANK keyword", path_);
        nodata_ = static_cast<uint8_t>(blank);
    }

    double coeffs[6] = {1.0, 0.0, 0.0, 0.0, 1.0, 0.0};
    for (int i = 0; i < 6; ++i) {
        double val = coeffs[i];
        fits_read_key(fptr, TDOUBLE, kAffineKeys[i], &val, nullptr, &status);
        if (status == KEY_NO_EXIST) {
            throw FitsError(std::string("Missing ") + kAffineKeys[i] + " keyword: " +
                            path_.string());
        }
        throw_on_status(status, "Cannot read georeferencing keywords", path_);
        coeffs[i] = val;
    }
    transform_ = {coeffs[0], coeffs[1], coeffs[2], coeffs[3], coeffs[4], coeffs[5]};

    char* longstr = nullptr;
    fits_read_key_longstr(fptr, "CRS", &longstr, nullptr, &status);
    if (status == KEY_NO_EXIST) {
        status = 0;
        crs_.clear();
    } else {
        throw_on_status(status, "Cannot read CRS keyword", path_);
        crs_ = longstr ? std::string(longstr) : std::string();
    }
    if (longstr) {
        int free_status = 0;
        fits_free_memory(longstr, &free_status);
    }

    if (!transform_.is_invertible()) {
        throw FitsError("Degenerate affine transform in " + path_.string());
    }
}

void GeoRaster::require_writable() const {
    if (!writable_) {
        throw FitsError("Raster opened read-only: " + path_.string());
    }
}

void GeoRaster::require_inside(const PixelWindow& w) const {
    if (w.col_off < 0 || w.row_off < 0 || w.width <= 0 || w.height <= 0 ||
        w.col_off + w.width > width_ || w.row_off + w.height > height_) {
        throw FitsError("Write window outside raster bounds: " + path_.string());
    }
}

BandStack GeoRaster::read_window(const PixelWindow& window) const {
    BandStack out;
    out.reserve(bands_);
    for (int b = 0; b < bands_; ++b) {
        out.emplace_back(Matrix2Df::Constant(window.height, window.width,
                                             std::numeric_limits<float>::quiet_NaN()));
    }

    PixelWindow clip;
    if (!clip_window(window, width_, height_, clip)) {
        return out;
    }

    std::vector<float> buffer(static_cast<size_t>(clip.width) * clip.height * bands_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        int status = 0;
        int anynul = 0;
        long fpixel[3] = {clip.col_off + 1, clip.row_off + 1, 1};
        long lpixel[3] = {clip.col_off + clip.width, clip.row_off + clip.height, bands_};
        long inc[3] = {1, 1, 1};
        float nulval = std::numeric_limits<float>::quiet_NaN();
        fits_read_subset(as_fits(fptr_), TFLOAT, fpixel, lpixel, inc, &nulval, buffer.data(),
                         &anynul, &status);
        throw_on_status(status, "Cannot read FITS pixel data", path_);
    }

    const int dr = clip.row_off - window.row_off;
    const int dc = clip.col_off - window.col_off;
    const size_t plane = static_cast<size_t>(clip.width) * clip.height;
    for (int b = 0; b < bands_; ++b) {
        for (int y = 0; y < clip.height; ++y) {
            for (int x = 0; x < clip.width; ++x) {
                out[b](dr + y, dc + x) = buffer[b * plane + static_cast<size_t>(y) * clip.width + x];
            }
        }
    }
    return out;
}

BandStack GeoRaster::read_all() const {
    return read_window({0, 0, width_, height_});
}

ClassMap GeoRaster::read_class_window(const PixelWindow& window) const {
    ClassMap out = ClassMap::Constant(window.height, window.width, nodata_);

    PixelWindow clip;
    if (!clip_window(window, width_, height_, clip)) {
        return out;
    }

    std::vector<unsigned char> buffer(static_cast<size_t>(clip.width) * clip.height);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        int status = 0;
        int anynul = 0;
        long fpixel[3] = {clip.col_off + 1, clip.row_off + 1, 1};
        long lpixel[3] = {clip.col_off + clip.width, clip.row_off + clip.height, 1};
        long inc[3] = {1, 1, 1};
        unsigned char nulval = nodata_;
        fits_read_subset(as_fits(fptr_), TBYTE, fpixel, lpixel, inc, &nulval, buffer.data(),
                         &anynul, &status);
        throw_on_status(status, "Cannot read FITS pixel data", path_);
    }

    const int dr = clip.row_off - window.row_off;
    const int dc = clip.col_off - window.col_off;
    for (int y = 0; y < clip.height; ++y) {
        for (int x = 0; x < clip.width; ++x) {
            out(dr + y, dc + x) = buffer[static_cast<size_t>(y) * clip.width + x];
        }
    }
    return out;
}

ClassMap GeoRaster::read_class_all() const {
    return read_class_window({0, 0, width_, height_});
}

void GeoRaster::write_window(const PixelWindow& window, const BandStack& data) {
    require_writable();
    require_inside(window);
    if (static_cast<int>(data.size()) != bands_) {
        throw FitsError("Band count mismatch writing " + path_.string());
    }

    const size_t plane = static_cast<size_t>(window.width) * window.height;
    std::vector<float> buffer(plane * bands_);
    for (int b = 0; b < bands_; ++b) {
        if (data[b].rows() != window.height || data[b].cols() != window.width) {
            throw FitsError("Window shape mismatch writing " + path_.string());
        }
        std::copy(data[b].data(), data[b].data() + plane, buffer.begin() + b * plane);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    int status = 0;
    long fpixel[3] = {window.col_off + 1, window.row_off + 1, 1};
    long lpixel[3] = {window.col_off + window.width, window.row_off + window.height, bands_};
    fits_write_subset(as_fits(fptr_), TFLOAT, fpixel, lpixel, buffer.data(), &status);
    throw_on_status(status, "Cannot write FITS pixel data", path_);
}

void GeoRaster::write_class_window(const PixelWindow& window, const ClassMap& data) {
    require_writable();
    require_inside(window);
    if (data.rows() != window.height || data.cols() != window.width) {
        throw FitsError("Window shape mismatch writing " + path_.string());
    }

    std::vector<unsigned char> buffer(data.data(), data.data() + data.size());

    std::lock_guard<std::mutex> lock(mutex_);
    int status = 0;
    long fpixel[3] = {window.col_off + 1, window.row_off + 1, 1};
    long lpixel[3] = {window.col_off + window.width, window.row_off + window.height, 1};
    fits_write_subset(as_fits(fptr_), TBYTE, fpixel, lpixel, buffer.data(), &status);
    throw_on_status(status, "Cannot write FITS pixel data", path_);
}

void GeoRaster::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    int status = 0;
    fits_flush_file(as_fits(fptr_), &status);
    throw_on_status(status, "Cannot flush FITS file", path_);
}

void check_rasters_match(const std::vector<const GeoRaster*>& rasters) {
    auto close = [](double a, double b) {
        return std::fabs(a - b) <= 1.0e-9 * std::max({std::fabs(a), std::fabs(b), 1.0});
    };

    for (size_t i = 0; i < rasters.size(); ++i) {
        for (size_t j = i + 1; j < rasters.size(); ++j) {
            const GeoRaster& a = *rasters[i];
            const GeoRaster& b = *rasters[j];
            if (!close(a.transform().pixel_width(), b.transform().pixel_width()) ||
                !close(a.transform().pixel_height(), b.transform().pixel_height())) {
                throw RasterMismatchError("resolution of " + a.path().string() +
                                          " differs from " + b.path().string());
            }
            if (a.crs() != b.crs()) {
                throw RasterMismatchError("CRS of " + a.path().string() + " ('" + a.crs() +
                                          "') differs from " + b.path().string() + " ('" +
                                          b.crs() + "')");
            }
        }
    }
}

} // namespace floodmap::io
