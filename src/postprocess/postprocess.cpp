#include "floodmap/postprocess/postprocess.hpp"
#include "floodmap/core/errors.hpp"
#include "floodmap/io/raster.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <array>
#include <climits>
#include <cmath>
#include <vector>

namespace floodmap::postprocess {

namespace {

struct Offset {
    int dx;
    int dy;
};

std::vector<Offset> disk_offsets(int radius) {
    std::vector<Offset> out;
    for (int dy = -radius; dy <= radius; ++dy) {
        for (int dx = -radius; dx <= radius; ++dx) {
            if (dx * dx + dy * dy <= radius * radius) {
                out.push_back({dx, dy});
            }
        }
    }
    return out;
}

// Most frequent valid value in rows [y0, y1) and cols [x0, x1).
bool window_majority(const ClassMap& classes, const ClassMap& valid, int y0, int x0, int y1,
                     int x1, uint8_t& majority) {
    std::array<int, 256> hist{};
    bool any = false;
    for (int y = y0; y < y1; ++y) {
        for (int x = x0; x < x1; ++x) {
            if (!valid(y, x)) continue;
            ++hist[classes(y, x)];
            any = true;
        }
    }
    if (!any) return false;
    int best = 0;
    for (int v = 1; v < 256; ++v) {
        if (hist[v] > hist[best]) best = v;
    }
    majority = static_cast<uint8_t>(best);
    return true;
}

bool touches_border(const std::vector<cv::Point>& contour, int w, int h) {
    for (const auto& p : contour) {
        if (p.x <= 0 || p.y <= 0 || p.x >= w - 1 || p.y >= h - 1) return true;
    }
    return false;
}

} // namespace

ClassMap majority_filter(const ClassMap& classes, const ClassMap& valid, int radius) {
    const int h = static_cast<int>(classes.rows());
    const int w = static_cast<int>(classes.cols());
    const auto offsets = disk_offsets(std::max(0, radius));

    ClassMap out = classes;
    std::array<int, 256> hist{};
    std::vector<uint8_t> touched;
    touched.reserve(offsets.size());

    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            if (!valid(y, x)) continue;

            touched.clear();
            for (const auto& o : offsets) {
                const int yy = y + o.dy;
                const int xx = x + o.dx;
                if (yy < 0 || xx < 0 || yy >= h || xx >= w || !valid(yy, xx)) continue;
                const uint8_t v = classes(yy, xx);
                if (hist[v]++ == 0) touched.push_back(v);
            }

            int best_count = 0;
            uint8_t best = classes(y, x);
            for (uint8_t v : touched) {
                if (hist[v] > best_count || (hist[v] == best_count && v < best)) {
                    best_count = hist[v];
                    best = v;
                }
            }
            for (uint8_t v : touched) hist[v] = 0;
            out(y, x) = best;
        }
    }
    return out;
}

void remove_small_regions(ClassMap& classes, const ClassMap& valid,
                          const config::PostprocessConfig& cfg, PostprocessStats* stats) {
    const int h = static_cast<int>(classes.rows());
    const int w = static_cast<int>(classes.cols());
    if (h == 0 || w == 0) return;
    const int pad = std::max(0, cfg.region_padding);

    for (uint8_t cls : {static_cast<uint8_t>(WaterClass::PERMANENT_WATER),
                        static_cast<uint8_t>(WaterClass::FLOOD)}) {
        cv::Mat view(h, w, CV_8U, classes.data());
        cv::Mat binary = (view == cls);

        std::vector<std::vector<cv::Point>> contours;
        cv::findContours(binary, contours, cv::RETR_LIST, cv::CHAIN_APPROX_NONE);

        for (size_t ci = 0; ci < contours.size(); ++ci) {
            const auto& contour = contours[ci];
            if (touches_border(contour, w, h)) {
                if (stats) ++stats->open_contours_skipped;
                continue;
            }

            // A lone pixel traces to a single point; two-pixel specks take the fill path.
            if (contour.size() == 1) {
                const int x = contour.front().x;
                const int y = contour.front().y;
                if (!valid(y, x)) continue;
                uint8_t majority = 0;
                if (window_majority(classes, valid, std::max(0, y - 2), std::max(0, x - 2),
                                    std::min(h, y + 3), std::min(w, x + 3), majority)) {
                    classes(y, x) = majority;
                    if (stats) ++stats->single_pixels;
                }
                continue;
            }

            const cv::Rect box = cv::boundingRect(contour);
            const int x0 = std::max(0, box.x - pad);
            const int y0 = std::max(0, box.y - pad);
            const int x1 = std::min(w, box.x + box.width + pad);
            const int y1 = std::min(h, box.y + box.height + pad);

            cv::Mat region = cv::Mat::zeros(y1 - y0, x1 - x0, CV_8U);
            cv::drawContours(region, contours, static_cast<int>(ci), cv::Scalar(255), cv::FILLED,
                             cv::LINE_8, cv::noArray(), INT_MAX, cv::Point(-x0, -y0));

            const int area = cv::countNonZero(region);
            if (static_cast<double>(area) >= cfg.min_region_area) continue;

            uint8_t majority = 0;
            if (!window_majority(classes, valid, y0, x0, y1, x1, majority)) continue;

            for (int y = y0; y < y1; ++y) {
                const uchar* row = region.ptr<uchar>(y - y0);
                for (int x = x0; x < x1; ++x) {
                    if (row[x - x0] && valid(y, x)) classes(y, x) = majority;
                }
            }
            if (stats) ++stats->regions_filled;
        }
    }
}

ClassMap postprocess_classes(const ClassMap& raw, uint8_t nodata,
                             const config::PostprocessConfig& cfg, PostprocessStats* stats) {
    const ClassMap valid = (raw.array() != nodata).cast<uint8_t>();

    ClassMap smoothed = majority_filter(raw, valid, cfg.majority_radius);
    if (stats) {
        stats->pixels_smoothed += (smoothed.array() != raw.array()).count();
    }

    remove_small_regions(smoothed, valid, cfg, stats);

    for (Eigen::Index i = 0; i < smoothed.size(); ++i) {
        if (!valid.data()[i]) smoothed.data()[i] = nodata;
    }
    return smoothed;
}

PostprocessStats postprocess_raster(const fs::path& in_path, const fs::path& out_path,
                                    const config::PostprocessConfig& cfg) {
    auto in = io::GeoRaster::open_read(in_path);
    if (!in->is_class_raster()) {
        throw ValidationError("not an 8-bit class raster: " + in_path.string());
    }
    const ClassMap raw = in->read_class_all();

    PostprocessStats stats;
    const ClassMap cleaned = cfg.enabled ? postprocess_classes(raw, in->nodata(), cfg, &stats) : raw;

    auto out = io::GeoRaster::create_class(out_path, in->width(), in->height(), in->transform(),
                                           in->crs(), in->nodata());
    out->write_class_window({0, 0, in->width(), in->height()}, cleaned);
    out->flush();
    return stats;
}

} // namespace floodmap::postprocess
