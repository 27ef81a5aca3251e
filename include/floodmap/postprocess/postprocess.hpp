#pragma once

#include "floodmap/config/configuration.hpp"
#include "floodmap/core/types.hpp"

namespace floodmap::postprocess {

struct PostprocessStats {
    int64_t pixels_smoothed = 0;   // changed by the majority filter
    int regions_filled = 0;        // small closed regions replaced
    int single_pixels = 0;         // degenerate contours replaced
    int open_contours_skipped = 0; // contours touching the image border
};

// Majority over a disk of `radius`, counting only pixels where valid != 0.
// Pixels outside the valid mask are copied unchanged. Ties go to the lower value.
ClassMap majority_filter(const ClassMap& classes, const ClassMap& valid, int radius);

// Replaces closed regions of classes 1 and 2 smaller than min_region_area
// with the majority of their padded bounding box. Only valid pixels are read
// or written.
void remove_small_regions(ClassMap& classes, const ClassMap& valid,
                          const config::PostprocessConfig& cfg, PostprocessStats* stats = nullptr);

// Full cleanup of a raw class map. Nodata pixels stay nodata and no nodata is
// introduced.
ClassMap postprocess_classes(const ClassMap& raw, uint8_t nodata,
                             const config::PostprocessConfig& cfg,
                             PostprocessStats* stats = nullptr);

// Reads a raw class raster, cleans it and writes the result with the same
// grid and nodata value.
PostprocessStats postprocess_raster(const fs::path& in_path, const fs::path& out_path,
                                    const config::PostprocessConfig& cfg);

} // namespace floodmap::postprocess
