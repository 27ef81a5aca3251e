#include "floodmap/search/tile_checks.hpp"
#include "floodmap/core/errors.hpp"

#include <cmath>

namespace floodmap::search {

bool passes_edge_heuristic(const std::vector<BandStack>& patches,
                           const config::EdgeHeuristicConfig& cfg) {
    for (const auto& stack : patches) {
        int64_t size = 0;
        int64_t zeros = 0;
        for (const auto& band : stack) {
            if (band.hasNaN()) return false;
            size += band.size();
            zeros += (band.array() < cfg.zero_value).count();
        }
        if (static_cast<double>(zeros) >= static_cast<double>(size) * cfg.max_zero_fraction) {
            return false;
        }
    }
    return true;
}

ClassMap argmax_classes(const ClassLogits& logits) {
    if (logits.empty()) {
        throw ClassifierError("empty logits");
    }
    const auto rows = logits[0].rows();
    const auto cols = logits[0].cols();

    ClassMap out = ClassMap::Zero(rows, cols);
    Matrix2Df best = logits[0];
    for (size_t c = 1; c < logits.size(); ++c) {
        const Matrix2Df& band = logits[c];
        for (Eigen::Index y = 0; y < rows; ++y) {
            for (Eigen::Index x = 0; x < cols; ++x) {
                if (band(y, x) > best(y, x)) {
                    best(y, x) = band(y, x);
                    out(y, x) = static_cast<uint8_t>(c);
                }
            }
        }
    }
    return out;
}

ClassCounts count_classes(const ClassMap& classes) {
    ClassCounts counts;
    counts.background = (classes.array() == static_cast<uint8_t>(WaterClass::BACKGROUND)).count();
    counts.permanent_water =
        (classes.array() == static_cast<uint8_t>(WaterClass::PERMANENT_WATER)).count();
    counts.flood = (classes.array() == static_cast<uint8_t>(WaterClass::FLOOD)).count();
    return counts;
}

TileDisposition classify_disposition(const ClassCounts& counts, const config::SearchConfig& cfg) {
    const double total = static_cast<double>(counts.total());
    if (total <= 0.0) return TileDisposition::DRY;

    const double pw = static_cast<double>(counts.permanent_water) / total;
    const double bg = static_cast<double>(counts.background) / total;
    const double fl = static_cast<double>(counts.flood) / total;

    if (pw > cfg.permanent_water_max_fraction || bg < cfg.background_min_fraction) {
        return TileDisposition::LARGE_WATER_BODY;
    }
    if (fl > cfg.flood_fraction) {
        return TileDisposition::FLOODED;
    }
    return TileDisposition::DRY;
}

} // namespace floodmap::search
