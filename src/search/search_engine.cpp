#include "floodmap/search/search_engine.hpp"
#include "floodmap/core/errors.hpp"
#include "floodmap/search/frontier_seeder.hpp"
#include "floodmap/search/tile_checks.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <iomanip>
#include <mutex>
#include <thread>

namespace floodmap::search {

void print_search_counters(std::ostream& out, const SearchCounters& counters, size_t open) {
    out << "[SEARCH] " << std::setw(6) << open << " open " << std::setw(6) << counters.visited
        << " visited " << std::setw(6) << counters.flooded << " flooded " << std::setw(6)
        << counters.large_water << " in large bodies of water " << std::setw(6)
        << counters.outside << " outside legal bounds" << std::endl;
}

FloodSearch::FloodSearch(const grid::LatticeSet& lattices, const classify::Classifier& classifier,
                         std::vector<const io::GeoRaster*> inputs, const config::Config& cfg)
    : lattices_(lattices), classifier_(classifier), inputs_(std::move(inputs)), cfg_(cfg) {
    if (inputs_.empty()) {
        throw ValidationError("flood search needs at least one input raster");
    }
}

LogitsPtr FloodSearch::classify_offset(grid::LatticeId lattice, const TileCoord& c) {
    if (!lattices_.lattice(lattice).contains(c)) {
        return nullptr;
    }
    return cache_.get_or_compute(lattice, c, [this](grid::LatticeId id, const TileCoord& coord) {
        classify::TileClassification cls =
            classifier_.classify(inputs_, lattices_.tile_polygon(id, coord));
        if (!cls.logits) {
            return LogitsPtr();
        }
        return LogitsPtr(std::make_shared<const ClassLogits>(std::move(*cls.logits)));
    });
}

NeighborLogits FloodSearch::fetch_neighbors(const TileCoord& c) {
    struct Job {
        Direction dir;
        grid::LatticeId lattice;
        TileCoord coord;
    };

    std::vector<Job> jobs;
    jobs.reserve(kAllDirections.size());
    for (Direction d : kAllDirections) {
        const auto cell = neighbor_cell(d, c);
        if (lattices_.lattice(cell.first).contains(cell.second)) {
            jobs.push_back({d, cell.first, cell.second});
        }
    }

    NeighborLogits out;
    const int workers =
        std::min(std::max(1, cfg_.runtime_limits.parallel_workers), static_cast<int>(jobs.size()));

    if (workers <= 1) {
        for (const auto& job : jobs) {
            out[job.dir] = classify_offset(job.lattice, job.coord);
        }
        return out;
    }

    std::atomic<size_t> next{0};
    std::mutex error_mutex;
    std::exception_ptr first_error;

    auto worker = [&]() {
        while (true) {
            const size_t i = next.fetch_add(1);
            if (i >= jobs.size()) {
                break;
            }
            try {
                // Each job owns a distinct direction slot.
                out[jobs[i].dir] = classify_offset(jobs[i].lattice, jobs[i].coord);
            } catch (...) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error) {
                    first_error = std::current_exception();
                }
            }
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(static_cast<size_t>(workers));
    for (int w = 0; w < workers; ++w) {
        threads.emplace_back(worker);
    }
    for (auto& t : threads) {
        if (t.joinable()) {
            t.join();
        }
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
    return out;
}

void FloodSearch::export_patches(const io::PixelWindow& window,
                                 const std::vector<BandStack>& patches,
                                 const fs::path& export_prefix, io::GeoRaster& classes,
                                 SearchResult& result) {
    if (exports_.empty()) {
        for (size_t i = 0; i < patches.size(); ++i) {
            fs::path path = export_prefix;
            path += "-input" + std::to_string(i) + ".fits";
            exports_.push_back(io::GeoRaster::create_float(
                path, classes.width(), classes.height(), static_cast<int>(patches[i].size()),
                classes.transform(), classes.crs()));
            result.export_paths.push_back(path);
        }
    }
    if (exports_.size() != patches.size()) {
        throw ClassifierError("classifier returned " + std::to_string(patches.size()) +
                              " input patches, export expects " +
                              std::to_string(exports_.size()));
    }
    for (size_t i = 0; i < patches.size(); ++i) {
        exports_[i]->write_window(window, patches[i]);
    }
}

SearchResult FloodSearch::run(const std::vector<TileCoord>& initial, io::GeoRaster& classes,
                              const fs::path& export_prefix, std::ostream* progress_out,
                              SearchProgressFn progress_cb) {
    const grid::TileLattice& lat = lattices_.primary();
    if (classes.width() != lattices_.width || classes.height() != lattices_.height) {
        throw ValidationError("class raster does not match the lattice output grid");
    }

    SearchState state(lat.nx, lat.ny);
    for (const auto& c : initial) {
        state.push(c);
    }

    const auto weights = weights_.get(lat.tile_size, lat.tile_size);
    const int max_visits = cfg_.search.max_visits;
    const int progress_every = cfg_.search.progress_every;

    SearchResult result;
    exports_.clear();

    while (!state.empty() && static_cast<int>(result.visits.size()) < max_visits) {
        VisitRecord record;
        record.coord = state.pop();
        record.footprint = lattices_.tile_polygon(grid::LatticeId::PRIMARY, record.coord);
        record.disposition = TileDisposition::OUTSIDE;

        if (lattices_.tile_in_bounds(grid::LatticeId::PRIMARY, record.coord)) {
            classify::TileClassification cls = classifier_.classify(inputs_, record.footprint);

            if (cls.logits && passes_edge_heuristic(cls.inputs, cfg_.edge_heuristic)) {
                const NeighborLogits neighbors = fetch_neighbors(record.coord);
                const ClassLogits blended = blend_logits(*cls.logits, neighbors, *weights);
                const ClassMap tile_classes = argmax_classes(blended);

                const io::PixelWindow window =
                    io::window_for_polygon(classes.transform(), record.footprint);
                classes.write_class_window(window, tile_classes);
                if (!export_prefix.empty()) {
                    export_patches(window, cls.inputs, export_prefix, classes, result);
                }

                record.counts = count_classes(tile_classes);
                record.disposition = classify_disposition(record.counts, cfg_.search);

                if (record.disposition == TileDisposition::FLOODED) {
                    for (const auto& n :
                         window_around(record.coord, cfg_.search.expand_radius, lat.nx, lat.ny)) {
                        state.push(n);
                    }
                }
            }
        }

        state.record(record.disposition);
        result.visits.push_back(std::move(record));

        const int visited = state.counters().visited;
        if ((progress_every > 0 && visited % progress_every == 0) || state.empty()) {
            if (progress_out) print_search_counters(*progress_out, state.counters(), state.open());
            if (progress_cb) progress_cb(state.counters(), state.open());
        }
    }

    if (progress_out) print_search_counters(*progress_out, state.counters(), state.open());

    classes.flush();
    for (auto& e : exports_) {
        e->flush();
    }
    exports_.clear();

    result.counters = state.counters();
    result.open_at_exit = state.open();
    result.hit_visit_cap = !state.empty();
    result.major_flooding = result.counters.flooded >= cfg_.search.min_flooded_tiles;
    result.offset_classifications = cache_.computations();
    return result;
}

} // namespace floodmap::search
