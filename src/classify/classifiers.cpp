#include "floodmap/classify/classifiers.hpp"
#include "floodmap/classify/dnn_model.hpp"
#include "floodmap/classify/elevation.hpp"
#include "floodmap/classify/patch_reader.hpp"
#include "floodmap/core/errors.hpp"

#include <iostream>

namespace floodmap::classify {

SingleModelClassifier::SingleModelClassifier(std::shared_ptr<FloodModel> model, int tile_size,
                                             int model_inputs,
                                             std::shared_ptr<const ElevationSource> elevation)
    : model_(std::move(model)),
      tile_size_(tile_size),
      model_inputs_(model_inputs),
      elevation_(std::move(elevation)) {
    if (!model_) {
        throw ClassifierError("classifier without a model");
    }
}

TileClassification SingleModelClassifier::classify(const std::vector<const io::GeoRaster*>& inputs,
                                                   const geometry::Polygon& tile) const {
    const size_t n = inputs.size();
    const size_t take = (model_inputs_ <= 0 || static_cast<size_t>(model_inputs_) > n)
                            ? n
                            : static_cast<size_t>(model_inputs_);
    const std::vector<const io::GeoRaster*> selected(inputs.end() - static_cast<long>(take),
                                                     inputs.end());

    TileClassification result;
    result.inputs = read_tile_patches(selected, tile, tile_size_);

    if (elevation_) {
        result.elevation = elevation_->elevation_for(tile, tile_size_, tile_size_);
        if (!result.elevation) {
            return result;
        }
    }

    BandStack channels;
    for (const auto& patch : result.inputs) {
        channels.insert(channels.end(), patch.begin(), patch.end());
    }
    if (result.elevation) {
        channels.push_back(*result.elevation);
    }

    result.logits = model_->predict(channels);
    return result;
}

AveragingClassifier::AveragingClassifier(std::unique_ptr<Classifier> first,
                                         std::unique_ptr<Classifier> second)
    : first_(std::move(first)), second_(std::move(second)) {
    if (!first_ || !second_) {
        throw ClassifierError("averaging classifier needs two members");
    }
}

TileClassification AveragingClassifier::classify(const std::vector<const io::GeoRaster*>& inputs,
                                                 const geometry::Polygon& tile) const {
    TileClassification a = first_->classify(inputs, tile);
    TileClassification b = second_->classify(inputs, tile);

    TileClassification result;
    result.inputs = a.inputs.size() >= b.inputs.size() ? std::move(a.inputs) : std::move(b.inputs);
    result.elevation = a.elevation ? std::move(a.elevation) : std::move(b.elevation);

    if (!a.logits || !b.logits) {
        return result;
    }
    if (a.logits->size() != b.logits->size()) {
        throw ClassifierError("averaged models disagree on the number of classes");
    }

    ClassLogits mean;
    mean.reserve(a.logits->size());
    for (size_t c = 0; c < a.logits->size(); ++c) {
        mean.emplace_back(((*a.logits)[c] + (*b.logits)[c]) * 0.5f);
    }
    result.logits = std::move(mean);
    return result;
}

std::unique_ptr<Classifier> make_classifier(const config::ClassifierConfig& cfg, int tile_size) {
    std::shared_ptr<const ElevationSource> elevation;
    const bool needs_elevation =
        cfg.requires_elevation || (cfg.type == "averaged" && cfg.secondary_requires_elevation);
    if (needs_elevation) {
        elevation = std::make_shared<RasterElevationSource>(
            io::GeoRaster::open_read(cfg.elevation_path));
        std::cout << "[CLASSIFIER] elevation: " << cfg.elevation_path << std::endl;
    }

    auto primary_model = std::make_shared<DnnFloodModel>(cfg.model_path, cfg.num_classes);
    std::cout << "[CLASSIFIER] model: " << cfg.model_path << std::endl;
    auto primary = std::make_unique<SingleModelClassifier>(
        primary_model, tile_size, cfg.model_inputs,
        cfg.requires_elevation ? elevation : nullptr);

    if (cfg.type != "averaged") {
        return primary;
    }

    auto secondary_model =
        std::make_shared<DnnFloodModel>(cfg.secondary_model_path, cfg.num_classes);
    std::cout << "[CLASSIFIER] secondary model: " << cfg.secondary_model_path << std::endl;
    auto secondary = std::make_unique<SingleModelClassifier>(
        secondary_model, tile_size, cfg.secondary_inputs,
        cfg.secondary_requires_elevation ? elevation : nullptr);

    return std::make_unique<AveragingClassifier>(std::move(primary), std::move(secondary));
}

} // namespace floodmap::classify
