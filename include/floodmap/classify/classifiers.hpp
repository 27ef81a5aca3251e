#pragma once

#include "floodmap/classify/classifier.hpp"
#include "floodmap/config/configuration.hpp"

#include <memory>

namespace floodmap::classify {

// One network fed with the trailing `model_inputs` rasters (0 = all), plus an
// elevation channel when required.
class SingleModelClassifier : public Classifier {
public:
    SingleModelClassifier(std::shared_ptr<FloodModel> model, int tile_size, int model_inputs = 0,
                          std::shared_ptr<const ElevationSource> elevation = nullptr);

    TileClassification classify(const std::vector<const io::GeoRaster*>& inputs,
                                const geometry::Polygon& tile) const override;

    bool requires_elevation() const { return elevation_ != nullptr; }

private:
    std::shared_ptr<FloodModel> model_;
    int tile_size_;
    int model_inputs_;
    std::shared_ptr<const ElevationSource> elevation_;
};

// Mean of two classifiers' logits. Yields nothing unless both do.
class AveragingClassifier : public Classifier {
public:
    AveragingClassifier(std::unique_ptr<Classifier> first, std::unique_ptr<Classifier> second);

    TileClassification classify(const std::vector<const io::GeoRaster*>& inputs,
                                const geometry::Polygon& tile) const override;

private:
    std::unique_ptr<Classifier> first_;
    std::unique_ptr<Classifier> second_;
};

// Builds the configured classifier with its models and elevation source.
std::unique_ptr<Classifier> make_classifier(const config::ClassifierConfig& cfg, int tile_size);

} // namespace floodmap::classify
