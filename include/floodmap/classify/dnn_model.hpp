#pragma once

#include "floodmap/classify/classifier.hpp"

#include <opencv2/dnn.hpp>

#include <mutex>
#include <string>

namespace floodmap::classify {

// Network loaded through cv::dnn (ONNX, TensorFlow, Caffe, ...).
// Input blob [1, C, H, W], output [1, classes, H, W]. NaN inputs are fed as 0.
class DnnFloodModel : public FloodModel {
public:
    DnnFloodModel(const fs::path& model_path, int num_classes);

    int num_classes() const override { return num_classes_; }
    ClassLogits predict(const BandStack& channels) override;


private:
    fs::path path_;
    int num_classes_;
    cv::dnn::Net net_;
    std::mutex mutex_;
};

} // namespace floodmap::classify
