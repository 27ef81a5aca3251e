#include "floodmap/classify/dnn_model.hpp"
#include "floodmap/core/errors.hpp"

#include <cmath>
#include <cstring>

namespace floodmap::classify {

DnnFloodModel::DnnFloodModel(const fs::path& model_path, int num_classes)
    : path_(model_path), num_classes_(num_classes) {
    if (!fs::exists(model_path)) {
        throw ClassifierError("model file not found: " + model_path.string());
    }
    try {
        net_ = cv::dnn::readNet(model_path.string());
    } catch (const cv::Exception& e) {
        throw ClassifierError("cannot load model " + model_path.string() + ": " + e.what());
    }
    if (net_.empty()) {
        throw ClassifierError("model " + model_path.string() + " has no layers");
    }
}

ClassLogits DnnFloodModel::predict(const BandStack& channels) {
    if (channels.empty()) {
        throw ClassifierError("no input channels");
    }
    const int h = static_cast<int>(channels[0].rows());
    const int w = static_cast<int>(channels[0].cols());
    const int c = static_cast<int>(channels.size());

    const int in_shape[4] = {1, c, h, w};
    cv::Mat blob(4, in_shape, CV_32F);
    float* dst = blob.ptr<float>();
    const size_t plane = static_cast<size_t>(h) * static_cast<size_t>(w);
    for (int k = 0; k < c; ++k) {
        const Matrix2Df& ch = channels[k];
        if (ch.rows() != h || ch.cols() != w) {
            throw ClassifierError("input channels differ in shape");
        }
        const float* src = ch.data();
        for (size_t i = 0; i < plane; ++i) {
            const float v = src[i];
            dst[k * plane + i] = std::isnan(v) ? 0.0f : v;
        }
    }

    cv::Mat out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        try {
            net_.setInput(blob);
            out = net_.forward().clone();
        } catch (const cv::Exception& e) {
            throw ClassifierError("inference failed for " + path_.string() + ": " + e.what());
        }
    }

    if (out.dims != 4 || out.size[0] != 1 || out.size[1] != num_classes_ ||
        out.size[2] != h || out.size[3] != w) {
        throw ClassifierError("model " + path_.string() + " returned an output of unexpected shape");
    }

    ClassLogits logits;
    logits.reserve(num_classes_);
    const float* src = out.ptr<float>();
    for (int k = 0; k < num_classes_; ++k) {
        Matrix2Df band(h, w);
        std::memcpy(band.data(), src + k * plane, plane * sizeof(float));
        logits.push_back(std::move(band));
    }
    return logits;
}

} // namespace floodmap::classify
