#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

#include "config_manager.hpp"

namespace CropDoctor {

struct Tensor {
    std::vector<int64_t> shape;
    std::vector<float> data;
};

class ImageCodec {
public:
    // Decodes JPEG/PNG/WebP/BMP bytes into a BGR 8-bit image. Throws DecodeError.
    static cv::Mat decode(const std::string& bytes);
    static cv::Mat decode(const std::vector<uint8_t>& bytes);
};

/**
 * Turns a decoded BGR image into the tensor the classifier was trained on:
 * square resize to the model's input size, BGR -> RGB, (pixel - mean) * scale,
 * laid out as NHWC or NCHW with a batch dimension of one.
 */
class Preprocessor {
public:
    explicit Preprocessor(const ModelConfig& config);

    Tensor preprocess(const cv::Mat& image) const;

    bool channelsFirst() const { return channelsFirst_; }

private:
    int inputSize_;
    bool channelsFirst_;
    float meanValue_;
    float scaleValue_;
};

} // namespace CropDoctor
