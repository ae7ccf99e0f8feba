#include "image_preprocess.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "errors.hpp"

namespace CropDoctor {

cv::Mat ImageCodec::decode(const std::string& bytes) {
    return decode(std::vector<uint8_t>(bytes.begin(), bytes.end()));
}

cv::Mat ImageCodec::decode(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        throw DecodeError("Image data is empty");
    }

    cv::Mat decoded;
    try {
        decoded = cv::imdecode(bytes, cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        throw DecodeError(std::string("Failed to decode image: ") + e.what());
    }
    if (decoded.empty()) {
        throw DecodeError("Image data is corrupt or in an unsupported format");
    }

    if (decoded.depth() != CV_8U) {
        // 16-bit PNGs and the like
        double scale = (decoded.depth() == CV_16U) ? 1.0 / 257.0 : 1.0;
        decoded.convertTo(decoded, CV_8U, scale);
    }

    cv::Mat bgr;
    switch (decoded.channels()) {
        case 1:
            cv::cvtColor(decoded, bgr, cv::COLOR_GRAY2BGR);
            break;
        case 3:
            bgr = decoded;
            break;
        case 4:
            cv::cvtColor(decoded, bgr, cv::COLOR_BGRA2BGR);
            break;
        default:
            throw DecodeError("Unsupported channel count: " + std::to_string(decoded.channels()));
    }
    return bgr;
}

Preprocessor::Preprocessor(const ModelConfig& config)
    : inputSize_(config.input_size),
      channelsFirst_(config.layout == "NCHW"),
      meanValue_(config.mean_value),
      scaleValue_(config.scale_value) {}

Tensor Preprocessor::preprocess(const cv::Mat& image) const {
    if (image.empty() || image.type() != CV_8UC3) {
        throw DecodeError("Preprocessor expects a non-empty 8-bit 3-channel image");
    }

    cv::Mat resized;
    cv::resize(image, resized, cv::Size(inputSize_, inputSize_), 0, 0, cv::INTER_LINEAR);

    cv::Mat rgb;
    cv::cvtColor(resized, rgb, cv::COLOR_BGR2RGB);

    cv::Mat normalized;
    rgb.convertTo(normalized, CV_32F, scaleValue_, -meanValue_ * scaleValue_);

    Tensor tensor;
    const int64_t size = inputSize_;
    tensor.data.reserve(static_cast<size_t>(3 * size * size));

    if (channelsFirst_) {
        tensor.shape = {1, 3, size, size};
        for (int c = 0; c < 3; ++c) {
            for (int y = 0; y < inputSize_; ++y) {
                const float* row = normalized.ptr<float>(y);
                for (int x = 0; x < inputSize_; ++x) {
                    tensor.data.push_back(row[x * 3 + c]);
                }
            }
        }
    } else {
        tensor.shape = {1, size, size, 3};
        for (int y = 0; y < inputSize_; ++y) {
            const float* row = normalized.ptr<float>(y);
            tensor.data.insert(tensor.data.end(), row, row + inputSize_ * 3);
        }
    }
    return tensor;
}

} // namespace CropDoctor
