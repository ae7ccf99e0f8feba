#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <opencv2/dnn.hpp>

#include "config_manager.hpp"
#include "image_preprocess.hpp"

namespace CropDoctor {

/**
 * Pretrained leaf classifier. classify() returns one probability per class
 * in the model's output order. Implementations must be safe to call from
 * several inference workers at once.
 */
class ImageClassifier {
public:
    virtual ~ImageClassifier() = default;

    virtual std::vector<float> classify(const Tensor& input) = 0;
    virtual std::string name() const = 0;
};

/**
 * ONNX Runtime backed classifier. The constructor loads the session and
 * throws ModelUnavailableError if the model file is missing, cannot be
 * parsed, or ONNX Runtime was not compiled in.
 */
class OnnxImageClassifier : public ImageClassifier {
public:
    explicit OnnxImageClassifier(const ModelConfig& config);
    ~OnnxImageClassifier() override;

    std::vector<float> classify(const Tensor& input) override;
    std::string name() const override;

private:
    struct ModelInstance;
    std::unique_ptr<ModelInstance> impl_;
};

// OpenCV DNN backed classifier. Net::forward is not re-entrant, calls are serialized.
class OpenCvDnnClassifier : public ImageClassifier {
public:
    explicit OpenCvDnnClassifier(const ModelConfig& config);

    std::vector<float> classify(const Tensor& input) override;
    std::string name() const override;

private:
    cv::dnn::Net net_;
    std::string modelPath_;
    std::mutex forwardMutex_;
};

bool isOnnxRuntimeAvailable();

// Picks the backend named in config, falling back to OpenCV DNN when ONNX Runtime is not compiled in.
std::unique_ptr<ImageClassifier> createClassifier(const ModelConfig& config);

// Raw logits are passed through softmax; outputs that already sum to ~1 are returned as is.
std::vector<float> toProbabilities(std::vector<float> scores);

} // namespace CropDoctor
