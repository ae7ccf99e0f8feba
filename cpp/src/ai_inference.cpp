#include "ai_inference.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>

#ifdef HAVE_ONNXRUNTIME
#include <onnxruntime_cxx_api.h>
#endif

#include "errors.hpp"

namespace CropDoctor {

namespace {

void requireModelFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw ModelUnavailableError("Model file not found: " + path);
    }
}

} // namespace

struct OnnxImageClassifier::ModelInstance {
#ifdef HAVE_ONNXRUNTIME
    std::unique_ptr<Ort::Env> env;
    std::unique_ptr<Ort::Session> session;
    Ort::MemoryInfo memoryInfo{nullptr};
    std::vector<std::string> inputNameStrs;
    std::vector<const char*> inputNames;
    std::vector<std::string> outputNameStrs;
    std::vector<const char*> outputNames;

    ModelInstance() : memoryInfo(Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault)) {
        env = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "CropDoctor");
    }
#endif
    std::string modelPath;
};

bool isOnnxRuntimeAvailable() {
#ifdef HAVE_ONNXRUNTIME
    return true;
#else
    return false;
#endif
}

OnnxImageClassifier::OnnxImageClassifier(const ModelConfig& config)
    : impl_(std::make_unique<ModelInstance>()) {
    impl_->modelPath = config.path;
#ifdef HAVE_ONNXRUNTIME
    requireModelFile(config.path);
    try {
        Ort::SessionOptions sessionOptions;
        sessionOptions.SetIntraOpNumThreads(std::max(1, config.intra_op_threads));
        sessionOptions.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);

        impl_->session = std::make_unique<Ort::Session>(*impl_->env, config.path.c_str(), sessionOptions);

        Ort::AllocatorWithDefaultOptions allocator;
        const size_t inCount = impl_->session->GetInputCount();
        for (size_t i = 0; i < inCount; ++i) {
            auto name = impl_->session->GetInputNameAllocated(i, allocator);
            impl_->inputNameStrs.push_back(name.get());
        }
        const size_t outCount = impl_->session->GetOutputCount();
        for (size_t i = 0; i < outCount; ++i) {
            auto name = impl_->session->GetOutputNameAllocated(i, allocator);
            impl_->outputNameStrs.push_back(name.get());
        }
        for (const auto& s : impl_->inputNameStrs) impl_->inputNames.push_back(s.c_str());
        for (const auto& s : impl_->outputNameStrs) impl_->outputNames.push_back(s.c_str());
    } catch (const Ort::Exception& e) {
        throw ModelUnavailableError("Failed to load ONNX model: " + std::string(e.what()));
    }

    if (impl_->inputNames.size() != 1 || impl_->outputNames.empty()) {
        throw ModelUnavailableError("Expected a single-input classifier, got " +
                                    std::to_string(impl_->inputNames.size()) + " inputs");
    }
    std::cout << "[INFO] Loaded ONNX model: " << config.path << std::endl;
#else
    throw ModelUnavailableError("ONNX Runtime not available in this build");
#endif
}

OnnxImageClassifier::~OnnxImageClassifier() = default;

std::string OnnxImageClassifier::name() const {
    return "onnxruntime:" + std::filesystem::path(impl_->modelPath).filename().string();
}

std::vector<float> OnnxImageClassifier::classify(const Tensor& input) {
#ifdef HAVE_ONNXRUNTIME
    try {
        // CreateTensor does not copy; the tensor only lives for this call.
        std::vector<float> inputData = input.data;
        std::vector<int64_t> inputShape = input.shape;
        Ort::Value inputTensor = Ort::Value::CreateTensor<float>(
            impl_->memoryInfo,
            inputData.data(),
            inputData.size(),
            inputShape.data(),
            inputShape.size()
        );

        auto outputTensors = impl_->session->Run(
            Ort::RunOptions{nullptr},
            impl_->inputNames.data(),
            &inputTensor,
            1,
            impl_->outputNames.data(),
            1
        );

        if (outputTensors.empty() || !outputTensors[0].IsTensor()) {
            throw ClassifierError("Classifier returned no output tensor");
        }
        const float* raw = outputTensors[0].GetTensorData<float>();
        size_t count = outputTensors[0].GetTensorTypeAndShapeInfo().GetElementCount();
        return toProbabilities(std::vector<float>(raw, raw + count));
    } catch (const Ort::Exception& e) {
        throw ClassifierError("ONNX inference failed: " + std::string(e.what()));
    }
#else
    (void)input;
    throw ModelUnavailableError("ONNX Runtime not available in this build");
#endif
}

OpenCvDnnClassifier::OpenCvDnnClassifier(const ModelConfig& config) : modelPath_(config.path) {
    requireModelFile(config.path);
    try {
        net_ = cv::dnn::readNet(config.path);
        net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
        net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
    } catch (const cv::Exception& e) {
        throw ModelUnavailableError("Could not load model with OpenCV DNN: " + std::string(e.what()));
    }
    if (net_.empty()) {
        throw ModelUnavailableError("OpenCV DNN produced an empty network for " + config.path);
    }
    std::cout << "[INFO] Loaded OpenCV DNN model: " << config.path << std::endl;
}

std::string OpenCvDnnClassifier::name() const {
    return "opencv-dnn:" + std::filesystem::path(modelPath_).filename().string();
}

std::vector<float> OpenCvDnnClassifier::classify(const Tensor& input) {
    std::vector<int> sizes(input.shape.begin(), input.shape.end());
    // blob wraps the caller's buffer; setInput copies it into the network.
    cv::Mat blob(static_cast<int>(sizes.size()), sizes.data(), CV_32F,
                 const_cast<float*>(input.data.data()));

    cv::Mat output;
    try {
        std::lock_guard<std::mutex> lock(forwardMutex_);
        net_.setInput(blob);
        output = net_.forward().clone();
    } catch (const cv::Exception& e) {
        throw ClassifierError("OpenCV DNN inference failed: " + std::string(e.what()));
    }

    cv::Mat flat = output.reshape(1, 1);
    std::vector<float> scores;
    flat.copyTo(scores);
    return toProbabilities(std::move(scores));
}

std::unique_ptr<ImageClassifier> createClassifier(const ModelConfig& config) {
    if (config.backend == "onnxruntime") {
        if (isOnnxRuntimeAvailable()) {
            return std::make_unique<OnnxImageClassifier>(config);
        }
        std::cerr << "[WARN] ONNX Runtime not compiled in; falling back to OpenCV DNN" << std::endl;
    }
    return std::make_unique<OpenCvDnnClassifier>(config);
}

std::vector<float> toProbabilities(std::vector<float> scores) {
    if (scores.empty()) {
        return scores;
    }

    bool looksLikeDistribution = true;
    double sum = 0.0;
    for (float s : scores) {
        if (!std::isfinite(s) || s < 0.0f || s > 1.0f) {
            looksLikeDistribution = false;
            break;
        }
        sum += s;
    }
    if (looksLikeDistribution && std::abs(sum - 1.0) < 1e-3) {
        return scores;
    }

    float maxScore = -INFINITY;
    for (float s : scores) {
        if (std::isfinite(s)) maxScore = std::max(maxScore, s);
    }
    if (!std::isfinite(maxScore)) {
        return scores;  // nothing usable; the interpreter rejects it
    }

    double total = 0.0;
    for (float& s : scores) {
        s = std::isfinite(s) ? static_cast<float>(std::exp(static_cast<double>(s - maxScore))) : 0.0f;
        total += s;
    }
    for (float& s : scores) {
        s = static_cast<float>(s / total);
    }
    return scores;
}

} // namespace CropDoctor
