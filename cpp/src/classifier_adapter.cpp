#include "classifier_adapter.hpp"

#include <iostream>

#include "errors.hpp"

namespace CropDoctor {

std::string modelStateToString(ModelState state) {
    switch (state) {
        case ModelState::NOT_LOADED: return "not_loaded";
        case ModelState::READY: return "ready";
        case ModelState::DEGRADED: return "degraded";
    }
    return "not_loaded";
}

ClassifierAdapter::ClassifierAdapter(Factory factory) : factory_(std::move(factory)) {}

void ClassifierAdapter::loadLocked() {
    try {
        if (!factory_) {
            throw ModelUnavailableError("No classifier factory configured");
        }
        std::unique_ptr<ImageClassifier> created = factory_();
        if (!created) {
            throw ModelUnavailableError("Classifier factory returned no instance");
        }
        classifier_ = std::move(created);
        lastError_.clear();
        state_ = ModelState::READY;
    } catch (const std::exception& e) {
        classifier_.reset();
        lastError_ = e.what();
        state_ = ModelState::DEGRADED;
        std::cerr << "[ERROR] Classifier unavailable, running degraded: " << lastError_ << std::endl;
    }
}

bool ClassifierAdapter::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == ModelState::NOT_LOADED) {
        loadLocked();
    }
    return state_ == ModelState::READY;
}

bool ClassifierAdapter::reload() {
    std::lock_guard<std::mutex> lock(mutex_);
    classifier_.reset();
    state_ = ModelState::NOT_LOADED;
    loadLocked();
    return state_ == ModelState::READY;
}

std::shared_ptr<ImageClassifier> ClassifierAdapter::acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == ModelState::NOT_LOADED) {
        loadLocked();
    }
    if (state_ != ModelState::READY) {
        throw ModelUnavailableError("Classifier unavailable: " + lastError_);
    }
    return classifier_;
}

std::vector<float> ClassifierAdapter::classify(const Tensor& input) {
    // The shared_ptr keeps the instance alive for this call even if reload() swaps it.
    std::shared_ptr<ImageClassifier> classifier = acquire();
    try {
        return classifier->classify(input);
    } catch (const DetectionError&) {
        throw;
    } catch (const std::exception& e) {
        throw ClassifierError(std::string("Inference failed: ") + e.what());
    }
}

ModelState ClassifierAdapter::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string ClassifierAdapter::lastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}

std::string ClassifierAdapter::modelName() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return classifier_ ? classifier_->name() : std::string();
}

} // namespace CropDoctor
