#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "ai_inference.hpp"

namespace CropDoctor {

enum class ModelState {
    NOT_LOADED,
    READY,
    DEGRADED
};

std::string modelStateToString(ModelState state);

/**
 * Owns the single classifier instance of the process.
 *
 * The classifier is built by the factory exactly once, on the first load()
 * or classify() call, even when several threads arrive together. A factory
 * that throws leaves the adapter DEGRADED: classify() then fails with
 * ModelUnavailableError until reload() succeeds.
 */
class ClassifierAdapter {
public:
    using Factory = std::function<std::unique_ptr<ImageClassifier>()>;

    explicit ClassifierAdapter(Factory factory);

    ClassifierAdapter(const ClassifierAdapter&) = delete;
    ClassifierAdapter& operator=(const ClassifierAdapter&) = delete;

    // Returns true when the classifier is ready. Never throws.
    bool load();
    // Discards the current instance (if any) and runs the factory again.
    bool reload();

    std::vector<float> classify(const Tensor& input);

    ModelState state() const;
    bool isReady() const { return state() == ModelState::READY; }
    bool isDegraded() const { return state() == ModelState::DEGRADED; }
    std::string lastError() const;
    std::string modelName() const;

private:
    std::shared_ptr<ImageClassifier> acquire();
    void loadLocked();

    Factory factory_;
    mutable std::mutex mutex_;
    ModelState state_ = ModelState::NOT_LOADED;
    std::shared_ptr<ImageClassifier> classifier_;
    std::string lastError_;
};

} // namespace CropDoctor
