#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "advice_generator.hpp"
#include "classification_interpreter.hpp"
#include "classifier_adapter.hpp"
#include "config_manager.hpp"
#include "detection_types.hpp"
#include "image_preprocess.hpp"
#include "inference_pool.hpp"
#include "knowledge_base.hpp"
#include "request_validator.hpp"
#include "response_assembler.hpp"
#include "severity_estimator.hpp"
#include "treatment_advisor.hpp"

namespace CropDoctor {

struct HealthStatus {
    ModelState state = ModelState::NOT_LOADED;
    std::string lastError;
    std::string modelPath;
    size_t knowledgeBaseEntries = 0;
    bool adviceEnabled = false;

    nlohmann::json toJson() const;
};

/**
 * Runs the full detection pipeline:
 * validate -> decode -> preprocess -> classify (inference pool) ->
 * interpret -> severity -> treatment -> assemble.
 *
 * Requests are independent; the only shared mutable state is the
 * classifier held by the adapter. All failures surface as DetectionError
 * subclasses.
 */
class DetectionService {
public:
    DetectionService(const ServiceConfig& config,
                     DiseaseKnowledgeBase knowledgeBase,
                     ClassifierAdapter::Factory classifierFactory,
                     std::shared_ptr<AdviceGenerator> adviceGenerator = nullptr);
    ~DetectionService();

    DetectionService(const DetectionService&) = delete;
    DetectionService& operator=(const DetectionService&) = delete;

    // Loads the classifier now when model.load_at_startup is set. Never throws.
    void start();
    bool reloadModel();

    // timeout overrides runtime.request_timeout_ms for this call.
    DetectionResponse detect(const DetectionRequest& request,
                             std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                             const CancellationToken* token = nullptr);

    std::vector<std::string> listSupportedCrops() const;
    std::vector<KnownDisease> listKnownDiseases(const std::string& cropFilter = "") const;
    HealthStatus health() const;

    const ServiceConfig& config() const { return config_; }
    const DiseaseKnowledgeBase& knowledgeBase() const { return knowledgeBase_; }

    static ClassifierAdapter::Factory defaultClassifierFactory(const ModelConfig& config);

private:
    void rejectIfDegraded() const;
    // Lazy load on first use; throws ModelUnavailableError or TimeoutError.
    void ensureModelLoaded(InferencePool::Clock::time_point deadline);
    static void checkCancelled(const CancellationToken* token, const char* stage);

    ServiceConfig config_;
    DiseaseKnowledgeBase knowledgeBase_;
    ClassifierAdapter adapter_;

    RequestValidator validator_;
    Preprocessor preprocessor_;
    ClassificationInterpreter interpreter_;
    SeverityEstimator severityEstimator_;
    TreatmentAdvisor advisor_;
    ResponseAssembler assembler_;

    // Declared last: workers reference adapter_ and must stop first.
    std::unique_ptr<InferencePool> pool_;
};

} // namespace CropDoctor
