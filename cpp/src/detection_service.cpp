#include "detection_service.hpp"

#include <iostream>

#include "ai_inference.hpp"
#include "errors.hpp"

namespace CropDoctor {

nlohmann::json HealthStatus::toJson() const {
    return {
        {"status", modelStateToString(state)},
        {"lastError", lastError.empty() ? nlohmann::json(nullptr) : nlohmann::json(lastError)},
        {"modelPath", modelPath},
        {"knowledgeBaseEntries", knowledgeBaseEntries},
        {"adviceEnabled", adviceEnabled}
    };
}

ClassifierAdapter::Factory DetectionService::defaultClassifierFactory(const ModelConfig& config) {
    return [config]() { return createClassifier(config); };
}

DetectionService::DetectionService(const ServiceConfig& config,
                                   DiseaseKnowledgeBase knowledgeBase,
                                   ClassifierAdapter::Factory classifierFactory,
                                   std::shared_ptr<AdviceGenerator> adviceGenerator)
    : config_(config),
      knowledgeBase_(std::move(knowledgeBase)),
      adapter_(std::move(classifierFactory)),
      validator_(config_.validation),
      preprocessor_(config_.model),
      interpreter_(knowledgeBase_.sharedLabels()),
      severityEstimator_(config_.severity),
      advisor_(knowledgeBase_, std::move(adviceGenerator),
               std::chrono::milliseconds(config_.advice.timeout_ms)),
      assembler_(config_.flag_crop_mismatch),
      pool_(std::make_unique<InferencePool>(adapter_, config_.runtime.worker_threads,
                                            config_.runtime.queue_capacity)) {}

DetectionService::~DetectionService() {
    pool_->shutdown();
}

void DetectionService::start() {
    if (!config_.model.load_at_startup) {
        std::cout << "[INFO] Classifier will be loaded on first request" << std::endl;
        return;
    }
    if (adapter_.load()) {
        std::cout << "[INFO] Classifier ready: " << adapter_.modelName() << std::endl;
    }
}

bool DetectionService::reloadModel() {
    bool ok = adapter_.reload();
    if (ok) {
        std::cout << "[INFO] Classifier reloaded: " << adapter_.modelName() << std::endl;
    }
    return ok;
}

void DetectionService::rejectIfDegraded() const {
    if (adapter_.isDegraded()) {
        throw ModelUnavailableError("Classifier unavailable: " + adapter_.lastError());
    }
}

void DetectionService::ensureModelLoaded(InferencePool::Clock::time_point deadline) {
    if (adapter_.state() != ModelState::NOT_LOADED) {
        return;
    }
    adapter_.load();
    rejectIfDegraded();
    if (InferencePool::Clock::now() >= deadline) {
        throw TimeoutError("Loading the classifier used up the request deadline");
    }
}

void DetectionService::checkCancelled(const CancellationToken* token, const char* stage) {
    if (token && token->isCancelled()) {
        throw CancelledError(std::string("Request cancelled ") + stage);
    }
}

DetectionResponse DetectionService::detect(const DetectionRequest& request,
                                           std::optional<std::chrono::milliseconds> timeout,
                                           const CancellationToken* token) {
    using Clock = InferencePool::Clock;
    const auto started = Clock::now();
    const auto deadline = started + timeout.value_or(std::chrono::milliseconds(config_.runtime.request_timeout_ms));

    // A degraded service answers before validation; a lazy load waits for a valid upload.
    rejectIfDegraded();
    validator_.validate(UploadMetadata{request.imageBytes.size(), request.contentType, request.cropHint});
    ensureModelLoaded(deadline);

    checkCancelled(token, "before decoding");
    cv::Mat image = ImageCodec::decode(request.imageBytes);
    Tensor tensor = preprocessor_.preprocess(image);

    checkCancelled(token, "before inference");
    std::vector<float> probabilities = pool_->run(std::move(tensor), deadline, token);
    checkCancelled(token, "after inference");

    ClassificationResult result = interpreter_.interpret(probabilities);
    SeverityTier severity = severityEstimator_.estimate(*result.label, result.confidencePercent);

    TreatmentPlan plan;
    try {
        plan = advisor_.advise(result, severity, request.location, deadline);
    } catch (const UnknownLabelError& e) {
        std::cerr << "[ERROR] Knowledge-base defect: classifier returned " << e.label()
                  << " but no cause/cure record exists" << std::endl;
        throw;
    }

    DetectionResponse response = assembler_.assemble(request, result, severity, std::move(plan),
                                                      adapter_.modelName());

    if (config_.log_level == "DEBUG") {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
        std::cout << "[DEBUG] Detection " << response.detectionId << ": " << response.diseaseLabel
                  << " (" << response.confidencePercent << "%, " << severityToString(severity)
                  << ") in " << elapsed.count() << " ms" << std::endl;
    }
    return response;
}

std::vector<std::string> DetectionService::listSupportedCrops() const {
    return knowledgeBase_.labels().crops();
}

std::vector<KnownDisease> DetectionService::listKnownDiseases(const std::string& cropFilter) const {
    return knowledgeBase_.listDiseases(cropFilter);
}

HealthStatus DetectionService::health() const {
    HealthStatus status;
    status.state = adapter_.state();
    status.lastError = adapter_.lastError();
    status.modelPath = config_.model.path;
    status.knowledgeBaseEntries = knowledgeBase_.size();
    status.adviceEnabled = advisor_.hasAdviceGenerator();
    return status;
}

} // namespace CropDoctor
