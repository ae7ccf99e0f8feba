#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <string>

#include "detection_service.hpp"
#include "errors.hpp"
#include "test_support.hpp"

using namespace CropDoctor;
using namespace CropDoctor::test_support;
using namespace std::chrono_literals;

namespace {

DiseaseKnowledgeBase shippedKnowledgeBase() {
    return DiseaseKnowledgeBase::loadFromFile(std::string(CROP_DOCTOR_DATA_DIR) + "/plant_diseases.json",
                                              shippedLabels());
}

// Factory that hands out one shared fake and counts how often it is built.
struct FakeModel {
    std::vector<float> scores;
    std::chrono::milliseconds delay{0};
    FakeClassifier* instance = nullptr;
    std::atomic<int> builds{0};

    ClassifierAdapter::Factory factory() {
        return [this]() {
            builds++;
            auto classifier = std::make_unique<FakeClassifier>(scores, delay);
            instance = classifier.get();
            return classifier;
        };
    }
};

DetectionRequest leafRequest(const std::string& crop = "Tomato") {
    DetectionRequest request;
    request.imageBytes = encodeImage(".jpg", 200, 150);
    request.contentType = "image/jpeg";
    request.cropHint = crop;
    return request;
}

bool containsText(const std::vector<std::string>& items, const std::string& needle) {
    for (const auto& item : items) {
        if (item.find(needle) != std::string::npos) return true;
    }
    return false;
}

} // namespace

TEST(DetectionServiceTest, EarlyBlightIsModerate) {
    FakeModel model{peakedScores(30, 0.945f)};
    DetectionService service(ServiceConfig(), shippedKnowledgeBase(), model.factory());
    service.start();

    DetectionResponse response = service.detect(leafRequest());
    EXPECT_FALSE(response.isHealthy);
    EXPECT_EQ(response.severity, SeverityTier::MODERATE);
    EXPECT_EQ(response.cropDetected, "Tomato");
    EXPECT_EQ(response.diseaseLabel, "Tomato___Early_blight");
    EXPECT_NEAR(response.confidencePercent, 94.5, 0.01);
    EXPECT_FALSE(response.recommendations.empty());
    EXPECT_FALSE(response.cause.empty());
    EXPECT_FALSE(response.treatment.empty());
    EXPECT_EQ(response.modelUsed, "fake classifier");
    EXPECT_EQ(model.instance->lastShape, (std::vector<int64_t>{1, 160, 160, 3}));
}

TEST(DetectionServiceTest, HealthyTomato) {
    FakeModel model{peakedScores(38, 0.982f)};
    DetectionService service(ServiceConfig(), shippedKnowledgeBase(), model.factory());

    DetectionResponse response = service.detect(leafRequest());
    EXPECT_TRUE(response.isHealthy);
    EXPECT_EQ(response.severity, SeverityTier::NONE);
    EXPECT_NEAR(response.confidencePercent, 98.2, 0.01);
}

TEST(DetectionServiceTest, BackgroundAsksForBetterPhoto) {
    FakeModel model{peakedScores(4, 0.80f)};
    DetectionService service(ServiceConfig(), DiseaseKnowledgeBase(shippedLabels()), model.factory());

    DetectionResponse response = service.detect(leafRequest());
    EXPECT_FALSE(response.isHealthy);
    EXPECT_TRUE(response.isBackground);
    EXPECT_EQ(response.severity, SeverityTier::NONE);
    EXPECT_TRUE(containsText(response.recommendations, "re-upload a clearer image"));
    EXPECT_FALSE(response.cropMismatch.has_value());
}

TEST(DetectionServiceTest, OversizedUploadRejectedBeforeInference) {
    FakeModel model{peakedScores(30, 0.9f)};
    DetectionService service(ServiceConfig(), shippedKnowledgeBase(), model.factory());
    service.start();

    DetectionRequest request = leafRequest();
    request.imageBytes = std::string(12 * 1024 * 1024, '\xff');
    try {
        service.detect(request);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.reason(), ValidationReason::TOO_LARGE);
    }
    EXPECT_EQ(model.instance->calls.load(), 0);
}

TEST(DetectionServiceTest, MissingWeightsDegradeEveryDetect) {
    ServiceConfig config;
    config.model.path = "/nonexistent/plant_disease_recog_model_pwp.onnx";
    config.model.backend = "opencv";
    DetectionService service(config, shippedKnowledgeBase(),
                             DetectionService::defaultClassifierFactory(config.model));
    service.start();

    EXPECT_EQ(service.health().state, ModelState::DEGRADED);
    for (int i = 0; i < 3; ++i) {
        EXPECT_THROW(service.detect(leafRequest()), ModelUnavailableError);
    }

    // degraded wins over validation: no request reaches decoding
    DetectionRequest garbage = leafRequest();
    garbage.imageBytes = "not an image";
    EXPECT_THROW(service.detect(garbage), ModelUnavailableError);
}

TEST(DetectionServiceTest, ReloadRecoversFromDegradedState) {
    bool available = false;
    ClassifierAdapter::Factory factory = [&available]() -> std::unique_ptr<ImageClassifier> {
        if (!available) throw ModelUnavailableError("weights missing");
        return std::make_unique<FakeClassifier>(peakedScores(38, 0.99f));
    };
    DetectionService service(ServiceConfig(), shippedKnowledgeBase(), factory);
    service.start();
    EXPECT_THROW(service.detect(leafRequest()), ModelUnavailableError);

    available = true;
    EXPECT_TRUE(service.reloadModel());
    EXPECT_TRUE(service.detect(leafRequest()).isHealthy);
}

TEST(DetectionServiceTest, CorruptImageIsDecodeError) {
    FakeModel model{peakedScores(30, 0.9f)};
    DetectionService service(ServiceConfig(), shippedKnowledgeBase(), model.factory());

    DetectionRequest request = leafRequest();
    request.imageBytes = "\x89PNG but not really";
    EXPECT_THROW(service.detect(request), DecodeError);
}

TEST(DetectionServiceTest, RepeatedRequestsAreDeterministic) {
    FakeModel model{peakedScores(22, 0.87f)};
    DetectionService service(ServiceConfig(), shippedKnowledgeBase(), model.factory());

    DetectionRequest request = leafRequest("Potato");
    DetectionResponse first = service.detect(request);
    DetectionResponse second = service.detect(request);
    EXPECT_EQ(first.diseaseLabel, second.diseaseLabel);
    EXPECT_EQ(first.confidencePercent, second.confidencePercent);
    EXPECT_EQ(first.severity, SeverityTier::SEVERE);
    EXPECT_NE(first.detectionId, second.detectionId);
}

TEST(DetectionServiceTest, CropMismatchFlag) {
    FakeModel model{peakedScores(22, 0.87f)};

    DetectionService flagging(ServiceConfig(), shippedKnowledgeBase(), model.factory());
    DetectionResponse flagged = flagging.detect(leafRequest("Tomato"));
    EXPECT_EQ(flagged.cropType, "Tomato");
    EXPECT_EQ(flagged.cropDetected, "Potato");
    ASSERT_TRUE(flagged.cropMismatch.has_value());
    EXPECT_TRUE(*flagged.cropMismatch);

    ServiceConfig quiet;
    quiet.flag_crop_mismatch = false;
    DetectionService silent(quiet, shippedKnowledgeBase(), model.factory());
    DetectionResponse unflagged = silent.detect(leafRequest("Tomato"));
    EXPECT_EQ(unflagged.cropDetected, "Potato");
    EXPECT_FALSE(unflagged.cropMismatch.has_value());
}

TEST(DetectionServiceTest, SlowClassifierTimesOut) {
    FakeModel model{peakedScores(30, 0.9f), 400ms};
    DetectionService service(ServiceConfig(), shippedKnowledgeBase(), model.factory());
    service.start();

    EXPECT_THROW(service.detect(leafRequest(), 100ms), TimeoutError);
}

TEST(DetectionServiceTest, CancelledBeforeDecode) {
    FakeModel model{peakedScores(30, 0.9f)};
    DetectionService service(ServiceConfig(), shippedKnowledgeBase(), model.factory());
    service.start();

    CancellationToken token;
    token.cancel();
    EXPECT_THROW(service.detect(leafRequest(), std::nullopt, &token), CancelledError);
    EXPECT_EQ(model.instance->calls.load(), 0);
}

TEST(DetectionServiceTest, MissingKnowledgeRecordIsReported) {
    FakeModel model{peakedScores(1, 0.9f)};
    DetectionService service(ServiceConfig(), DiseaseKnowledgeBase(shippedLabels()), model.factory());
    EXPECT_THROW(service.detect(leafRequest("Apple")), UnknownLabelError);
}

TEST(DetectionServiceTest, FailingAdviceKeepsResponse) {
    FakeModel model{peakedScores(31, 0.95f)};
    auto advice = std::make_shared<FailingAdviceGenerator>();
    DetectionService service(ServiceConfig(), shippedKnowledgeBase(), model.factory(), advice);

    DetectionResponse response = service.detect(leafRequest());
    EXPECT_EQ(advice->calls, 1);
    EXPECT_FALSE(response.generatedAdvice.has_value());
    EXPECT_EQ(response.severity, SeverityTier::SEVERE);
    EXPECT_FALSE(response.recommendations.empty());
}

TEST(DetectionServiceTest, GeneratedAdviceIsAttached) {
    FakeModel model{peakedScores(31, 0.95f)};
    auto advice = std::make_shared<FixedAdviceGenerator>("Destroy infected plants today.");
    DetectionService service(ServiceConfig(), shippedKnowledgeBase(), model.factory(), advice);

    DetectionRequest request = leafRequest();
    request.location = std::string("Kolar");
    DetectionResponse response = service.detect(request);
    EXPECT_EQ(response.generatedAdvice.value_or(""), "Destroy infected plants today.");
    EXPECT_EQ(response.location.value_or(""), "Kolar");
    EXPECT_EQ(advice->lastContext.location.value_or(""), "Kolar");
}

TEST(DetectionServiceTest, ListingsAndHealth) {
    FakeModel model{peakedScores(0, 0.9f)};
    DetectionService service(ServiceConfig(), shippedKnowledgeBase(), model.factory());

    EXPECT_EQ(service.listSupportedCrops().size(), 14u);
    EXPECT_EQ(service.listKnownDiseases().size(), 26u);
    EXPECT_EQ(service.listKnownDiseases("grape").size(), 3u);

    HealthStatus before = service.health();
    EXPECT_EQ(before.state, ModelState::NOT_LOADED);
    EXPECT_EQ(before.knowledgeBaseEntries, 26u);
    EXPECT_FALSE(before.adviceEnabled);

    service.start();
    nlohmann::json health = service.health().toJson();
    EXPECT_EQ(health["status"], "ready");
    EXPECT_TRUE(health["lastError"].is_null());
    EXPECT_EQ(health["modelPath"], ServiceConfig().model.path);
}

TEST(DetectionServiceTest, LazyLoadWhenStartupLoadDisabled) {
    ServiceConfig config;
    config.model.load_at_startup = false;
    FakeModel model{peakedScores(38, 0.9f)};
    DetectionService service(config, shippedKnowledgeBase(), model.factory());
    service.start();

    EXPECT_EQ(model.builds.load(), 0);
    service.detect(leafRequest());
    service.detect(leafRequest());
    EXPECT_EQ(model.builds.load(), 1);
}

TEST(DetectionServiceTest, LazyLoadWaitsForAValidUpload) {
    ServiceConfig config;
    config.model.load_at_startup = false;
    FakeModel model{peakedScores(38, 0.9f)};
    DetectionService service(config, shippedKnowledgeBase(), model.factory());
    service.start();

    DetectionRequest oversized = leafRequest();
    oversized.imageBytes = std::string(12 * 1024 * 1024, '\xff');
    try {
        service.detect(oversized);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.reason(), ValidationReason::TOO_LARGE);
    }

    DetectionRequest wrongType = leafRequest();
    wrongType.contentType = "application/pdf";
    EXPECT_THROW(service.detect(wrongType), ValidationError);

    EXPECT_EQ(model.builds.load(), 0);
    EXPECT_EQ(service.health().state, ModelState::NOT_LOADED);

    service.detect(leafRequest());
    EXPECT_EQ(model.builds.load(), 1);
}

TEST(DetectionServiceTest, AdviceTimeoutBoundedByRequestTimeout) {
    ServiceConfig config;
    config.advice.timeout_ms = 8000;
    FakeModel model{peakedScores(31, 0.95f)};
    auto advice = std::make_shared<FixedAdviceGenerator>("Destroy infected plants today.");
    DetectionService service(config, shippedKnowledgeBase(), model.factory(), advice);
    service.start();

    DetectionResponse response = service.detect(leafRequest(), 2000ms);
    ASSERT_EQ(advice->calls, 1);
    EXPECT_TRUE(response.generatedAdvice.has_value());
    EXPECT_GT(advice->lastTimeout.count(), 0);
    EXPECT_LE(advice->lastTimeout.count(), 2000);
}

TEST(DetectionServiceTest, SlowLazyLoadTimesOut) {
    ServiceConfig config;
    config.model.load_at_startup = false;
    ClassifierAdapter::Factory slowFactory = []() -> std::unique_ptr<ImageClassifier> {
        std::this_thread::sleep_for(300ms);
        return std::make_unique<FakeClassifier>(peakedScores(38, 0.99f));
    };
    DetectionService service(config, shippedKnowledgeBase(), slowFactory);

    EXPECT_THROW(service.detect(leafRequest(), 100ms), TimeoutError);
    // the model stays loaded for the next request
    EXPECT_EQ(service.health().state, ModelState::READY);
    EXPECT_TRUE(service.detect(leafRequest()).isHealthy);
}
