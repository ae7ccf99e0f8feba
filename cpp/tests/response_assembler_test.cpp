#include <gtest/gtest.h>

#include <regex>
#include <set>

#include "response_assembler.hpp"
#include "test_support.hpp"

using namespace CropDoctor;
using CropDoctor::test_support::labelByKey;

namespace {

TreatmentPlan samplePlan() {
    TreatmentPlan plan;
    plan.cause = "Alternaria solani";
    plan.treatment = "Copper fungicide";
    plan.recommendations = {"Disease detected with 94.5% confidence"};
    plan.nextSteps = {"1. Apply recommended treatment within 48 hours"};
    return plan;
}

DetectionRequest tomatoRequest() {
    DetectionRequest request;
    request.cropHint = "Tomato";
    request.contentType = "image/jpeg";
    return request;
}

} // namespace

TEST(ResponseAssemblerTest, AssemblesAllFields) {
    ResponseAssembler assembler;
    ClassificationResult result{&labelByKey("Tomato___Early_blight"), 94.5049};

    DetectionResponse response = assembler.assemble(tomatoRequest(), result, SeverityTier::MODERATE,
                                                    samplePlan(), "fake classifier");
    EXPECT_EQ(response.cropType, "Tomato");
    EXPECT_EQ(response.cropDetected, "Tomato");
    EXPECT_EQ(response.diseaseLabel, "Tomato___Early_blight");
    EXPECT_EQ(response.diseaseName, "Tomato - Early Blight");
    EXPECT_EQ(response.conditionName, "Early Blight");
    EXPECT_FALSE(response.isHealthy);
    EXPECT_DOUBLE_EQ(response.confidencePercent, 94.5);
    EXPECT_EQ(response.severity, SeverityTier::MODERATE);
    EXPECT_EQ(response.cause, "Alternaria solani");
    EXPECT_EQ(response.modelUsed, "fake classifier");
    EXPECT_FALSE(response.cropMismatch.has_value());
}

TEST(ResponseAssemblerTest, DetectionIdsAreUuidV4) {
    const std::regex uuid("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        std::string id = ResponseAssembler::generateDetectionId();
        EXPECT_TRUE(std::regex_match(id, uuid)) << id;
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 100u);
}

TEST(ResponseAssemblerTest, TimestampIsIsoUtc) {
    const std::regex iso("^\\d{4}-\\d{2}-\\d{2}T\\d{2}:\\d{2}:\\d{2}\\.\\d{3}Z$");
    EXPECT_TRUE(std::regex_match(ResponseAssembler::currentTimestamp(), iso));
}

TEST(ResponseAssemblerTest, ConfidenceRounding) {
    EXPECT_DOUBLE_EQ(ResponseAssembler::roundConfidence(94.456), 94.46);
    EXPECT_DOUBLE_EQ(ResponseAssembler::roundConfidence(120.0), 100.0);
    EXPECT_DOUBLE_EQ(ResponseAssembler::roundConfidence(-3.0), 0.0);
}

TEST(ResponseAssemblerTest, FlagsCropMismatch) {
    ClassificationResult result{&labelByKey("Potato___Late_blight"), 90.0};

    DetectionResponse flagged = ResponseAssembler(true).assemble(tomatoRequest(), result, SeverityTier::SEVERE,
                                                                 samplePlan(), "fake");
    ASSERT_TRUE(flagged.cropMismatch.has_value());
    EXPECT_TRUE(*flagged.cropMismatch);
    EXPECT_EQ(flagged.cropDetected, "Potato");
    EXPECT_EQ(flagged.recommendations.size(), 2u);
    EXPECT_NE(flagged.recommendations.back().find("Potato"), std::string::npos);

    DetectionResponse quiet = ResponseAssembler(false).assemble(tomatoRequest(), result, SeverityTier::SEVERE,
                                                                samplePlan(), "fake");
    EXPECT_FALSE(quiet.cropMismatch.has_value());
    EXPECT_EQ(quiet.recommendations.size(), 1u);
}

TEST(ResponseAssemblerTest, BackgroundIsNeverAMismatch) {
    ClassificationResult result{&labelByKey("Background_without_leaves"), 80.0};
    DetectionResponse response = ResponseAssembler(true).assemble(tomatoRequest(), result, SeverityTier::NONE,
                                                                  samplePlan(), "fake");
    EXPECT_FALSE(response.cropMismatch.has_value());
    EXPECT_TRUE(response.isBackground);
}

TEST(ResponseAssemblerTest, MissingCropHintIsNeverAMismatch) {
    ClassificationResult result{&labelByKey("Tomato___Early_blight"), 94.5};
    for (const std::string hint : {"", "   "}) {
        DetectionRequest request = tomatoRequest();
        request.cropHint = hint;
        DetectionResponse response = ResponseAssembler(true).assemble(request, result, SeverityTier::MODERATE,
                                                                      samplePlan(), "fake");
        EXPECT_FALSE(response.cropMismatch.has_value()) << "hint '" << hint << "'";
        EXPECT_EQ(response.recommendations.size(), 1u);
        EXPECT_EQ(response.cropDetected, "Tomato");
    }
}

TEST(ResponseAssemblerTest, CropMatchingIgnoresCaseAndSpacing) {
    EXPECT_TRUE(ResponseAssembler::cropsMatch(" tomato ", "Tomato"));
    EXPECT_TRUE(ResponseAssembler::cropsMatch("PEPPER", "Pepper"));
    EXPECT_FALSE(ResponseAssembler::cropsMatch("Pepper bell", "Pepper"));
    EXPECT_FALSE(ResponseAssembler::cropsMatch("", "Tomato"));
}

TEST(ResponseAssemblerTest, JsonDocument) {
    ClassificationResult result{&labelByKey("Tomato___Early_blight"), 94.5};
    DetectionResponse response = ResponseAssembler().assemble(tomatoRequest(), result, SeverityTier::MODERATE,
                                                              samplePlan(), "fake");
    response.generatedAdvice = "Spray early.";

    nlohmann::json json = ResponseAssembler::toJson(response);
    EXPECT_EQ(json["severity"], "moderate");
    EXPECT_EQ(json["confidence"], 94.5);
    EXPECT_EQ(json["isHealthy"], false);
    EXPECT_TRUE(json["location"].is_null());
    EXPECT_EQ(json["generatedAdvice"], "Spray early.");
    EXPECT_FALSE(json.contains("cropMismatch"));
    EXPECT_EQ(json["recommendations"].size(), 1u);
}

TEST(ResponseAssemblerTest, ErrorDocuments) {
    nlohmann::json validation = ResponseAssembler::errorJson(
        ValidationError(ValidationReason::TOO_LARGE, "too big"));
    EXPECT_EQ(validation["error"]["kind"], "validation_error");
    EXPECT_EQ(validation["error"]["reason"], "TooLarge");
    EXPECT_EQ(validation["error"]["retryable"], false);

    nlohmann::json timeout = ResponseAssembler::errorJson(TimeoutError("slow"));
    EXPECT_EQ(timeout["error"]["kind"], "timeout");
    EXPECT_EQ(timeout["error"]["retryable"], true);
    EXPECT_FALSE(timeout["error"].contains("reason"));
}

TEST(ResponseAssemblerTest, FallbackDocumentIsClearlyMarked) {
    nlohmann::json fallback = ResponseAssembler::fallbackJson(tomatoRequest(), "Model file not found");
    EXPECT_EQ(fallback["diseaseLabel"], "MODEL_NOT_AVAILABLE");
    EXPECT_EQ(fallback["severity"], "unknown");
    EXPECT_TRUE(fallback["isHealthy"].is_null());
    EXPECT_EQ(fallback["confidence"], 0.0);
    EXPECT_FALSE(fallback["recommendations"].empty());
    EXPECT_EQ(fallback["error"]["kind"], "model_unavailable");
    EXPECT_EQ(fallback["error"]["message"], "Model file not found");
}
