#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "detection_types.hpp"
#include "errors.hpp"

namespace CropDoctor {

/**
 * Composes the final DetectionResponse and renders responses, errors and
 * the model-unavailable fallback as JSON documents.
 */
class ResponseAssembler {
public:
    explicit ResponseAssembler(bool flagCropMismatch = true);

    DetectionResponse assemble(const DetectionRequest& request,
                               const ClassificationResult& result,
                               SeverityTier severity,
                               TreatmentPlan plan,
                               const std::string& modelUsed) const;

    static nlohmann::json toJson(const DetectionResponse& response);
    // {"error": {"kind", "reason"?, "message", "retryable"}}
    static nlohmann::json errorJson(const DetectionError& error);
    // Clearly marked placeholder result returned when no classifier could be loaded.
    static nlohmann::json fallbackJson(const DetectionRequest& request, const std::string& reason);

    static std::string generateDetectionId();
    static std::string currentTimestamp();
    static double roundConfidence(double confidencePercent);
    // Case-insensitive, ignores surrounding whitespace and '_' vs ' '.
    static bool cropsMatch(const std::string& declared, const std::string& detected);

private:
    bool flagCropMismatch_;
};

} // namespace CropDoctor
