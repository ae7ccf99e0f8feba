#pragma once

#include <optional>
#include <string>
#include <vector>

#include "class_labels.hpp"

namespace CropDoctor {

// Ordered: comparisons follow severity.
enum class SeverityTier {
    NONE = 0,
    MILD = 1,
    MODERATE = 2,
    SEVERE = 3
};

std::string severityToString(SeverityTier tier);

struct DetectionRequest {
    std::string imageBytes;
    std::string contentType;
    std::string cropHint;
    std::optional<std::string> location;
};

struct ClassificationResult {
    const ClassLabel* label = nullptr;
    double confidencePercent = 0.0;
};

struct DiseaseRecord {
    std::string label;
    std::string cause;
    std::string cure;
};

struct TreatmentPlan {
    std::string cause;
    std::string treatment;
    std::vector<std::string> recommendations;
    std::vector<std::string> nextSteps;
    std::optional<std::string> generatedAdvice;
};

struct DetectionResponse {
    std::string detectionId;
    std::string timestamp;
    std::string cropType;          // as declared by the caller
    std::string cropDetected;      // as classified; authoritative
    std::optional<std::string> location;
    std::string diseaseLabel;      // dataset key, e.g. "Tomato___Early_blight"
    std::string diseaseName;       // "Tomato - Early Blight"
    std::string conditionName;     // "Early Blight"
    bool isHealthy = false;
    bool isBackground = false;
    double confidencePercent = 0.0;
    SeverityTier severity = SeverityTier::NONE;
    std::string cause;
    std::string treatment;
    std::vector<std::string> recommendations;
    std::vector<std::string> nextSteps;
    std::optional<std::string> generatedAdvice;
    std::optional<bool> cropMismatch;
    std::string modelUsed;
};

} // namespace CropDoctor
