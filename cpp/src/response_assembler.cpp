#include "response_assembler.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace CropDoctor {

namespace {

std::string normalizeCrop(const std::string& value) {
    size_t begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t\r\n");

    std::string out = value.substr(begin, end - begin + 1);
    for (auto& c : out) {
        c = (c == '_') ? ' ' : static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

nlohmann::json optionalString(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

ResponseAssembler::ResponseAssembler(bool flagCropMismatch) : flagCropMismatch_(flagCropMismatch) {}

DetectionResponse ResponseAssembler::assemble(const DetectionRequest& request,
                                              const ClassificationResult& result,
                                              SeverityTier severity,
                                              TreatmentPlan plan,
                                              const std::string& modelUsed) const {
    const ClassLabel& label = *result.label;

    DetectionResponse response;
    response.detectionId = generateDetectionId();
    response.timestamp = currentTimestamp();
    response.cropType = request.cropHint;
    response.cropDetected = label.crop;
    response.location = request.location;
    response.diseaseLabel = label.key;
    response.diseaseName = label.displayName();
    response.conditionName = label.condition;
    response.isHealthy = label.isHealthy;
    response.isBackground = label.isBackground;
    response.confidencePercent = roundConfidence(result.confidencePercent);
    response.severity = severity;
    response.cause = std::move(plan.cause);
    response.treatment = std::move(plan.treatment);
    response.recommendations = std::move(plan.recommendations);
    response.nextSteps = std::move(plan.nextSteps);
    response.generatedAdvice = std::move(plan.generatedAdvice);
    response.modelUsed = modelUsed;

    // Without a declared crop there is nothing to contradict.
    const bool hintGiven = !normalizeCrop(request.cropHint).empty();
    if (flagCropMismatch_ && hintGiven && !label.isBackground && !cropsMatch(request.cropHint, label.crop)) {
        response.cropMismatch = true;
        response.recommendations.push_back(
            "The photo looks like a " + label.crop + " leaf, not " + request.cropHint +
            ". Results are reported for " + label.crop + "; re-upload if this is wrong.");
    }

    if (response.recommendations.empty()) {
        response.recommendations.push_back("Consult a local agricultural expert for a manual diagnosis.");
    }
    return response;
}

nlohmann::json ResponseAssembler::toJson(const DetectionResponse& response) {
    nlohmann::json json = {
        {"detectionId", response.detectionId},
        {"timestamp", response.timestamp},
        {"cropType", response.cropType},
        {"cropDetected", response.cropDetected},
        {"location", optionalString(response.location)},
        {"diseaseLabel", response.diseaseLabel},
        {"diseaseName", response.diseaseName},
        {"conditionName", response.conditionName},
        {"isHealthy", response.isHealthy},
        {"isBackground", response.isBackground},
        {"confidence", response.confidencePercent},
        {"severity", severityToString(response.severity)},
        {"cause", response.cause},
        {"treatment", response.treatment},
        {"recommendations", response.recommendations},
        {"nextSteps", response.nextSteps},
        {"modelUsed", response.modelUsed}
    };
    if (response.generatedAdvice) {
        json["generatedAdvice"] = *response.generatedAdvice;
    }
    if (response.cropMismatch) {
        json["cropMismatch"] = *response.cropMismatch;
    }
    return json;
}

nlohmann::json ResponseAssembler::errorJson(const DetectionError& error) {
    nlohmann::json body = {
        {"kind", errorKindToString(error.kind())},
        {"message", error.what()},
        {"retryable", error.retryable()}
    };
    if (const auto* validation = dynamic_cast<const ValidationError*>(&error)) {
        body["reason"] = validationReasonToString(validation->reason());
    }
    return {{"error", body}};
}

nlohmann::json ResponseAssembler::fallbackJson(const DetectionRequest& request, const std::string& reason) {
    return {
        {"detectionId", generateDetectionId()},
        {"timestamp", currentTimestamp()},
        {"cropType", request.cropHint},
        {"location", optionalString(request.location)},
        {"diseaseLabel", "MODEL_NOT_AVAILABLE"},
        {"diseaseName", "Unable to detect disease"},
        {"isHealthy", nullptr},
        {"confidence", 0.0},
        {"severity", "unknown"},
        {"cause", "Classifier model not loaded"},
        {"treatment", "Make sure the model file exists at the configured model path and restart the service."},
        {"recommendations", {
            "Disease detection is not available right now. Please contact the administrator.",
            "The model file may be missing from the configured model path",
            "Fallback: consult a local agricultural expert for a manual diagnosis"
        }},
        {"nextSteps", {
            "1. Place the model file at the configured path",
            "2. Reload the model or restart the service",
            "3. For immediate help, consult an agricultural expert"
        }},
        {"modelUsed", "Fallback (model not loaded)"},
        {"error", {
            {"kind", errorKindToString(ErrorKind::MODEL_UNAVAILABLE)},
            {"message", reason},
            {"retryable", false}
        }}
    };
}

std::string ResponseAssembler::generateDetectionId() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dist;

    uint64_t high = dist(rng);
    uint64_t low = dist(rng);
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;   // version 4
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;     // RFC 4122 variant

    std::ostringstream out;
    out << std::hex << std::setfill('0')
        << std::setw(8) << (high >> 32) << '-'
        << std::setw(4) << ((high >> 16) & 0xFFFF) << '-'
        << std::setw(4) << (high & 0xFFFF) << '-'
        << std::setw(4) << (low >> 48) << '-'
        << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
    return out.str();
}

std::string ResponseAssembler::currentTimestamp() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis << 'Z';
    return out.str();
}

double ResponseAssembler::roundConfidence(double confidencePercent) {
    double clamped = std::clamp(confidencePercent, 0.0, 100.0);
    return std::round(clamped * 100.0) / 100.0;
}

bool ResponseAssembler::cropsMatch(const std::string& declared, const std::string& detected) {
    return normalizeCrop(declared) == normalizeCrop(detected);
}

} // namespace CropDoctor
