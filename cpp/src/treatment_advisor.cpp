#include "treatment_advisor.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "errors.hpp"

namespace CropDoctor {

namespace {

const char* const BACKGROUND_CAUSE = "No plant leaf was found in the image.";
const char* const BACKGROUND_TREATMENT = "Take a new photo of a single affected leaf in good light.";
const char* const HEALTHY_CAUSE = "No disease detected.";
const char* const HEALTHY_TREATMENT = "No treatment needed. Keep following good crop care practices.";

std::string formatPercent(double value) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << value;
    return out.str();
}

} // namespace

TreatmentAdvisor::TreatmentAdvisor(const DiseaseKnowledgeBase& knowledgeBase,
                                   std::shared_ptr<AdviceGenerator> adviceGenerator,
                                   std::chrono::milliseconds adviceTimeout)
    : knowledgeBase_(knowledgeBase),
      adviceGenerator_(std::move(adviceGenerator)),
      adviceTimeout_(adviceTimeout) {}

TreatmentPlan TreatmentAdvisor::advise(const ClassificationResult& result,
                                       SeverityTier severity,
                                       const std::optional<std::string>& location,
                                       std::optional<Clock::time_point> deadline) const {
    const ClassLabel& label = *result.label;

    TreatmentPlan plan;
    if (label.isBackground) {
        plan.cause = BACKGROUND_CAUSE;
        plan.treatment = BACKGROUND_TREATMENT;
    } else if (label.isHealthy) {
        plan.cause = HEALTHY_CAUSE;
        plan.treatment = HEALTHY_TREATMENT;
    } else {
        const DiseaseRecord& record = knowledgeBase_.record(label);
        plan.cause = record.cause;
        plan.treatment = record.cure;
    }

    plan.recommendations = recommendations(label, severity, result.confidencePercent);
    plan.nextSteps = nextSteps(label, severity);

    if (label.hasDiseaseIdentity()) {
        plan.generatedAdvice = generatedAdvice(result, severity, location, deadline);
    }
    return plan;
}

std::vector<std::string> TreatmentAdvisor::recommendations(const ClassLabel& label,
                                                           SeverityTier severity,
                                                           double confidencePercent) {
    if (label.isBackground) {
        return {"No plant leaf detected. Please re-upload a clearer image of the affected plant leaf."};
    }

    const std::string& crop = label.crop;
    if (label.isHealthy) {
        return {
            "Your " + crop + " plant appears healthy!",
            "Continue current care practices",
            "Monitor regularly for any changes",
            "Maintain proper watering and fertilization"
        };
    }

    std::vector<std::string> items;
    items.push_back("Disease detected with " + formatPercent(confidencePercent) + "% confidence");

    switch (severity) {
        case SeverityTier::SEVERE:
            items.push_back("URGENT: Immediate action required");
            items.push_back("Inspect entire " + crop + " field for similar symptoms");
            items.push_back("Isolate affected plants immediately");
            items.push_back("Contact local agricultural extension officer");
            break;
        case SeverityTier::MODERATE:
            items.push_back("Monitor your " + crop + " plants closely");
            items.push_back("Begin treatment within 24-48 hours");
            items.push_back("Check neighboring plants for symptoms");
            items.push_back("Document affected area for tracking");
            break;
        default:
            items.push_back("Monitor " + crop + " plants daily");
            items.push_back("Early intervention can prevent spread");
            items.push_back("Consider preventive treatment for nearby plants");
            break;
    }
    return items;
}

std::vector<std::string> TreatmentAdvisor::nextSteps(const ClassLabel& label, SeverityTier severity) {
    if (label.isBackground) {
        return {
            "1. Photograph one affected leaf against a plain background",
            "2. Make sure the leaf fills most of the frame and is in focus",
            "3. Upload the new photo"
        };
    }
    if (label.isHealthy) {
        return {
            "Continue regular monitoring",
            "Maintain good agricultural practices",
            "Keep records of plant health"
        };
    }

    switch (severity) {
        case SeverityTier::SEVERE:
            return {
                "1. Apply recommended treatment immediately",
                "2. Remove and destroy severely affected plant parts",
                "3. Prevent spread to healthy plants",
                "4. Consult agricultural expert if condition worsens",
                "5. Monitor daily for the next week"
            };
        case SeverityTier::MODERATE:
            return {
                "1. Apply recommended treatment within 48 hours",
                "2. Monitor affected plants twice daily",
                "3. Isolate affected area if possible",
                "4. Document progression with photos"
            };
        default:
            return {
                "1. Apply preventive treatment",
                "2. Monitor daily for changes",
                "3. Maintain good field hygiene",
                "4. Keep records for future reference"
            };
    }
}

std::optional<std::string> TreatmentAdvisor::generatedAdvice(const ClassificationResult& result,
                                                             SeverityTier severity,
                                                             const std::optional<std::string>& location,
                                                             std::optional<Clock::time_point> deadline) const {
    if (!adviceGenerator_) {
        return std::nullopt;
    }

    std::chrono::milliseconds timeout = adviceTimeout_;
    if (deadline) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now());
        if (left.count() <= 0) {
            std::cerr << "[WARN] Skipping generated advice: request deadline reached" << std::endl;
            return std::nullopt;
        }
        timeout = std::min(timeout, left);
    }

    AdviceContext context;
    context.crop = result.label->crop;
    context.condition = result.label->condition;
    context.severity = severity;
    context.confidencePercent = result.confidencePercent;
    context.location = location;

    try {
        return adviceGenerator_->generateAdvice(context, timeout);
    } catch (const AdviceUnavailableError& e) {
        std::cerr << "[WARN] Generated advice unavailable: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[WARN] Advice generator failed: " << e.what() << std::endl;
    }
    return std::nullopt;
}

} // namespace CropDoctor
