#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "advice_generator.hpp"
#include "detection_types.hpp"
#include "knowledge_base.hpp"

namespace CropDoctor {

/**
 * Builds the treatment part of a detection: cause and cure from the
 * knowledge base, deterministic recommendations and next steps from
 * severity, and, when an advice generator is attached, a generated
 * narrative for diseased results.
 *
 * A failing advice generator never fails the plan; generatedAdvice is
 * simply left empty. The advice call gets advice.timeout_ms or whatever is
 * left until the request deadline, whichever is shorter, and is skipped once
 * the deadline has passed.
 */
class TreatmentAdvisor {
public:
    using Clock = std::chrono::steady_clock;

    TreatmentAdvisor(const DiseaseKnowledgeBase& knowledgeBase,
                     std::shared_ptr<AdviceGenerator> adviceGenerator = nullptr,
                     std::chrono::milliseconds adviceTimeout = std::chrono::milliseconds(8000));

    // Throws UnknownLabelError when a disease label has no knowledge-base record.
    TreatmentPlan advise(const ClassificationResult& result,
                         SeverityTier severity,
                         const std::optional<std::string>& location,
                         std::optional<Clock::time_point> deadline = std::nullopt) const;

    static std::vector<std::string> recommendations(const ClassLabel& label,
                                                    SeverityTier severity,
                                                    double confidencePercent);
    static std::vector<std::string> nextSteps(const ClassLabel& label, SeverityTier severity);

    bool hasAdviceGenerator() const { return adviceGenerator_ != nullptr; }

private:
    std::optional<std::string> generatedAdvice(const ClassificationResult& result,
                                               SeverityTier severity,
                                               const std::optional<std::string>& location,
                                               std::optional<Clock::time_point> deadline) const;

    const DiseaseKnowledgeBase& knowledgeBase_;
    std::shared_ptr<AdviceGenerator> adviceGenerator_;
    std::chrono::milliseconds adviceTimeout_;
};

} // namespace CropDoctor
