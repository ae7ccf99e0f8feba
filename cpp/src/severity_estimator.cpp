#include "severity_estimator.hpp"

#include <algorithm>

namespace CropDoctor {

std::string severityToString(SeverityTier tier) {
    switch (tier) {
        case SeverityTier::NONE: return "none";
        case SeverityTier::MILD: return "mild";
        case SeverityTier::MODERATE: return "moderate";
        case SeverityTier::SEVERE: return "severe";
    }
    return "none";
}

SeverityEstimator::SeverityEstimator(const SeverityConfig& config) : config_(config) {}

const SeverityRule& SeverityEstimator::ruleFor(DiseaseCategory category) const {
    for (const auto& rule : config_.rules) {
        if (std::find(rule.categories.begin(), rule.categories.end(), category) != rule.categories.end()) {
            return rule;
        }
    }
    return config_.fallback;
}

SeverityTier SeverityEstimator::estimate(const ClassLabel& label, double confidencePercent) const {
    if (!label.hasDiseaseIdentity()) {
        return SeverityTier::NONE;
    }

    const SeverityRule& rule = ruleFor(label.category);
    if (rule.severe_threshold && confidencePercent >= *rule.severe_threshold) {
        return SeverityTier::SEVERE;
    }
    if (confidencePercent >= rule.moderate_threshold) {
        return SeverityTier::MODERATE;
    }
    return SeverityTier::MILD;
}

} // namespace CropDoctor
