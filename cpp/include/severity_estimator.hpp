#pragma once

#include "config_manager.hpp"
#include "detection_types.hpp"

namespace CropDoctor {

/**
 * Heuristic severity table. Healthy and background labels are always NONE;
 * every other label is graded by the first configured rule that lists its
 * category (or the fallback rule): >= severe threshold is SEVERE,
 * >= moderate threshold is MODERATE, anything lower is MILD.
 */
class SeverityEstimator {
public:
    explicit SeverityEstimator(const SeverityConfig& config);

    SeverityTier estimate(const ClassLabel& label, double confidencePercent) const;

    const SeverityRule& ruleFor(DiseaseCategory category) const;

private:
    SeverityConfig config_;
};

} // namespace CropDoctor
