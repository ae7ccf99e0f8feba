#include "classification_interpreter.hpp"

#include <algorithm>
#include <cmath>

#include "errors.hpp"

namespace CropDoctor {

ClassificationResult ClassificationInterpreter::interpret(const std::vector<float>& probabilities) const {
    if (probabilities.size() != labels_->size()) {
        throw ClassifierError("Classifier returned " + std::to_string(probabilities.size()) +
                              " scores, expected " + std::to_string(labels_->size()));
    }

    int bestIndex = -1;
    float bestScore = 0.0f;
    for (size_t i = 0; i < probabilities.size(); ++i) {
        const float p = probabilities[i];
        if (!std::isfinite(p)) continue;
        // strict comparison keeps the lower index on ties
        if (bestIndex < 0 || p > bestScore) {
            bestIndex = static_cast<int>(i);
            bestScore = p;
        }
    }
    if (bestIndex < 0) {
        throw ClassifierError("Classifier returned no finite scores");
    }

    ClassificationResult result;
    result.label = &labels_->at(static_cast<size_t>(bestIndex));
    result.confidencePercent = std::clamp(static_cast<double>(bestScore) * 100.0, 0.0, 100.0);
    return result;
}

} // namespace CropDoctor
