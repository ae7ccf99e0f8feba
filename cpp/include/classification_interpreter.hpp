#pragma once

#include <memory>
#include <vector>

#include "detection_types.hpp"

namespace CropDoctor {

/**
 * Maps a probability vector onto the fixed label table.
 *
 * The winning class is the highest probability; on exact ties the lower
 * index wins. Throws ClassifierError when the vector does not have one entry
 * per class or carries no finite value.
 */
class ClassificationInterpreter {
public:
    explicit ClassificationInterpreter(std::shared_ptr<const ClassLabelTable> labels)
        : labels_(std::move(labels)) {}

    ClassificationResult interpret(const std::vector<float>& probabilities) const;

private:
    std::shared_ptr<const ClassLabelTable> labels_;
};

} // namespace CropDoctor
