#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "detection_types.hpp"

namespace CropDoctor {

struct KnownDisease {
    std::string label;   // dataset key
    std::string name;    // display name
    std::string crop;
    std::string cause;
    std::string cure;
};

/**
 * Read-only cause/cure table keyed by disease label. Built once at startup
 * from a JSON array of {"name", "cause", "cure"} objects and never modified.
 */
class DiseaseKnowledgeBase {
public:
    // An empty knowledge base over the given label table.
    explicit DiseaseKnowledgeBase(std::shared_ptr<const ClassLabelTable> labels);

    // Throws std::runtime_error when the file cannot be read or is not a JSON array.
    static DiseaseKnowledgeBase loadFromFile(const std::string& path,
                                             std::shared_ptr<const ClassLabelTable> labels);
    static DiseaseKnowledgeBase loadFromJson(const nlohmann::json& json,
                                             std::shared_ptr<const ClassLabelTable> labels);

    // Throws UnknownLabelError for a disease without record, std::invalid_argument
    // for healthy or background labels.
    const DiseaseRecord& record(const ClassLabel& label) const;

    bool contains(const std::string& labelKey) const;
    size_t size() const { return records_.size(); }

    // Disease labels in classifier order; cropFilter is a case-insensitive substring of the crop.
    std::vector<KnownDisease> listDiseases(const std::string& cropFilter = "") const;

    // Disease labels that have no record. Empty for a complete knowledge base.
    std::vector<std::string> missingLabels() const;

    const ClassLabelTable& labels() const { return *labels_; }
    std::shared_ptr<const ClassLabelTable> sharedLabels() const { return labels_; }

private:
    std::shared_ptr<const ClassLabelTable> labels_;
    std::map<std::string, DiseaseRecord> records_;
};

} // namespace CropDoctor
