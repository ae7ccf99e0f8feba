#include "knowledge_base.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include "errors.hpp"

namespace CropDoctor {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

DiseaseKnowledgeBase::DiseaseKnowledgeBase(std::shared_ptr<const ClassLabelTable> labels)
    : labels_(std::move(labels)) {
    if (!labels_) {
        throw std::invalid_argument("Knowledge base needs a class label table");
    }
}

DiseaseKnowledgeBase DiseaseKnowledgeBase::loadFromFile(const std::string& path,
                                                        std::shared_ptr<const ClassLabelTable> labels) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open disease knowledge base: " + path);
    }

    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Disease knowledge base " + path + " is not valid JSON: " + e.what());
    }

    DiseaseKnowledgeBase kb = loadFromJson(json, std::move(labels));
    std::cout << "[INFO] Loaded " << kb.size() << " disease records from " << path << std::endl;
    return kb;
}

DiseaseKnowledgeBase DiseaseKnowledgeBase::loadFromJson(const nlohmann::json& json,
                                                        std::shared_ptr<const ClassLabelTable> labels) {
    if (!json.is_array()) {
        throw std::runtime_error("Disease knowledge base must be a JSON array");
    }

    DiseaseKnowledgeBase kb(std::move(labels));
    for (const auto& entry : json) {
        if (!entry.is_object()) continue;

        DiseaseRecord record;
        record.label = entry.value("name", "");
        record.cause = entry.value("cause", "");
        record.cure = entry.value("cure", "");

        const ClassLabel* label = kb.labels_->find(record.label);
        if (!label || !label->hasDiseaseIdentity()) {
            std::cerr << "[WARN] Ignoring knowledge-base entry for unknown disease: '" << record.label << "'" << std::endl;
            continue;
        }
        if (record.cause.empty() || record.cure.empty()) {
            std::cerr << "[WARN] Ignoring incomplete knowledge-base entry: " << record.label << std::endl;
            continue;
        }
        kb.records_[record.label] = record;
    }

    for (const auto& missing : kb.missingLabels()) {
        std::cerr << "[WARN] Knowledge base has no record for " << missing << std::endl;
    }
    return kb;
}

const DiseaseRecord& DiseaseKnowledgeBase::record(const ClassLabel& label) const {
    if (!label.hasDiseaseIdentity()) {
        throw std::invalid_argument("No disease record exists for label " + label.key);
    }
    auto it = records_.find(label.key);
    if (it == records_.end()) {
        throw UnknownLabelError(label.key);
    }
    return it->second;
}

bool DiseaseKnowledgeBase::contains(const std::string& labelKey) const {
    return records_.count(labelKey) > 0;
}

std::vector<KnownDisease> DiseaseKnowledgeBase::listDiseases(const std::string& cropFilter) const {
    const std::string filter = toLower(cropFilter);
    std::vector<KnownDisease> diseases;

    for (const auto& label : *labels_) {
        if (!label.hasDiseaseIdentity()) continue;
        if (!filter.empty() && toLower(label.crop).find(filter) == std::string::npos) continue;

        auto it = records_.find(label.key);
        if (it == records_.end()) continue;

        diseases.push_back(KnownDisease{
            label.key,
            label.displayName(),
            label.crop,
            it->second.cause,
            it->second.cure
        });
    }
    return diseases;
}

std::vector<std::string> DiseaseKnowledgeBase::missingLabels() const {
    std::vector<std::string> missing;
    for (const auto& label : *labels_) {
        if (label.hasDiseaseIdentity() && !contains(label.key)) {
            missing.push_back(label.key);
        }
    }
    return missing;
}

} // namespace CropDoctor
