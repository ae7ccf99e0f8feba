#include "class_labels.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <set>
#include <stdexcept>

#include "errors.hpp"

namespace CropDoctor {

namespace {

ClassLabel parseLabel(const nlohmann::json& entry, std::size_t position) {
    const std::string where = "class label " + std::to_string(position);
    if (!entry.is_object()) {
        throw ConfigError(where + " is not an object");
    }

    ClassLabel label;
    try {
        label.index = entry.at("index").get<std::size_t>();
        label.key = entry.at("key").get<std::string>();
        label.crop = entry.value("crop", "");
        label.condition = entry.at("condition").get<std::string>();
        label.isHealthy = entry.value("healthy", false);
        label.isBackground = entry.value("background", false);
        label.category = categoryFromString(entry.at("category").get<std::string>());
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(where + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw ConfigError(where + ": " + e.what());
    }

    if (label.index != position) {
        throw ConfigError(where + " has index " + std::to_string(label.index) +
                          "; entries must be listed in classifier order");
    }
    if (label.key.empty() || label.condition.empty()) {
        throw ConfigError(where + " needs a key and a condition");
    }
    if (label.isHealthy && label.isBackground) {
        throw ConfigError(label.key + " cannot be both healthy and background");
    }
    if (label.isBackground != label.crop.empty()) {
        throw ConfigError(label.key + ": only the background entry has no crop");
    }
    if (label.hasDiseaseIdentity() == (label.category == DiseaseCategory::NONE)) {
        throw ConfigError(label.key + ": diseases need a category, healthy and background entries use 'none'");
    }
    return label;
}

} // namespace

std::string categoryToString(DiseaseCategory category) {
    switch (category) {
        case DiseaseCategory::NONE: return "none";
        case DiseaseCategory::FUNGAL: return "fungal";
        case DiseaseCategory::BACTERIAL: return "bacterial";
        case DiseaseCategory::VIRAL: return "viral";
        case DiseaseCategory::ROT: return "rot";
        case DiseaseCategory::BLIGHT: return "blight";
        case DiseaseCategory::PEST: return "pest";
    }
    return "none";
}

DiseaseCategory categoryFromString(const std::string& name) {
    static const DiseaseCategory all[] = {
        DiseaseCategory::NONE, DiseaseCategory::FUNGAL, DiseaseCategory::BACTERIAL,
        DiseaseCategory::VIRAL, DiseaseCategory::ROT, DiseaseCategory::BLIGHT,
        DiseaseCategory::PEST
    };
    for (DiseaseCategory category : all) {
        if (categoryToString(category) == name) {
            return category;
        }
    }
    throw std::invalid_argument("Unknown disease category: " + name);
}

std::string ClassLabel::displayName() const {
    if (isBackground) {
        return condition;
    }
    return crop + " - " + condition;
}

ClassLabelTable ClassLabelTable::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Failed to open class label table: " + path);
    }

    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Class label table " + path + " is not valid JSON: " + e.what());
    }

    ClassLabelTable table = loadFromJson(json);
    std::cout << "[INFO] Loaded " << table.size() << " class labels from " << path << std::endl;
    return table;
}

ClassLabelTable ClassLabelTable::loadFromJson(const nlohmann::json& json) {
    if (!json.is_array()) {
        throw ConfigError("Class label table must be a JSON array");
    }
    if (json.size() != CLASS_COUNT) {
        throw ConfigError("Class label table has " + std::to_string(json.size()) +
                          " entries, the classifier outputs " + std::to_string(CLASS_COUNT));
    }

    ClassLabelTable table;
    std::set<std::string> keys;
    std::size_t backgrounds = 0;
    for (std::size_t i = 0; i < json.size(); ++i) {
        ClassLabel label = parseLabel(json[i], i);
        if (!keys.insert(label.key).second) {
            throw ConfigError("Duplicate class label key: " + label.key);
        }
        if (label.isBackground) {
            backgrounds++;
        }
        table.labels_.push_back(std::move(label));
    }
    if (backgrounds != 1) {
        throw ConfigError("Class label table must have exactly one background entry, found " +
                          std::to_string(backgrounds));
    }
    return table;
}

const ClassLabel& ClassLabelTable::at(std::size_t index) const {
    if (index >= labels_.size()) {
        throw std::out_of_range("Class index out of range: " + std::to_string(index));
    }
    return labels_[index];
}

const ClassLabel* ClassLabelTable::find(const std::string& key) const {
    auto it = std::find_if(labels_.begin(), labels_.end(),
        [&key](const ClassLabel& label) { return label.key == key; });
    return (it != labels_.end()) ? &(*it) : nullptr;
}

std::vector<std::string> ClassLabelTable::crops() const {
    std::set<std::string> crops;
    for (const auto& label : labels_) {
        if (!label.isBackground) {
            crops.insert(label.crop);
        }
    }
    return std::vector<std::string>(crops.begin(), crops.end());
}

} // namespace CropDoctor
