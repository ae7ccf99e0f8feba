#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace CropDoctor {

enum class DiseaseCategory {
    NONE,       // healthy leaves and background
    FUNGAL,
    BACTERIAL,
    VIRAL,
    ROT,
    BLIGHT,
    PEST
};

std::string categoryToString(DiseaseCategory category);
// Throws std::invalid_argument for names other than those produced by categoryToString.
DiseaseCategory categoryFromString(const std::string& name);

/**
 * One of the fixed classes the leaf classifier can output.
 *
 * index is the position in the classifier's probability vector. key is the
 * dataset label the model was trained with and doubles as the knowledge-base key.
 */
struct ClassLabel {
    std::size_t index;
    std::string key;
    std::string crop;
    std::string condition;
    bool isHealthy;
    bool isBackground;
    DiseaseCategory category;

    // True for labels that name an actual disease (and so have a knowledge-base record).
    bool hasDiseaseIdentity() const { return !isHealthy && !isBackground; }

    // "Tomato - Early Blight", "Background"
    std::string displayName() const;
};

// Width of the classifier's output layer.
constexpr std::size_t CLASS_COUNT = 39;

/**
 * The closed label set, loaded once from class_labels.json and never mutated.
 *
 * The file is a JSON array in classifier order of
 * {"index", "key", "crop", "condition", "category", "healthy", "background"}
 * objects. Loading rejects a table that does not have exactly CLASS_COUNT
 * entries in index order, repeats a key, has other than one background entry,
 * or gives a category that contradicts the healthy/background flags.
 */
class ClassLabelTable {
public:
    // Both throw ConfigError.
    static ClassLabelTable loadFromFile(const std::string& path);
    static ClassLabelTable loadFromJson(const nlohmann::json& json);

    // Throws std::out_of_range for index >= size().
    const ClassLabel& at(std::size_t index) const;

    // nullptr when no label has this key.
    const ClassLabel* find(const std::string& key) const;

    // Sorted, de-duplicated crop names. Background is not a crop.
    std::vector<std::string> crops() const;

    std::size_t size() const { return labels_.size(); }
    std::vector<ClassLabel>::const_iterator begin() const { return labels_.begin(); }
    std::vector<ClassLabel>::const_iterator end() const { return labels_.end(); }

private:
    std::vector<ClassLabel> labels_;
};

} // namespace CropDoctor
