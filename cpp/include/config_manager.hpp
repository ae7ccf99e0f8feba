#ifndef CONFIG_MANAGER_HPP
#define CONFIG_MANAGER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "class_labels.hpp"

namespace CropDoctor {

struct ModelConfig {
    std::string path = "models/plant_disease_recog_model_pwp.onnx";
    std::string backend = "onnxruntime";   // "onnxruntime" or "opencv"
    int input_size = 160;                  // square edge the network was trained on
    std::string layout = "NHWC";           // "NHWC" (Keras export) or "NCHW"
    float mean_value = 0.0f;
    float scale_value = 1.0f / 255.0f;
    int intra_op_threads = 1;
    bool load_at_startup = true;
};

struct ValidationConfig {
    double max_upload_mb = 10.0;
    std::size_t max_bytes = 10 * 1024 * 1024;
    std::size_t min_bytes = 1;
    std::vector<std::string> accepted_types = {
        "image/jpeg", "image/jpg", "image/png", "image/webp", "image/bmp"
    };
    bool require_crop_hint = true;
};

// Thresholds are confidence percentages. A rule without a severe threshold never yields "severe".
struct SeverityRule {
    std::vector<DiseaseCategory> categories;
    std::optional<double> severe_threshold;
    double moderate_threshold = 80.0;
};

struct SeverityConfig {
    std::vector<SeverityRule> rules;
    SeverityRule fallback;

    static SeverityConfig defaults();
};

struct AdviceConfig {
    bool enabled = false;
    std::string endpoint = "https://generativelanguage.googleapis.com";
    std::string model = "gemini-flash-latest";
    std::string api_key;
    int timeout_ms = 8000;
    std::size_t cache_size = 200;
    int max_output_tokens = 800;
};

struct RuntimeConfig {
    int worker_threads = 2;
    std::size_t queue_capacity = 16;
    int request_timeout_ms = 30000;
};

struct ServiceConfig {
    ModelConfig model;
    ValidationConfig validation;
    SeverityConfig severity = SeverityConfig::defaults();
    AdviceConfig advice;
    RuntimeConfig runtime;
    std::string class_labels_path = "data/class_labels.json";
    std::string knowledge_base_path = "data/plant_diseases.json";
    bool flag_crop_mismatch = true;
    std::string log_level = "INFO";
};

class ConfigManager {
private:
    nlohmann::json config_json;

    ServiceConfig service_config;

    bool is_loaded;

public:
    ConfigManager();
    ~ConfigManager();

    // Configuration loading and validation
    bool loadConfig(const std::string& config_path);
    bool loadFromJson(const nlohmann::json& json);
    bool validateConfig() const;
    std::vector<std::string> getValidationErrors() const;

    // MODEL_PATH, CLASS_LABELS_PATH, KNOWLEDGE_BASE_PATH, REQUEST_TIMEOUT_MS,
    // WORKER_THREADS, GEMINI_API_KEY, ADVICE_ENABLED
    void applyEnvironmentOverrides();

    const ServiceConfig& getServiceConfig() const;
    ServiceConfig& mutableServiceConfig();

    bool isLoaded() const { return is_loaded; }
    bool isDebugMode() const;
    std::string getLogLevel() const;

private:
    void parseConfig();
    void parseModelConfig();
    void parseValidationConfig();
    void parseSeverityConfig();
    void parseAdviceConfig();
    void parseRuntimeConfig();

    static SeverityRule parseSeverityRule(const nlohmann::json& rule_json, const SeverityRule& defaults);
};

} // namespace CropDoctor

#endif // CONFIG_MANAGER_HPP
