#include "config_manager.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace CropDoctor {

namespace {

int getenv_int(const char* key, int def) {
    const char* v = std::getenv(key);
    return v ? std::atoi(v) : def;
}

std::string getenv_str(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

bool getenv_bool(const char* key, bool def) {
    const char* v = std::getenv(key);
    if (!v) return def;
    std::string s(v);
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s == "1" || s == "true" || s == "yes" || s == "on";
}

bool inPercentRange(double value) {
    return value >= 0.0 && value <= 100.0;
}

} // namespace

SeverityConfig SeverityConfig::defaults() {
    SeverityConfig config;

    SeverityRule high_impact;
    high_impact.categories = {DiseaseCategory::ROT, DiseaseCategory::BLIGHT, DiseaseCategory::VIRAL};
    high_impact.severe_threshold = 85.0;
    high_impact.moderate_threshold = 70.0;

    SeverityRule infectious;
    infectious.categories = {DiseaseCategory::FUNGAL, DiseaseCategory::BACTERIAL};
    infectious.moderate_threshold = 80.0;

    config.rules = {high_impact, infectious};
    config.fallback.moderate_threshold = 80.0;
    return config;
}

ConfigManager::ConfigManager() : is_loaded(false) {}

ConfigManager::~ConfigManager() {}

bool ConfigManager::loadConfig(const std::string& config_path) {
    try {
        std::ifstream config_file(config_path);
        if (!config_file.is_open()) {
            std::cerr << "[ERROR] Failed to open config file: " << config_path << std::endl;
            return false;
        }

        nlohmann::json parsed;
        config_file >> parsed;
        config_file.close();

        if (!loadFromJson(parsed)) {
            return false;
        }

        std::cout << "[INFO] Configuration loaded from: " << config_path << std::endl;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Error loading configuration: " << e.what() << std::endl;
        return false;
    }
}

bool ConfigManager::loadFromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        std::cerr << "[ERROR] Configuration root must be a JSON object" << std::endl;
        return false;
    }

    const ServiceConfig previous = service_config;
    const nlohmann::json previous_json = config_json;
    try {
        config_json = json;
        service_config = ServiceConfig();
        parseConfig();
        is_loaded = true;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Invalid configuration: " << e.what() << std::endl;
        service_config = previous;
        config_json = previous_json;
        return false;
    }
}

void ConfigManager::parseConfig() {
    parseModelConfig();
    parseValidationConfig();
    parseSeverityConfig();
    parseAdviceConfig();
    parseRuntimeConfig();

    if (config_json.contains("class_labels")) {
        service_config.class_labels_path = config_json["class_labels"].value("path", service_config.class_labels_path);
    }
    if (config_json.contains("knowledge_base")) {
        service_config.knowledge_base_path = config_json["knowledge_base"].value("path", service_config.knowledge_base_path);
    }
    service_config.flag_crop_mismatch = config_json.value("flag_crop_mismatch", service_config.flag_crop_mismatch);
    service_config.log_level = config_json.value("log_level", service_config.log_level);
}

void ConfigManager::parseModelConfig() {
    if (!config_json.contains("model")) return;

    const auto& model = config_json["model"];
    ModelConfig& config = service_config.model;
    config.path = model.value("path", config.path);
    config.backend = model.value("backend", config.backend);
    config.input_size = model.value("input_size", config.input_size);
    config.layout = model.value("layout", config.layout);
    config.mean_value = model.value("mean", config.mean_value);
    config.scale_value = model.value("scale", config.scale_value);
    config.intra_op_threads = model.value("intra_op_threads", config.intra_op_threads);
    config.load_at_startup = model.value("load_at_startup", config.load_at_startup);
}

void ConfigManager::parseValidationConfig() {
    if (!config_json.contains("validation")) return;

    const auto& validation = config_json["validation"];
    ValidationConfig& config = service_config.validation;

    if (validation.contains("max_upload_mb")) {
        config.max_upload_mb = validation["max_upload_mb"].get<double>();
        // non-positive limits are reported by getValidationErrors()
        config.max_bytes = config.max_upload_mb > 0.0
            ? static_cast<std::size_t>(config.max_upload_mb * 1024.0 * 1024.0)
            : 0;
    }
    config.min_bytes = validation.value("min_upload_bytes", config.min_bytes);
    if (validation.contains("accepted_types")) {
        config.accepted_types = validation["accepted_types"].get<std::vector<std::string>>();
    }
    config.require_crop_hint = validation.value("require_crop_hint", config.require_crop_hint);
}

SeverityRule ConfigManager::parseSeverityRule(const nlohmann::json& rule_json, const SeverityRule& defaults) {
    SeverityRule rule = defaults;
    if (rule_json.contains("categories")) {
        rule.categories.clear();
        for (const auto& name : rule_json["categories"]) {
            rule.categories.push_back(categoryFromString(name.get<std::string>()));
        }
    }
    if (rule_json.contains("severe")) {
        if (rule_json["severe"].is_null()) {
            rule.severe_threshold.reset();
        } else {
            rule.severe_threshold = rule_json["severe"].get<double>();
        }
    }
    rule.moderate_threshold = rule_json.value("moderate", rule.moderate_threshold);
    return rule;
}

void ConfigManager::parseSeverityConfig() {
    if (!config_json.contains("severity")) return;

    const auto& severity = config_json["severity"];
    SeverityConfig& config = service_config.severity;

    if (severity.contains("rules")) {
        config.rules.clear();
        for (const auto& rule_json : severity["rules"]) {
            config.rules.push_back(parseSeverityRule(rule_json, SeverityRule()));
        }
    }
    if (severity.contains("fallback")) {
        config.fallback = parseSeverityRule(severity["fallback"], config.fallback);
        config.fallback.categories.clear();
    }
}

void ConfigManager::parseAdviceConfig() {
    if (!config_json.contains("advice")) return;

    const auto& advice = config_json["advice"];
    AdviceConfig& config = service_config.advice;
    config.enabled = advice.value("enabled", config.enabled);
    config.endpoint = advice.value("endpoint", config.endpoint);
    config.model = advice.value("model", config.model);
    config.api_key = advice.value("api_key", config.api_key);
    config.timeout_ms = advice.value("timeout_ms", config.timeout_ms);
    config.cache_size = advice.value("cache_size", config.cache_size);
    config.max_output_tokens = advice.value("max_output_tokens", config.max_output_tokens);
}

void ConfigManager::parseRuntimeConfig() {
    if (!config_json.contains("runtime")) return;

    const auto& runtime = config_json["runtime"];
    RuntimeConfig& config = service_config.runtime;
    config.worker_threads = runtime.value("worker_threads", config.worker_threads);
    config.queue_capacity = runtime.value("queue_capacity", config.queue_capacity);
    config.request_timeout_ms = runtime.value("request_timeout_ms", config.request_timeout_ms);
}

void ConfigManager::applyEnvironmentOverrides() {
    service_config.model.path = getenv_str("MODEL_PATH", service_config.model.path);
    service_config.class_labels_path = getenv_str("CLASS_LABELS_PATH", service_config.class_labels_path);
    service_config.knowledge_base_path = getenv_str("KNOWLEDGE_BASE_PATH", service_config.knowledge_base_path);
    service_config.runtime.request_timeout_ms = getenv_int("REQUEST_TIMEOUT_MS", service_config.runtime.request_timeout_ms);
    service_config.runtime.worker_threads = getenv_int("WORKER_THREADS", service_config.runtime.worker_threads);
    service_config.advice.api_key = getenv_str("GEMINI_API_KEY", service_config.advice.api_key);
    service_config.advice.enabled = getenv_bool("ADVICE_ENABLED", service_config.advice.enabled);
}

const ServiceConfig& ConfigManager::getServiceConfig() const {
    return service_config;
}

ServiceConfig& ConfigManager::mutableServiceConfig() {
    return service_config;
}

bool ConfigManager::isDebugMode() const {
    return getLogLevel() == "DEBUG";
}

std::string ConfigManager::getLogLevel() const {
    return service_config.log_level;
}

bool ConfigManager::validateConfig() const {
    return getValidationErrors().empty();
}

std::vector<std::string> ConfigManager::getValidationErrors() const {
    std::vector<std::string> errors;
    const ServiceConfig& cfg = service_config;

    if (cfg.model.path.empty()) {
        errors.push_back("model.path must not be empty");
    }
    if (cfg.model.backend != "onnxruntime" && cfg.model.backend != "opencv") {
        errors.push_back("model.backend must be 'onnxruntime' or 'opencv', got '" + cfg.model.backend + "'");
    }
    if (cfg.model.input_size <= 0) {
        errors.push_back("model.input_size must be positive");
    }
    if (cfg.model.layout != "NHWC" && cfg.model.layout != "NCHW") {
        errors.push_back("model.layout must be 'NHWC' or 'NCHW'");
    }
    if (cfg.model.scale_value <= 0.0f) {
        errors.push_back("model.scale must be positive");
    }

    if (!(cfg.validation.max_upload_mb > 0.0)) {
        errors.push_back("validation.max_upload_mb must be positive");
    } else if (cfg.validation.max_bytes < cfg.validation.min_bytes) {
        errors.push_back("validation.max_upload_mb is below validation.min_upload_bytes");
    }
    if (cfg.validation.accepted_types.empty()) {
        errors.push_back("validation.accepted_types must list at least one content type");
    }

    std::vector<SeverityRule> rules = cfg.severity.rules;
    rules.push_back(cfg.severity.fallback);
    for (size_t i = 0; i < rules.size(); ++i) {
        const auto& rule = rules[i];
        std::string name = (i + 1 == rules.size()) ? "severity.fallback" : "severity.rules[" + std::to_string(i) + "]";
        if (!inPercentRange(rule.moderate_threshold)) {
            errors.push_back(name + ".moderate must be within [0, 100]");
        }
        if (rule.severe_threshold) {
            if (!inPercentRange(*rule.severe_threshold)) {
                errors.push_back(name + ".severe must be within [0, 100]");
            } else if (*rule.severe_threshold < rule.moderate_threshold) {
                errors.push_back(name + ".severe must not be below its moderate threshold");
            }
        }
        if (std::find(rule.categories.begin(), rule.categories.end(), DiseaseCategory::NONE) != rule.categories.end()) {
            errors.push_back(name + " must not list category 'none'");
        }
    }

    if (cfg.runtime.worker_threads < 1) {
        errors.push_back("runtime.worker_threads must be at least 1");
    }
    if (cfg.runtime.queue_capacity < 1) {
        errors.push_back("runtime.queue_capacity must be at least 1");
    }
    if (cfg.runtime.request_timeout_ms <= 0) {
        errors.push_back("runtime.request_timeout_ms must be positive");
    }

    if (cfg.advice.enabled) {
        if (cfg.advice.api_key.empty()) {
            errors.push_back("advice.enabled requires an API key (advice.api_key or GEMINI_API_KEY)");
        }
        if (cfg.advice.timeout_ms <= 0) {
            errors.push_back("advice.timeout_ms must be positive");
        }
    }

    if (cfg.class_labels_path.empty()) {
        errors.push_back("class_labels.path must not be empty");
    }
    if (cfg.knowledge_base_path.empty()) {
        errors.push_back("knowledge_base.path must not be empty");
    }

    return errors;
}

} // namespace CropDoctor
