#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "advice_generator.hpp"
#include "class_labels.hpp"
#include "config_manager.hpp"
#include "detection_service.hpp"
#include "errors.hpp"
#include "knowledge_base.hpp"

using json = nlohmann::json;
using namespace CropDoctor;

namespace {

enum ExitCode {
    EXIT_OK = 0,
    EXIT_FAILURE_GENERIC = 1,
    EXIT_INVALID_INPUT = 2,
    EXIT_MODEL_UNAVAILABLE = 3,
    EXIT_TIMEOUT = 4
};

struct CliOptions {
    std::string configPath;
    bool configExplicit = false;
    std::string imagePath;
    std::string cropHint;
    std::optional<std::string> location;
    std::string contentType;
    bool listCrops = false;
    bool listDiseases = false;
    std::string diseaseFilter;
    bool health = false;
    std::optional<int> timeoutMs;
    bool noAdvice = false;
};

bool arg_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

std::string getenv_str(const char* key, const char* def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : std::string(def);
}

void print_usage() {
    std::cout << "Usage: crop_doctor [--config <json>]\n"
              << "                   [--image <file> --crop <name> [--location <text>] [--type <mime>]]\n"
              << "                   [--list-crops] [--list-diseases [crop]] [--health]\n"
              << "                   [--timeout-ms <n>] [--no-advice] [--help]\n";
}

CliOptions parse_args(int argc, char** argv) {
    CliOptions opts;
    opts.configPath = getenv_str("CONFIG_PATH", "data/config.json");

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        auto next = [&](int offset = 1) -> const char* {
            if (i + offset < argc) return argv[i + offset];
            return nullptr;
        };

        if (arg_eq(arg, "--config") && next()) {
            opts.configPath = next();
            opts.configExplicit = true;
            i++;
        } else if (arg_eq(arg, "--image") && next()) {
            opts.imagePath = next();
            i++;
        } else if (arg_eq(arg, "--crop") && next()) {
            opts.cropHint = next();
            i++;
        } else if (arg_eq(arg, "--location") && next()) {
            opts.location = std::string(next());
            i++;
        } else if (arg_eq(arg, "--type") && next()) {
            opts.contentType = next();
            i++;
        } else if (arg_eq(arg, "--timeout-ms") && next()) {
            opts.timeoutMs = std::atoi(next());
            i++;
        } else if (arg_eq(arg, "--list-crops")) {
            opts.listCrops = true;
        } else if (arg_eq(arg, "--list-diseases")) {
            opts.listDiseases = true;
            if (next() && std::strncmp(next(), "--", 2) != 0) {
                opts.diseaseFilter = next();
                i++;
            }
        } else if (arg_eq(arg, "--health")) {
            opts.health = true;
        } else if (arg_eq(arg, "--no-advice")) {
            opts.noAdvice = true;
        } else if (arg_eq(arg, "--help")) {
            print_usage();
            std::exit(EXIT_OK);
        } else {
            std::cerr << "[WARN] Ignoring unknown argument: " << arg << std::endl;
        }
    }
    return opts;
}

std::string content_type_from_extension(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    if (ext == ".png") return "image/png";
    if (ext == ".webp") return "image/webp";
    if (ext == ".bmp") return "image/bmp";
    return "application/octet-stream";
}

bool read_file(const std::string& path, std::string& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return false;
    out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return true;
}

bool load_configuration(ConfigManager& config, const CliOptions& opts) {
    if (std::filesystem::exists(opts.configPath)) {
        if (!config.loadConfig(opts.configPath)) return false;
    } else if (opts.configExplicit) {
        std::cerr << "[ERROR] Config file not found: " << opts.configPath << std::endl;
        return false;
    } else {
        std::cerr << "[WARN] Config file not found: " << opts.configPath << ", using defaults" << std::endl;
    }

    config.applyEnvironmentOverrides();
    if (opts.noAdvice) {
        config.mutableServiceConfig().advice.enabled = false;
    }

    if (!config.validateConfig()) {
        for (const auto& error : config.getValidationErrors()) {
            std::cerr << "[ERROR] Config: " << error << std::endl;
        }
        return false;
    }
    return true;
}

std::shared_ptr<AdviceGenerator> make_advice_generator(const AdviceConfig& advice) {
    if (!advice.enabled) return nullptr;
    if (advice.api_key.empty()) {
        std::cerr << "[WARN] Advice generation enabled but no API key is set (GEMINI_API_KEY); disabling it" << std::endl;
        return nullptr;
    }
    std::cout << "[INFO] Advice generation enabled (" << advice.model << ")" << std::endl;
    return std::make_shared<AdviceClient>(advice);
}

int run_detection(DetectionService& service, const CliOptions& opts) {
    DetectionRequest request;
    request.cropHint = opts.cropHint;
    request.location = opts.location;
    request.contentType = opts.contentType.empty() ? content_type_from_extension(opts.imagePath) : opts.contentType;

    if (!read_file(opts.imagePath, request.imageBytes)) {
        std::cerr << "[ERROR] Cannot read image: " << opts.imagePath << std::endl;
        return EXIT_INVALID_INPUT;
    }

    std::optional<std::chrono::milliseconds> timeout;
    if (opts.timeoutMs) timeout = std::chrono::milliseconds(*opts.timeoutMs);

    try {
        DetectionResponse response = service.detect(request, timeout);
        std::cout << ResponseAssembler::toJson(response).dump(2) << std::endl;
        return EXIT_OK;
    } catch (const ModelUnavailableError& e) {
        std::cerr << "[WARN] Using fallback response: " << e.what() << std::endl;
        std::cout << ResponseAssembler::fallbackJson(request, e.what()).dump(2) << std::endl;
        return EXIT_MODEL_UNAVAILABLE;
    } catch (const DetectionError& e) {
        std::cerr << "[ERROR] Detection failed: " << e.what() << std::endl;
        std::cout << ResponseAssembler::errorJson(e).dump(2) << std::endl;
        switch (e.kind()) {
            case ErrorKind::VALIDATION:
            case ErrorKind::DECODE:
                return EXIT_INVALID_INPUT;
            case ErrorKind::TIMEOUT:
                return EXIT_TIMEOUT;
            default:
                return EXIT_FAILURE_GENERIC;
        }
    }
}

json diseases_to_json(const std::vector<KnownDisease>& diseases) {
    json list = json::array();
    for (const auto& disease : diseases) {
        list.push_back({
            {"label", disease.label},
            {"name", disease.name},
            {"crop", disease.crop},
            {"cause", disease.cause},
            {"cure", disease.cure}
        });
    }
    return list;
}

} // namespace

int main(int argc, char** argv) {
    CliOptions opts = parse_args(argc, argv);

    const bool detectRequested = !opts.imagePath.empty();
    if (!detectRequested && !opts.listCrops && !opts.listDiseases && !opts.health) {
        print_usage();
        return EXIT_FAILURE_GENERIC;
    }

    ConfigManager config;
    if (!load_configuration(config, opts)) {
        return EXIT_FAILURE_GENERIC;
    }
    const ServiceConfig& settings = config.getServiceConfig();

    try {
        auto labels = std::make_shared<const ClassLabelTable>(
            ClassLabelTable::loadFromFile(settings.class_labels_path));
        DiseaseKnowledgeBase knowledgeBase =
            DiseaseKnowledgeBase::loadFromFile(settings.knowledge_base_path, labels);

        DetectionService service(settings,
                                 std::move(knowledgeBase),
                                 DetectionService::defaultClassifierFactory(settings.model),
                                 make_advice_generator(settings.advice));

        if (opts.listCrops) {
            std::cout << json(service.listSupportedCrops()).dump(2) << std::endl;
        }
        if (opts.listDiseases) {
            std::cout << diseases_to_json(service.listKnownDiseases(opts.diseaseFilter)).dump(2) << std::endl;
        }

        int rc = EXIT_OK;
        if (detectRequested) {
            service.start();
            rc = run_detection(service, opts);
        }

        if (opts.health) {
            if (!detectRequested) service.start();
            std::cout << service.health().toJson().dump(2) << std::endl;
        }
        return rc;

    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return EXIT_FAILURE_GENERIC;
    }
}
