#include "request_validator.hpp"

#include <algorithm>
#include <cctype>

#include "errors.hpp"

namespace CropDoctor {

namespace {

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return (begin < end) ? std::string(begin, end) : std::string();
}

} // namespace

RequestValidator::RequestValidator(const ValidationConfig& config) : config_(config) {
    for (auto& type : config_.accepted_types) {
        type = normalizeContentType(type);
    }
}

std::string RequestValidator::normalizeContentType(const std::string& contentType) {
    std::string type = contentType.substr(0, contentType.find(';'));
    type = trim(type);
    std::transform(type.begin(), type.end(), type.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return type;
}

bool RequestValidator::isAcceptedType(const std::string& contentType) const {
    const std::string type = normalizeContentType(contentType);
    if (type.empty()) return false;
    return std::find(config_.accepted_types.begin(), config_.accepted_types.end(), type) != config_.accepted_types.end();
}

void RequestValidator::validate(const UploadMetadata& upload) const {
    if (upload.byteLength > config_.max_bytes) {
        throw ValidationError(ValidationReason::TOO_LARGE,
            "Upload of " + std::to_string(upload.byteLength) + " bytes exceeds the limit of " +
            std::to_string(config_.max_bytes) + " bytes");
    }
    if (upload.byteLength == 0 || upload.byteLength < config_.min_bytes) {
        throw ValidationError(ValidationReason::TOO_SMALL,
            "Upload of " + std::to_string(upload.byteLength) + " bytes is below the minimum of " +
            std::to_string(std::max<std::size_t>(config_.min_bytes, 1)) + " bytes");
    }
    if (!isAcceptedType(upload.contentType)) {
        throw ValidationError(ValidationReason::UNSUPPORTED_TYPE,
            "Unsupported content type '" + upload.contentType + "'");
    }
    if (config_.require_crop_hint && trim(upload.cropHint).empty()) {
        throw ValidationError(ValidationReason::MISSING_CROP_HINT, "A crop type must be selected");
    }
}

} // namespace CropDoctor
