#pragma once

#include <cstddef>
#include <string>

#include "config_manager.hpp"

namespace CropDoctor {

struct UploadMetadata {
    std::size_t byteLength = 0;
    std::string contentType;
    std::string cropHint;
};

/**
 * Cheap gate in front of decoding and inference. Looks only at upload
 * metadata, never at pixel data, and throws ValidationError on the first
 * violated constraint (size, then type, then crop hint).
 */
class RequestValidator {
public:
    explicit RequestValidator(const ValidationConfig& config);

    void validate(const UploadMetadata& upload) const;

    bool isAcceptedType(const std::string& contentType) const;

    // "Image/JPEG; charset=binary" -> "image/jpeg"
    static std::string normalizeContentType(const std::string& contentType);

private:
    ValidationConfig config_;
};

} // namespace CropDoctor
