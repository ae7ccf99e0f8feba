#include "errors.hpp"

namespace CropDoctor {

std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION: return "validation_error";
        case ErrorKind::DECODE: return "decode_error";
        case ErrorKind::MODEL_UNAVAILABLE: return "model_unavailable";
        case ErrorKind::UNKNOWN_LABEL: return "unknown_label";
        case ErrorKind::CLASSIFIER: return "classifier_error";
        case ErrorKind::TIMEOUT: return "timeout";
        case ErrorKind::CANCELLED: return "cancelled";
    }
    return "internal_error";
}

std::string validationReasonToString(ValidationReason reason) {
    switch (reason) {
        case ValidationReason::TOO_LARGE: return "TooLarge";
        case ValidationReason::TOO_SMALL: return "TooSmall";
        case ValidationReason::UNSUPPORTED_TYPE: return "UnsupportedType";
        case ValidationReason::MISSING_CROP_HINT: return "MissingCropHint";
    }
    return "Unknown";
}

} // namespace CropDoctor
