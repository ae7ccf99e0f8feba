#ifndef CROP_DOCTOR_ERRORS_HPP
#define CROP_DOCTOR_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace CropDoctor {

enum class ErrorKind {
    VALIDATION,
    DECODE,
    MODEL_UNAVAILABLE,
    UNKNOWN_LABEL,
    CLASSIFIER,
    TIMEOUT,
    CANCELLED
};

std::string errorKindToString(ErrorKind kind);

/**
 * Base class for every failure the detection pipeline reports to its caller.
 * The kind is machine-distinguishable; retryable() tells the caller whether
 * repeating the same request may succeed.
 */
class DetectionError : public std::runtime_error {
public:
    DetectionError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }
    virtual bool retryable() const { return false; }

private:
    ErrorKind kind_;
};

enum class ValidationReason {
    TOO_LARGE,
    TOO_SMALL,
    UNSUPPORTED_TYPE,
    MISSING_CROP_HINT
};

// "TooLarge", "TooSmall", "UnsupportedType", "MissingCropHint"
std::string validationReasonToString(ValidationReason reason);

class ValidationError : public DetectionError {
public:
    ValidationError(ValidationReason reason, const std::string& message)
        : DetectionError(ErrorKind::VALIDATION, message), reason_(reason) {}

    ValidationReason reason() const { return reason_; }

private:
    ValidationReason reason_;
};

class DecodeError : public DetectionError {
public:
    explicit DecodeError(const std::string& message)
        : DetectionError(ErrorKind::DECODE, message) {}
};

class ModelUnavailableError : public DetectionError {
public:
    explicit ModelUnavailableError(const std::string& message)
        : DetectionError(ErrorKind::MODEL_UNAVAILABLE, message) {}
};

// Classifier produced a label with no knowledge-base record. Data defect.
class UnknownLabelError : public DetectionError {
public:
    explicit UnknownLabelError(const std::string& label)
        : DetectionError(ErrorKind::UNKNOWN_LABEL, "No knowledge-base record for label: " + label),
          label_(label) {}

    const std::string& label() const { return label_; }

private:
    std::string label_;
};

class ClassifierError : public DetectionError {
public:
    explicit ClassifierError(const std::string& message)
        : DetectionError(ErrorKind::CLASSIFIER, message) {}
};

class TimeoutError : public DetectionError {
public:
    explicit TimeoutError(const std::string& message)
        : DetectionError(ErrorKind::TIMEOUT, message) {}

    bool retryable() const override { return true; }
};

class CancelledError : public DetectionError {
public:
    explicit CancelledError(const std::string& message)
        : DetectionError(ErrorKind::CANCELLED, message) {}
};

// Raised by advice generators. Never leaves TreatmentAdvisor.
class AdviceUnavailableError : public std::runtime_error {
public:
    explicit AdviceUnavailableError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace CropDoctor

#endif // CROP_DOCTOR_ERRORS_HPP
