#pragma once

#include <stdexcept>
#include <string>

namespace image_denoiser {

// Stable taxonomy keys; the HTTP boundary reports them as "reason".
enum class ErrorReason {
    INTERNAL,
    CONFIG,
    VALIDATION,
    IO,
    INVALID_METHOD,
    INVALID_STRENGTH,
    INVALID_UPLOAD,
    UNSUPPORTED_MEDIA_TYPE,
    UPLOAD_TOO_LARGE,
    DECODE_ERROR,
    MODEL_UNAVAILABLE,
    PROCESS_ERROR,
    TIMEOUT,
    SERVER_BUSY
};

inline std::string error_reason_to_string(ErrorReason reason) {
    switch (reason) {
        case ErrorReason::CONFIG: return "config";
        case ErrorReason::VALIDATION: return "validation";
        case ErrorReason::IO: return "io";
        case ErrorReason::INVALID_METHOD: return "invalid_method";
        case ErrorReason::INVALID_STRENGTH: return "invalid_strength";
        case ErrorReason::INVALID_UPLOAD: return "invalid_upload";
        case ErrorReason::UNSUPPORTED_MEDIA_TYPE: return "unsupported_media_type";
        case ErrorReason::UPLOAD_TOO_LARGE: return "upload_too_large";
        case ErrorReason::DECODE_ERROR: return "decode_error";
        case ErrorReason::MODEL_UNAVAILABLE: return "model_unavailable";
        case ErrorReason::PROCESS_ERROR: return "process_error";
        case ErrorReason::TIMEOUT: return "timeout";
        case ErrorReason::SERVER_BUSY: return "server_busy";
        default: return "internal";
    }
}

// Pipeline stage a ProcessError originated from.
enum class ProcessStage {
    DECODE,
    FILTER,
    INFERENCE,
    ENCODE
};

inline std::string process_stage_to_string(ProcessStage stage) {
    switch (stage) {
        case ProcessStage::DECODE: return "decode";
        case ProcessStage::FILTER: return "filter";
        case ProcessStage::INFERENCE: return "inference";
        case ProcessStage::ENCODE: return "encode";
        default: return "unknown";
    }
}

class DenoiserError : public std::runtime_error {
public:
    DenoiserError(ErrorReason reason, const std::string& message)
        : std::runtime_error(message), reason_(reason) {}

    ErrorReason reason() const { return reason_; }

private:
    ErrorReason reason_;
};

class ConfigError : public DenoiserError {
public:
    explicit ConfigError(const std::string& message)
        : DenoiserError(ErrorReason::CONFIG, "Config error: " + message) {}
};

class ValidationError : public DenoiserError {
public:
    explicit ValidationError(const std::string& message)
        : DenoiserError(ErrorReason::VALIDATION, "Validation error: " + message) {}
};

class IOError : public DenoiserError {
public:
    explicit IOError(const std::string& message)
        : DenoiserError(ErrorReason::IO, "I/O error: " + message) {}
};

class InvalidMethodError : public DenoiserError {
public:
    explicit InvalidMethodError(const std::string& method)
        : DenoiserError(ErrorReason::INVALID_METHOD,
                        "Unknown method '" + method +
                            "' (expected one of: cdae, mean, median, wavelet)") {}
};

class InvalidStrengthError : public DenoiserError {
public:
    explicit InvalidStrengthError(const std::string& message)
        : DenoiserError(ErrorReason::INVALID_STRENGTH, "Invalid strength: " + message) {}
};

class InvalidUploadError : public DenoiserError {
public:
    explicit InvalidUploadError(const std::string& message)
        : DenoiserError(ErrorReason::INVALID_UPLOAD, "Invalid upload: " + message) {}
};

class UnsupportedMediaTypeError : public DenoiserError {
public:
    explicit UnsupportedMediaTypeError(const std::string& content_type)
        : DenoiserError(ErrorReason::UNSUPPORTED_MEDIA_TYPE,
                        "Unsupported upload content type '" + content_type +
                            "' (expected an image)") {}
};

class UploadTooLargeError : public DenoiserError {
public:
    explicit UploadTooLargeError(const std::string& message)
        : DenoiserError(ErrorReason::UPLOAD_TOO_LARGE, "Upload too large: " + message) {}
};

class ModelUnavailableError : public DenoiserError {
public:
    explicit ModelUnavailableError(const std::string& message)
        : DenoiserError(ErrorReason::MODEL_UNAVAILABLE, "CDAE model unavailable: " + message) {}
};

class TimeoutError : public DenoiserError {
public:
    explicit TimeoutError(const std::string& stage)
        : DenoiserError(ErrorReason::TIMEOUT,
                        "Processing timed out during " + stage) {}
};

class ServerBusyError : public DenoiserError {
public:
    explicit ServerBusyError(int pending)
        : DenoiserError(ErrorReason::SERVER_BUSY,
                        "Server busy: " + std::to_string(pending) +
                            " requests already running or queued") {}
};

class ProcessError : public DenoiserError {
public:
    ProcessError(ProcessStage stage, const std::string& message)
        : DenoiserError(ErrorReason::PROCESS_ERROR,
                        "Processing failed at " + process_stage_to_string(stage) +
                            " stage: " + message),
          stage_(stage) {}

    ProcessStage stage() const { return stage_; }

protected:
    ProcessError(ErrorReason reason, ProcessStage stage, const std::string& message)
        : DenoiserError(reason, message), stage_(stage) {}

private:
    ProcessStage stage_;
};

class DecodeError : public ProcessError {
public:
    explicit DecodeError(const std::string& message)
        : ProcessError(ErrorReason::DECODE_ERROR, ProcessStage::DECODE,
                       "Cannot decode image: " + message) {}
};

} // namespace image_denoiser
