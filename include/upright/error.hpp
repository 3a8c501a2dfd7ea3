#pragma once

#include <exception>
#include <string>

namespace upright {

enum class ErrorCode {
    ConfigError,        // YAML config parsing or validation failure
    InvalidArgument,    // Caller passed a value outside the accepted range
    DimensionMismatch,  // Vector/tensor size does not match the morphology
    ModelUnavailable,   // Operation needs a network that does not exist
    ExportError,        // Writing the weight document failed
    ImportError,        // Reading or validating a weight document failed
    PhysicsError        // Physics collaborator rejected a read or write
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConfigError:       return "ConfigError";
        case ErrorCode::InvalidArgument:   return "InvalidArgument";
        case ErrorCode::DimensionMismatch: return "DimensionMismatch";
        case ErrorCode::ModelUnavailable:  return "ModelUnavailable";
        case ErrorCode::ExportError:       return "ExportError";
        case ErrorCode::ImportError:       return "ImportError";
        case ErrorCode::PhysicsError:      return "PhysicsError";
        default:                           return "Unknown";
    }
}

class UprightError : public std::exception {
public:
    UprightError(ErrorCode code, const std::string& message)
        : code_(code), message_(message), context_() {
        build_what();
    }

    UprightError(ErrorCode code, const std::string& context, const std::string& message)
        : code_(code), message_(message), context_(context) {
        build_what();
    }

    ErrorCode code() const noexcept { return code_; }
    const char* what() const noexcept override { return what_.c_str(); }
    const std::string& message() const noexcept { return message_; }
    const std::string& context() const noexcept { return context_; }

private:
    void build_what() {
        what_ = std::string("[upright::") + error_code_to_string(code_) + "] " + message_;
        if (!context_.empty()) {
            what_ += " (" + context_ + ")";
        }
    }

    ErrorCode code_;
    std::string message_;
    std::string context_;
    std::string what_;
};

} // namespace upright
