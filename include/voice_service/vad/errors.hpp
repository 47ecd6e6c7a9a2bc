#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace voice_service {
namespace vad {

// Base of every failure the VAD engine reports. kind() is stable and safe to
// expose to callers; what() carries the human-readable detail.
class VadError : public std::runtime_error {
public:
    VadError(std::string kind, const std::string& message)
        : std::runtime_error(message), kind_(std::move(kind)) {}

    const std::string& kind() const { return kind_; }

private:
    std::string kind_;
};

// The classifier failed to load at startup. Permanent until restart.
class ModelUnavailableError : public VadError {
public:
    explicit ModelUnavailableError(const std::string& message)
        : VadError("model_unavailable", message) {}
};

class InvalidAudioError : public VadError {
public:
    explicit InvalidAudioError(const std::string& message)
        : VadError("invalid_audio", message) {}
};

class SessionNotFoundError : public VadError {
public:
    explicit SessionNotFoundError(const std::string& session_id)
        : VadError("session_not_found", "VAD session not found: " + session_id) {}
};

// Transient inference failure; the caller decides whether to retry.
class ClassifierFailureError : public VadError {
public:
    explicit ClassifierFailureError(const std::string& message)
        : VadError("classifier_failure", message) {}
};

class OutOfOrderFrameError : public VadError {
public:
    explicit OutOfOrderFrameError(const std::string& message)
        : VadError("out_of_order_frame", message) {}
};

}
}
