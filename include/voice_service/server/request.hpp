#pragma once

#include <cstdint>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace voice_service {

struct RestResponse {
    int status = 200;
    nlohmann::json body;
};

namespace server {

// A request the service refuses before doing any work. Carries the HTTP
// status and the error kind reported to the caller.
class RequestError : public std::runtime_error {
public:
    RequestError(int status, std::string kind, const std::string& message)
        : std::runtime_error(message), status_(status), kind_(std::move(kind)) {}

    int status() const { return status_; }
    const std::string& kind() const { return kind_; }

private:
    int status_;
    std::string kind_;
};

RequestError invalid_request(const std::string& message);
RequestError service_unavailable(const std::string& message);

struct ErrorInfo {
    int status = 500;
    std::string kind = "internal_error";
    std::string message;
};

// Maps any failure raised while serving a request to its status and kind.
ErrorInfo describe_error(const std::exception& ex);
nlohmann::json error_body(const ErrorInfo& info);
// Status and {"error", "message"} body reported for a failed request.
RestResponse error_response(const ErrorInfo& info);

std::string require_string(const nlohmann::json& body, const std::string& key);
std::string optional_string(const nlohmann::json& body,
                            const std::string& key,
                            const std::string& fallback);
double optional_probability(const nlohmann::json& body,
                            const std::string& key,
                            double fallback);
int optional_int(const nlohmann::json& body, const std::string& key, int fallback);
std::optional<uint64_t> optional_sequence(const nlohmann::json& body, const std::string& key);
// Base64 field decoded to raw bytes.
std::string require_audio(const nlohmann::json& body, const std::string& key);

struct Thresholds {
    double high = 0.5;
    double low = 0.15;
};

// Reads threshold/threshold_low, rejecting a low threshold above the high one.
Thresholds read_thresholds(const nlohmann::json& body, const Thresholds& defaults);

}
}
