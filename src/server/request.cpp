#include "voice_service/server/request.hpp"

#include <cmath>
#include <limits>

#include "voice_service/speech/client.hpp"
#include "voice_service/utils/base64.hpp"
#include "voice_service/vad/errors.hpp"

namespace voice_service {
namespace server {

namespace {

int status_for_kind(const std::string& kind) {
    if (kind == "model_unavailable") {
        return 503;
    }
    if (kind == "invalid_audio") {
        return 400;
    }
    if (kind == "session_not_found") {
        return 404;
    }
    if (kind == "out_of_order_frame") {
        return 409;
    }
    return 500;
}

const nlohmann::json* find_field(const nlohmann::json& body, const std::string& key) {
    if (!body.is_object()) {
        return nullptr;
    }
    const auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

}

RequestError invalid_request(const std::string& message) {
    return RequestError(400, "invalid_request", message);
}

RequestError service_unavailable(const std::string& message) {
    return RequestError(503, "service_unavailable", message);
}

ErrorInfo describe_error(const std::exception& ex) {
    ErrorInfo info;
    info.message = ex.what();
    if (const auto* vad_error = dynamic_cast<const vad::VadError*>(&ex)) {
        info.kind = vad_error->kind();
        info.status = status_for_kind(info.kind);
    } else if (const auto* request_error = dynamic_cast<const RequestError*>(&ex)) {
        info.kind = request_error->kind();
        info.status = request_error->status();
    } else if (dynamic_cast<const speech::SpeechServiceError*>(&ex)) {
        info.kind = "upstream_failure";
        info.status = 502;
    } else if (dynamic_cast<const nlohmann::json::exception*>(&ex)) {
        info.kind = "invalid_request";
        info.status = 400;
    }
    return info;
}

nlohmann::json error_body(const ErrorInfo& info) {
    return {{"error", info.kind}, {"message", info.message}};
}

RestResponse error_response(const ErrorInfo& info) {
    return {info.status, error_body(info)};
}

std::string require_string(const nlohmann::json& body, const std::string& key) {
    const auto* value = find_field(body, key);
    if (!value) {
        throw invalid_request(key + " is required");
    }
    if (!value->is_string()) {
        throw invalid_request(key + " must be a string");
    }
    return value->get<std::string>();
}

std::string optional_string(const nlohmann::json& body,
                            const std::string& key,
                            const std::string& fallback) {
    const auto* value = find_field(body, key);
    if (!value) {
        return fallback;
    }
    if (!value->is_string()) {
        throw invalid_request(key + " must be a string");
    }
    return value->get<std::string>();
}

double optional_probability(const nlohmann::json& body,
                            const std::string& key,
                            double fallback) {
    const auto* value = find_field(body, key);
    if (!value) {
        return fallback;
    }
    if (!value->is_number()) {
        throw invalid_request(key + " must be a number");
    }
    const auto probability = value->get<double>();
    if (!std::isfinite(probability) || probability < 0.0 || probability > 1.0) {
        throw invalid_request(key + " must be between 0 and 1");
    }
    return probability;
}

int optional_int(const nlohmann::json& body, const std::string& key, int fallback) {
    const auto* value = find_field(body, key);
    if (!value) {
        return fallback;
    }
    if (!value->is_number_integer()) {
        throw invalid_request(key + " must be an integer");
    }
    if (value->is_number_unsigned()) {
        if (value->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            throw invalid_request(key + " is out of range");
        }
        return static_cast<int>(value->get<uint64_t>());
    }
    const auto number = value->get<int64_t>();
    if (number < std::numeric_limits<int>::min() || number > std::numeric_limits<int>::max()) {
        throw invalid_request(key + " is out of range");
    }
    return static_cast<int>(number);
}

std::optional<uint64_t> optional_sequence(const nlohmann::json& body, const std::string& key) {
    const auto* value = find_field(body, key);
    if (!value) {
        return std::nullopt;
    }
    if (!value->is_number_integer() ||
        (!value->is_number_unsigned() && value->get<int64_t>() < 0)) {
        throw invalid_request(key + " must be a non-negative integer");
    }
    return value->get<uint64_t>();
}

std::string require_audio(const nlohmann::json& body, const std::string& key) {
    auto decoded = utils::base64_decode(require_string(body, key));
    if (!decoded) {
        throw invalid_request(key + " is not valid base64");
    }
    return std::move(*decoded);
}

Thresholds read_thresholds(const nlohmann::json& body, const Thresholds& defaults) {
    Thresholds thresholds;
    thresholds.high = optional_probability(body, "threshold", defaults.high);
    thresholds.low = optional_probability(body, "threshold_low", defaults.low);
    if (thresholds.low > thresholds.high) {
        throw invalid_request("threshold_low must not exceed threshold");
    }
    return thresholds;
}

}
}
