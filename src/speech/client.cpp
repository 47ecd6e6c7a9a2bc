#include "voice_service/speech/client.hpp"

#include <algorithm>
#include <httplib.h>
#include <utility>

#include "voice_service/logging.hpp"
#include "voice_service/utils/http.hpp"

namespace voice_service {
namespace speech {

namespace {

std::string describe_failure(const std::string& route, int status, const std::string& body) {
    std::string message = "upstream " + route + " returned " + std::to_string(status);
    if (!body.empty()) {
        message += ": " + body.substr(0, 256);
    }
    return message;
}

nlohmann::json parse_body(const std::string& route, const std::string& body) {
    try {
        return nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& ex) {
        throw SpeechServiceError("upstream " + route + " returned invalid JSON: " + ex.what());
    }
}

}

ServiceClient::ServiceClient(const std::string& base_url, ServiceRequestOptions options)
    : base_url_(base_url) {
    const auto url = utils::parse_url(base_url);
    if (url.host.empty()) {
        throw SpeechServiceError("invalid speech service URL: " + base_url);
    }
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    if (url.scheme == "https") {
        throw SpeechServiceError("HTTPS speech service requires CPPHTTPLIB_OPENSSL_SUPPORT");
    }
#endif
    base_path_ = url.path == "/" ? "" : url.path;
    client_ = std::make_unique<httplib::Client>(url.origin());
    client_->set_connection_timeout(options.connect_timeout.count(), 0);
    client_->set_read_timeout(options.read_timeout.count(), 0);
    client_->set_write_timeout(options.write_timeout.count(), 0);
}

ServiceClient::~ServiceClient() = default;

nlohmann::json ServiceClient::get_json(const std::string& route) {
    const auto path = build_path(route);
    const httplib::Headers headers{{"Accept", "application/json"}};
    auto response = client_->Get(path.c_str(), headers);
    if (!response) {
        throw SpeechServiceError("upstream " + path + " unreachable: " +
                                 httplib::to_string(response.error()));
    }
    if (response->status < 200 || response->status >= 300) {
        throw SpeechServiceError(describe_failure(path, response->status, response->body),
                                 response->status);
    }
    return parse_body(path, response->body);
}

nlohmann::json ServiceClient::post_json(const std::string& route, const nlohmann::json& body) {
    return parse_body(build_path(route), post_for_bytes(route, body));
}

std::string ServiceClient::post_for_bytes(const std::string& route, const nlohmann::json& body) {
    const auto path = build_path(route);
    const httplib::Headers headers{{"Accept", "*/*"}};
    auto response = client_->Post(path.c_str(), headers, body.dump(), "application/json");
    if (!response) {
        throw SpeechServiceError("upstream " + path + " unreachable: " +
                                 httplib::to_string(response.error()));
    }
    if (response->status < 200 || response->status >= 300) {
        throw SpeechServiceError(describe_failure(path, response->status, response->body),
                                 response->status);
    }
    return std::move(response->body);
}

void ServiceClient::post_streaming(const std::string& route,
                                   const nlohmann::json& body,
                                   const ChunkCallback& on_chunk) {
    const auto path = build_path(route);
    bool aborted = false;
    std::string error_body;
    int status = 0;

    httplib::Request request;
    request.method = "POST";
    request.path = path;
    request.headers = {{"Accept", "*/*"}};
    request.body = body.dump();
    request.set_header("Content-Type", "application/json");
    request.response_handler = [&status](const httplib::Response& response) {
        status = response.status;
        return true;
    };
    request.content_receiver = [&](const char* data, size_t length, uint64_t, uint64_t) {
        if (status < 200 || status >= 300) {
            if (error_body.size() < 256) {
                error_body.append(data, std::min<size_t>(length, 256 - error_body.size()));
            }
            return true;
        }
        if (!on_chunk(data, length)) {
            aborted = true;
            return false;
        }
        return true;
    };

    auto result = client_->send(request);
    if (aborted) {
        logging::debug("Upstream stream aborted by consumer", {kv("path", path)});
        return;
    }
    if (!result) {
        throw SpeechServiceError("upstream " + path + " unreachable: " +
                                 httplib::to_string(result.error()));
    }
    if (status < 200 || status >= 300) {
        throw SpeechServiceError(describe_failure(path, status, error_body), status);
    }
}

std::string ServiceClient::build_path(const std::string& route) const {
    return utils::join_path(base_path_, route);
}

}
}
