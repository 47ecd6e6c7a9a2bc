#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace httplib {
class Client;
}

namespace voice_service {
namespace speech {

// A speech engine could not be reached or answered with a failure status.
class SpeechServiceError : public std::runtime_error {
public:
    explicit SpeechServiceError(const std::string& message, int status = 0)
        : std::runtime_error(message), status_(status) {}

    // Upstream HTTP status, 0 when no response was received.
    int status() const { return status_; }

private:
    int status_;
};

struct ServiceRequestOptions {
    std::chrono::seconds connect_timeout{30};
    std::chrono::seconds read_timeout{300};
    std::chrono::seconds write_timeout{30};
};

// JSON-over-HTTP client for one upstream engine rooted at base_url.
class ServiceClient {
public:
    using ChunkCallback = std::function<bool(const char*, std::size_t)>;

    ServiceClient(const std::string& base_url, ServiceRequestOptions options);
    ~ServiceClient();

    const std::string& base_url() const { return base_url_; }

    nlohmann::json get_json(const std::string& route);
    nlohmann::json post_json(const std::string& route, const nlohmann::json& body);
    std::string post_for_bytes(const std::string& route, const nlohmann::json& body);
    // Delivers the response body as it arrives. on_chunk returning false
    // aborts the transfer without raising.
    void post_streaming(const std::string& route,
                        const nlohmann::json& body,
                        const ChunkCallback& on_chunk);

private:
    std::string build_path(const std::string& route) const;

    std::string base_url_;
    std::string base_path_;
    std::unique_ptr<httplib::Client> client_;
};

}
}
