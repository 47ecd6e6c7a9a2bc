#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "voice_service/config.hpp"
#include "voice_service/server/request.hpp"

namespace voice_service {

class RestServer {
public:
    using JsonHandler = std::function<RestResponse(const nlohmann::json&)>;
    using ChunkSink = std::function<bool(const char*, std::size_t)>;
    // Produces the body chunk by chunk; a false return from the sink means
    // the client went away and the producer should stop.
    using StreamSource = std::function<void(const ChunkSink&)>;
    // Validates the request and returns the producer. Errors raised here are
    // reported with a proper status since nothing has been sent yet.
    using StreamHandler = std::function<StreamSource(const nlohmann::json&)>;

    explicit RestServer(const Config& config);

    void get(const std::string& path, JsonHandler handler);
    void post(const std::string& path, JsonHandler handler);
    void post_stream(const std::string& path, std::string content_type, StreamHandler handler);

    void start();
    void stop();

private:
    bool authorize_request(const httplib::Request& request, httplib::Response& response) const;
    void write_json(httplib::Response& response, const RestResponse& payload) const;
    void write_error(httplib::Response& response,
                     const std::string& path,
                     const std::exception& ex) const;
    nlohmann::json parse_request(const httplib::Request& request) const;

    const Config& config_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
};

}
