#include "voice_service/server/rest_server.hpp"

#include <chrono>
#include <utility>

#include "voice_service/logging.hpp"
#include "voice_service/metrics.hpp"
#include "voice_service/server/request.hpp"

namespace voice_service {

namespace {

class RouteTimer {
public:
    explicit RouteTimer(std::string route)
        : route_(std::move(route)), started_(std::chrono::steady_clock::now()) {
        Metrics::instance().increment_request(route_);
    }

    ~RouteTimer() {
        const auto elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - started_).count();
        Metrics::instance().observe_response_time(route_, elapsed);
    }

private:
    std::string route_;
    std::chrono::steady_clock::time_point started_;
};

}

RestServer::RestServer(const Config& config)
    : config_(config),
      server_(std::make_unique<httplib::Server>()) {
    server_->Get("/metrics", [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        res.set_content(Metrics::instance().render_prometheus(),
                        "text/plain; version=0.0.4");
    });
}

void RestServer::get(const std::string& path, JsonHandler handler) {
    server_->Get(path, [this, path, handler = std::move(handler)](
                           const httplib::Request& req, httplib::Response& res) {
        RouteTimer timer(path);
        if (path != "/health" && !authorize_request(req, res)) {
            return;
        }
        try {
            write_json(res, handler(parse_request(req)));
        } catch (const std::exception& ex) {
            write_error(res, path, ex);
        }
    });
}

void RestServer::post(const std::string& path, JsonHandler handler) {
    server_->Post(path, [this, path, handler = std::move(handler)](
                            const httplib::Request& req, httplib::Response& res) {
        RouteTimer timer(path);
        if (!authorize_request(req, res)) {
            return;
        }
        try {
            write_json(res, handler(parse_request(req)));
        } catch (const std::exception& ex) {
            write_error(res, path, ex);
        }
    });
}

void RestServer::post_stream(const std::string& path,
                             std::string content_type,
                             StreamHandler handler) {
    server_->Post(path, [this, path, content_type, handler = std::move(handler)](
                            const httplib::Request& req, httplib::Response& res) {
        RouteTimer timer(path);
        if (!authorize_request(req, res)) {
            return;
        }
        StreamSource source;
        try {
            source = handler(parse_request(req));
        } catch (const std::exception& ex) {
            write_error(res, path, ex);
            return;
        }
        res.set_chunked_content_provider(
            content_type,
            [path, source = std::move(source)](size_t, httplib::DataSink& sink) {
                bool client_alive = true;
                try {
                    source([&](const char* data, std::size_t length) {
                        client_alive = sink.write(data, length);
                        return client_alive;
                    });
                } catch (const std::exception& ex) {
                    Metrics::instance().increment_error("upstream_failure");
                    logging::error("Stream aborted",
                                   {kv("route", path), kv("error", ex.what())});
                    return false;
                }
                if (!client_alive) {
                    logging::info("Stream client disconnected", {kv("route", path)});
                    return false;
                }
                sink.done();
                return true;
            });
    });
}

void RestServer::start() {
    server_thread_ = std::thread([this]() {
        logging::info(
            "REST server listening",
            {kv("host", config_.service_host), kv("port", config_.service_port)});
        if (!server_->listen(config_.service_host, config_.service_port)) {
            logging::error(
                "REST server failed to listen",
                {kv("host", config_.service_host), kv("port", config_.service_port)});
        }
    });
}

void RestServer::stop() {
    if (server_) {
        server_->stop();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

bool RestServer::authorize_request(const httplib::Request& request,
                                   httplib::Response& response) const {
    if (!config_.authorization_token) {
        return true;
    }
    const auto it = request.headers.find("Authorization");
    if (it == request.headers.end()) {
        response.status = 401;
        response.set_content(R"({"error":"unauthorized","message":"missing authorization"})",
                             "application/json");
        return false;
    }
    const auto expected = "Bearer " + *config_.authorization_token;
    if (it->second != expected) {
        response.status = 403;
        response.set_content(R"({"error":"forbidden","message":"invalid authorization"})",
                             "application/json");
        return false;
    }
    return true;
}

void RestServer::write_json(httplib::Response& response, const RestResponse& payload) const {
    response.status = payload.status;
    response.set_content(payload.body.dump(), "application/json");
}

void RestServer::write_error(httplib::Response& response,
                             const std::string& path,
                             const std::exception& ex) const {
    const auto info = server::describe_error(ex);
    Metrics::instance().increment_error(info.kind);
    if (info.status >= 500) {
        logging::error("Request failed",
                       {kv("route", path), kv("kind", info.kind), kv("error", info.message)});
    } else {
        logging::warn("Request rejected",
                      {kv("route", path), kv("kind", info.kind), kv("error", info.message)});
    }
    write_json(response, server::error_response(info));
}

// Query parameters fill in fields the JSON body does not carry.
nlohmann::json RestServer::parse_request(const httplib::Request& request) const {
    nlohmann::json body = nlohmann::json::object();
    if (!request.body.empty()) {
        try {
            body = nlohmann::json::parse(request.body);
        } catch (const nlohmann::json::exception& ex) {
            throw server::invalid_request(std::string("invalid request body: ") + ex.what());
        }
        if (!body.is_object()) {
            throw server::invalid_request("request body must be a JSON object");
        }
    }
    for (const auto& param : request.params) {
        if (!body.contains(param.first)) {
            body[param.first] = param.second;
        }
    }
    return body;
}

}
