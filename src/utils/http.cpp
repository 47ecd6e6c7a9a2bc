#include "voice_service/utils/http.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <httplib.h>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "voice_service/logging.hpp"

namespace voice_service::utils {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

int default_port(const std::string& scheme) {
    return scheme == "https" ? 443 : 80;
}

bool is_redirect(int status) {
    return status == 301 || status == 302 || status == 303 ||
           status == 307 || status == 308;
}

httplib::Result fetch(const Url& url) {
    const httplib::Headers headers = {
        {"User-Agent", "voice-service/1.0"},
        {"Accept", "*/*"}
    };
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    if (url.scheme == "https") {
        httplib::SSLClient client(url.host, url.port);
        client.enable_server_certificate_verification(true);
        client.set_connection_timeout(30, 0);
        client.set_read_timeout(300, 0);
        return client.Get(url.path.c_str(), headers);
    }
#endif
    httplib::Client client(url.host, url.port);
    client.set_connection_timeout(30, 0);
    client.set_read_timeout(300, 0);
    return client.Get(url.path.c_str(), headers);
}

bool write_atomically(const std::filesystem::path& path, const std::string& body) {
    std::error_code ec;
    if (!path.parent_path().empty()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            logging::error("Cannot create download directory",
                           {kv("path", path.parent_path().string()),
                            kv("error", ec.message())});
            return false;
        }
    }
    auto partial = path;
    partial += ".part";
    {
        std::ofstream out(partial, std::ios::binary | std::ios::trunc);
        out.write(body.data(), static_cast<std::streamsize>(body.size()));
        if (!out) {
            logging::error("Cannot write downloaded file",
                           {kv("path", partial.string())});
            return false;
        }
    }
    std::filesystem::rename(partial, path, ec);
    if (ec) {
        logging::error("Cannot move downloaded file into place",
                       {kv("path", path.string()),
                        kv("error", ec.message())});
        std::filesystem::remove(partial, ec);
        return false;
    }
    return true;
}

}

bool Url::is_default_port() const {
    return port == default_port(scheme);
}

std::string Url::origin() const {
    std::ostringstream out;
    out << scheme << "://" << host;
    if (!is_default_port() && port > 0) {
        out << ':' << port;
    }
    return out.str();
}

std::string Url::str() const {
    return origin() + path;
}

Url parse_url(const std::string& url) {
    Url result;
    std::string rest = url;

    const auto scheme_end = rest.find("://");
    if (scheme_end != std::string::npos) {
        result.scheme = to_lower(rest.substr(0, scheme_end));
        rest.erase(0, scheme_end + 3);
    }

    const auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    result.path = slash == std::string::npos ? "/" : rest.substr(slash);

    const auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        result.host = authority.substr(0, colon);
        try {
            result.port = std::stoi(authority.substr(colon + 1));
        } catch (const std::exception&) {
            throw std::invalid_argument("invalid port in URL: " + url);
        }
    } else {
        result.host = authority;
        result.port = default_port(result.scheme);
    }
    return result;
}

std::string join_path(const std::string& base_path, const std::string& route) {
    if (base_path.empty() || base_path == "/") {
        return route.empty() || route.front() != '/' ? "/" + route : route;
    }
    if (route.empty()) {
        return base_path;
    }
    const bool base_slash = base_path.back() == '/';
    const bool route_slash = route.front() == '/';
    if (base_slash && route_slash) {
        return base_path + route.substr(1);
    }
    if (!base_slash && !route_slash) {
        return base_path + "/" + route;
    }
    return base_path + route;
}

std::string resolve_redirect_url(const std::string& base_url,
                                 const std::string& location) {
    if (location.empty()) {
        return "";
    }
    const auto lowered = to_lower(location.substr(0, 8));
    if (lowered.rfind("http://", 0) == 0 || lowered.rfind("https://", 0) == 0) {
        return location;
    }
    const auto base = parse_url(base_url);
    if (location.front() == '/') {
        return base.origin() + location;
    }
    const auto last_slash = base.path.find_last_of('/');
    const auto directory = last_slash == std::string::npos
                               ? std::string("/")
                               : base.path.substr(0, last_slash + 1);
    return base.origin() + directory + location;
}

bool download_file(const std::string& url,
                   const std::filesystem::path& path,
                   int max_redirects) {
    std::string current = url;
    for (int hop = 0; hop <= max_redirects; ++hop) {
        Url target;
        try {
            target = parse_url(current);
        } catch (const std::exception& ex) {
            logging::error("Download URL is invalid",
                           {kv("url", current), kv("error", ex.what())});
            return false;
        }
        if (target.host.empty()) {
            logging::error("Download URL has no host", {kv("url", current)});
            return false;
        }

#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
        if (target.scheme == "https") {
            logging::error("HTTPS download requires OpenSSL support",
                           {kv("url", current)});
            return false;
        }
#endif
        auto response = fetch(target);
        if (!response) {
            logging::error("Download request failed",
                           {kv("url", current),
                            kv("error", httplib::to_string(response.error()))});
            return false;
        }

        const int status = response->status;
        if (status >= 200 && status < 300) {
            logging::info("Download complete",
                          {kv("url", current),
                           kv("bytes", response->body.size()),
                           kv("path", path.string())});
            return write_atomically(path, response->body);
        }
        if (is_redirect(status)) {
            const auto location = response->get_header_value("Location");
            const auto next = resolve_redirect_url(current, location);
            if (next.empty()) {
                logging::error("Download redirect without location",
                               {kv("url", current), kv("status", status)});
                return false;
            }
            logging::debug("Download redirected",
                           {kv("from", current), kv("to", next), kv("status", status)});
            current = next;
            continue;
        }
        logging::error("Download rejected",
                       {kv("url", current),
                        kv("status", status),
                        kv("response", response->body.substr(0, 256))});
        return false;
    }
    logging::error("Download failed: too many redirects", {kv("url", url)});
    return false;
}

}
