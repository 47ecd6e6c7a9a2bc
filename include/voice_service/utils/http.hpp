#pragma once

#include <filesystem>
#include <string>

namespace voice_service::utils {

struct Url {
    std::string scheme = "http";
    std::string host;
    int port = 80;
    std::string path = "/";

    bool is_default_port() const;
    // scheme://host[:port]
    std::string origin() const;
    std::string str() const;
};

// Accepts absolute URLs and bare "host[:port][/path]" (scheme http).
Url parse_url(const std::string& url);

// Joins a base path and a relative route without doubling or dropping '/'.
std::string join_path(const std::string& base_path, const std::string& route);

std::string resolve_redirect_url(const std::string& base_url,
                                 const std::string& location);

// Fetches url into path, following up to max_redirects redirects. The body is
// written to a sibling temporary file and renamed into place on success.
bool download_file(const std::string& url,
                   const std::filesystem::path& path,
                   int max_redirects = 5);

}
