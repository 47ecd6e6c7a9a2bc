#include <catch2/catch_test_macros.hpp>

#include "voice_service/utils/http.hpp"

#include <stdexcept>
#include <string>

using namespace voice_service::utils;

TEST_CASE("parse_url splits scheme host port and path") {
    const auto url = parse_url("https://example.com:8443/path/file");
    REQUIRE(url.scheme == "https");
    REQUIRE(url.host == "example.com");
    REQUIRE(url.port == 8443);
    REQUIRE(url.path == "/path/file");
    REQUIRE(url.origin() == "https://example.com:8443");
}

TEST_CASE("parse_url fills in defaults") {
    const auto bare = parse_url("localhost");
    REQUIRE(bare.scheme == "http");
    REQUIRE(bare.host == "localhost");
    REQUIRE(bare.port == 80);
    REQUIRE(bare.path == "/");

    const auto secure = parse_url("HTTPS://huggingface.co/model.onnx");
    REQUIRE(secure.scheme == "https");
    REQUIRE(secure.port == 443);
    REQUIRE(secure.is_default_port());
    REQUIRE(secure.str() == "https://huggingface.co/model.onnx");
}

TEST_CASE("parse_url rejects a non-numeric port") {
    REQUIRE_THROWS_AS(parse_url("http://host:abc/x"), std::invalid_argument);
}

TEST_CASE("join_path keeps exactly one slash") {
    REQUIRE(join_path("", "/voices") == "/voices");
    REQUIRE(join_path("", "") == "/");
    REQUIRE(join_path("/", "voices") == "/voices");
    REQUIRE(join_path("/tts", "/voices") == "/tts/voices");
    REQUIRE(join_path("/tts/", "/voices") == "/tts/voices");
    REQUIRE(join_path("/tts", "voices") == "/tts/voices");
    REQUIRE(join_path("/stt", "") == "/stt");
}

TEST_CASE("resolve_redirect_url handles absolute and relative redirects") {
    const std::string base_url = "https://example.com/path/file";
    REQUIRE(resolve_redirect_url(base_url, "/new") == "https://example.com/new");
    REQUIRE(resolve_redirect_url(base_url, "other") == "https://example.com/path/other");
    REQUIRE(resolve_redirect_url(base_url, "https://host/x") == "https://host/x");
    REQUIRE(resolve_redirect_url(base_url, "") == "");
}
