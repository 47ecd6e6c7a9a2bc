#include <catch2/catch_test_macros.hpp>

#include "voice_service/utils/base64.hpp"

#include <string>

using voice_service::utils::base64_decode;
using voice_service::utils::base64_encode;

TEST_CASE("base64_encode pads partial groups") {
    REQUIRE(base64_encode("") == "");
    REQUIRE(base64_encode("M") == "TQ==");
    REQUIRE(base64_encode("Ma") == "TWE=");
    REQUIRE(base64_encode("Man") == "TWFu");
    REQUIRE(base64_encode(std::string("\x00\xFF\x10", 3)) == "AP8Q");
}

TEST_CASE("base64_decode accepts padded, unpadded and wrapped input") {
    REQUIRE(base64_decode("TWFu") == std::string("Man"));
    REQUIRE(base64_decode("TWE=") == std::string("Ma"));
    REQUIRE(base64_decode("TQ") == std::string("M"));
    REQUIRE(base64_decode("TW\nFu\r\n TQ==") == std::string("ManM"));
    REQUIRE(base64_decode("") == std::string());
}

TEST_CASE("base64_decode rejects malformed input") {
    REQUIRE_FALSE(base64_decode("TW!u"));
    REQUIRE_FALSE(base64_decode("T"));
    REQUIRE_FALSE(base64_decode("TQ==TQ=="));
    REQUIRE_FALSE(base64_decode("TQ==="));
    REQUIRE_FALSE(base64_decode("TWE=="));
}
