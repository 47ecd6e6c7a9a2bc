#include <catch2/catch_test_macros.hpp>

#include "voice_service/logging.hpp"

#include <string>

using voice_service::kv;
using voice_service::logging::format_kv;
using voice_service::with_kv;

TEST_CASE("kv renders booleans and probabilities") {
    REQUIRE(kv("voice", true).value == "true");
    REQUIRE(kv("probability", 0.5f).value == "0.5000");
    REQUIRE(kv("frames", 16).value == "16");
}

TEST_CASE("format_kv quotes values that would be ambiguous") {
    REQUIRE(format_kv({kv("session_id", "abc")}) == "session_id=abc");
    REQUIRE(format_kv({kv("error", "bad frame")}) == "error=\"bad frame\"");
    REQUIRE(format_kv({kv("text", "")}) == "text=\"\"");
    REQUIRE(format_kv({kv("text", "say \"hi\"")}) == "text=\"say \\\"hi\\\"\"");
    REQUIRE(format_kv({kv("a", 1), kv("b", "x=y")}) == "a=1, b=\"x=y\"");
}

TEST_CASE("with_kv omits an empty context") {
    REQUIRE(with_kv("VAD session started", {}) == "VAD session started");
    REQUIRE(with_kv("VAD session started", {kv("session_id", "s1")}) ==
            "VAD session started [session_id=s1]");
}
