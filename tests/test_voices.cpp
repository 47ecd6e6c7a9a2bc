#include <catch2/catch_test_macros.hpp>

#include "voice_service/speech/client.hpp"
#include "voice_service/speech/tts.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using voice_service::speech::filter_voices;

namespace {

nlohmann::json voice(const std::string& name, const std::string& locale) {
    return {{"Name", name}, {"Locale", locale}, {"Gender", "Female"}, {"Description", name + " voice"}};
}

const std::vector<std::string> kLocales{"zh-CN", "en-US"};

}

TEST_CASE("filter_voices keeps configured locales") {
    const nlohmann::json payload = nlohmann::json::array({
        voice("zh-CN-XiaoxiaoNeural", "zh-CN"),
        voice("fr-FR-DeniseNeural", "fr-FR"),
        voice("en-US-AriaNeural", "en-US"),
    });
    const auto voices = filter_voices(payload, kLocales, 20);
    REQUIRE(voices.size() == 2);
    REQUIRE(voices[0].name == "zh-CN-XiaoxiaoNeural");
    REQUIRE(voices[0].gender == "Female");
    REQUIRE(voices[0].description == "zh-CN-XiaoxiaoNeural voice");
    REQUIRE(voices[1].locale == "en-US");
}

TEST_CASE("filter_voices caps the list") {
    nlohmann::json payload = nlohmann::json::array();
    for (int i = 0; i < 30; ++i) {
        payload.push_back(voice("en-US-Voice" + std::to_string(i), "en-US"));
    }
    REQUIRE(filter_voices(payload, kLocales, 20).size() == 20);
    REQUIRE(filter_voices(payload, kLocales, 20).back().name == "en-US-Voice19");
}

TEST_CASE("filter_voices accepts a wrapped lowercase list") {
    nlohmann::json entry = nlohmann::json::object();
    entry["name"] = "zh-CN-YunxiNeural";
    entry["locale"] = "zh-CN";
    nlohmann::json payload = nlohmann::json::object();
    payload["voices"] = nlohmann::json::array({entry});
    const auto voices = filter_voices(payload, kLocales, 20);
    REQUIRE(voices.size() == 1);
    REQUIRE(voices[0].gender.empty());
}

TEST_CASE("filter_voices with no locales keeps everything") {
    const nlohmann::json payload = nlohmann::json::array({voice("fr-FR-DeniseNeural", "fr-FR")});
    REQUIRE(filter_voices(payload, {}, 20).size() == 1);
    REQUIRE(filter_voices(nlohmann::json::array(), kLocales, 20).empty());
}

TEST_CASE("filter_voices rejects a payload that is not a list") {
    REQUIRE_THROWS_AS(filter_voices(nlohmann::json{{"error", "down"}}, kLocales, 20),
                      voice_service::speech::SpeechServiceError);
}
