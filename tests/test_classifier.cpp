#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "fake_classifier.hpp"
#include "voice_service/vad/classifier.hpp"
#include "voice_service/vad/detector.hpp"
#include "voice_service/vad/errors.hpp"

#include <memory>
#include <string>

using namespace voice_service;
using voice_service::testing::LevelClassifier;
using voice_service::testing::make_frame;

TEST_CASE("decode_pcm16 reads little-endian signed samples") {
    const std::string raw{'\x00', '\x80', '\xFF', '\x7F', '\x00', '\x00', '\xFF', '\xFF'};
    const auto samples = vad::decode_pcm16(raw);
    REQUIRE(samples.size() == 4);
    REQUIRE(samples[0] == -1.0f);
    REQUIRE(samples[1] == Catch::Approx(32767.0 / 32768.0));
    REQUIRE(samples[2] == 0.0f);
    REQUIRE(samples[3] == Catch::Approx(-1.0 / 32768.0));
}

TEST_CASE("decode_pcm16 rejects a trailing half sample") {
    REQUIRE_THROWS_AS(vad::decode_pcm16(std::string(3, '\0')), vad::InvalidAudioError);
}

TEST_CASE("classify rejects malformed frames") {
    auto fake = std::make_shared<LevelClassifier>();
    vad::ClassifierAdapter adapter(fake);

    REQUIRE_THROWS_AS(adapter.classify("", 16000), vad::InvalidAudioError);
    REQUIRE_THROWS_AS(adapter.classify(std::string(5, '\x01'), 16000), vad::InvalidAudioError);
    REQUIRE_THROWS_AS(adapter.classify(make_frame(0.5), 44100), vad::InvalidAudioError);
    REQUIRE(fake->calls == 0);
}

TEST_CASE("classify reports a missing model before looking at the audio") {
    vad::ClassifierAdapter adapter(nullptr, false, "model file missing");
    REQUIRE_FALSE(adapter.available());
    REQUIRE_THROWS_AS(adapter.classify(make_frame(0.5), 16000), vad::ModelUnavailableError);
    REQUIRE_THROWS_AS(adapter.classify("", 44100), vad::ModelUnavailableError);
}

TEST_CASE("classify accepts both supported sample rates") {
    auto fake = std::make_shared<LevelClassifier>();
    vad::ClassifierAdapter adapter(fake);
    REQUIRE(adapter.classify(make_frame(0.4, 256), 8000) == Catch::Approx(0.4).margin(1e-3));
    REQUIRE(adapter.classify(make_frame(0.4), 16000) == Catch::Approx(0.4).margin(1e-3));
}

TEST_CASE("classify wraps inference failures") {
    auto fake = std::make_shared<LevelClassifier>();
    vad::ClassifierAdapter adapter(fake);
    fake->fail_next = true;
    REQUIRE_THROWS_AS(adapter.classify(make_frame(0.4), 16000), vad::ClassifierFailureError);
    REQUIRE(adapter.classify(make_frame(0.4), 16000) == Catch::Approx(0.4).margin(1e-3));
}

TEST_CASE("classify clamps the probability into [0, 1]") {
    auto fake = std::make_shared<LevelClassifier>();
    fake->gain = 3.0f;
    vad::ClassifierAdapter adapter(fake);
    REQUIRE(adapter.classify(make_frame(0.9), 16000) == 1.0f);
}

TEST_CASE("classify works with a classifier that must be serialized") {
    auto fake = std::make_shared<LevelClassifier>();
    fake->safe = false;
    vad::ClassifierAdapter adapter(fake);
    REQUIRE(adapter.classify(make_frame(0.2), 16000) == Catch::Approx(0.2).margin(1e-3));
}

TEST_CASE("one-shot detection compares against the threshold") {
    auto adapter = std::make_shared<vad::ClassifierAdapter>(std::make_shared<LevelClassifier>());
    vad::OneShotDetector detector(adapter);

    const auto loud = detector.detect(make_frame(0.8), 16000, 0.5);
    REQUIRE(loud.has_voice);
    REQUIRE(loud.probability == Catch::Approx(0.8).margin(1e-3));

    const auto quiet = detector.detect(make_frame(0.1), 16000, 0.5);
    REQUIRE_FALSE(quiet.has_voice);

    REQUIRE(detector.detect(make_frame(0.1), 16000, 0.05).has_voice);
}

TEST_CASE("one-shot detection is repeatable") {
    auto adapter = std::make_shared<vad::ClassifierAdapter>(std::make_shared<LevelClassifier>());
    vad::OneShotDetector detector(adapter);
    const auto frame = make_frame(0.37);
    const auto first = detector.detect(frame, 16000, 0.5);
    for (int i = 0; i < 5; ++i) {
        const auto again = detector.detect(frame, 16000, 0.5);
        REQUIRE(again.probability == first.probability);
        REQUIRE(again.has_voice == first.has_voice);
    }
}
