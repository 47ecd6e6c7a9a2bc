#include <catch2/catch_test_macros.hpp>

#include "fake_classifier.hpp"
#include "voice_service/vad/classifier.hpp"
#include "voice_service/vad/errors.hpp"
#include "voice_service/vad/registry.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace voice_service;
using voice_service::testing::LevelClassifier;
using voice_service::testing::make_frame;

namespace {

constexpr int kRate = 16000;
constexpr double kHigh = 0.5;
constexpr double kLow = 0.15;

struct Fixture {
    std::shared_ptr<LevelClassifier> fake = std::make_shared<LevelClassifier>();
    vad::SessionRegistry registry{std::make_shared<vad::ClassifierAdapter>(fake)};

    vad::FrameEvent send(const std::string& id,
                         double level,
                         std::optional<uint64_t> sequence = std::nullopt) {
        return registry.process(id, make_frame(level), kRate, kHigh, kLow, sequence);
    }
};

}

TEST_CASE("voice is confirmed on the third loud frame") {
    Fixture f;
    f.registry.start("call-1");
    REQUIRE_FALSE(f.send("call-1", 0.9).voice_confirmed);
    REQUIRE_FALSE(f.send("call-1", 0.9).voice_confirmed);
    const auto third = f.send("call-1", 0.9);
    REQUIRE(third.voice_confirmed);
    REQUIRE(third.session_active);
    REQUIRE_FALSE(third.speech_ended);

    const auto result = f.registry.end("call-1");
    REQUIRE(result.found);
    REQUIRE(result.had_voice);
}

TEST_CASE("speech end is reported once after sixteen silent frames") {
    Fixture f;
    f.registry.start("s");
    for (int i = 0; i < 3; ++i) {
        f.send("s", 0.9);
    }
    // The two frames after voice keep the window confirmed.
    f.send("s", 0.05);
    f.send("s", 0.05);

    int ended = 0;
    int ended_at = -1;
    for (int i = 0; i < 40; ++i) {
        if (f.send("s", 0.05).speech_ended) {
            ++ended;
            ended_at = i;
        }
    }
    REQUIRE(ended == 1);
    REQUIRE(ended_at == 15);
    REQUIRE_FALSE(f.registry.end("s").had_voice);
}

TEST_CASE("starting an existing session resets it") {
    Fixture f;
    f.registry.start("dup");
    for (int i = 0; i < 3; ++i) {
        f.send("dup", 0.9);
    }
    for (int i = 0; i < 6; ++i) {
        f.send("dup", 0.05);
    }
    REQUIRE(f.registry.snapshot("dup")->silence_run == 4);
    REQUIRE(f.registry.snapshot("dup")->has_voice);

    f.registry.start("dup");
    const auto snapshot = f.registry.snapshot("dup");
    REQUIRE(snapshot);
    REQUIRE(snapshot->frames_processed == 0);
    REQUIRE(snapshot->voice_window.empty());
    REQUIRE(snapshot->silence_run == 0);
    REQUIRE_FALSE(snapshot->has_voice);
    REQUIRE(f.registry.size() == 1);
}

TEST_CASE("ending a session twice is tolerated") {
    Fixture f;
    f.registry.start("twice");
    REQUIRE(f.registry.end("twice").found);

    const auto second = f.registry.end("twice");
    REQUIRE_FALSE(second.found);
    REQUIRE_FALSE(second.had_voice);
    REQUIRE_FALSE(f.registry.end("never-started").found);
}

TEST_CASE("processing an unknown session fails") {
    Fixture f;
    REQUIRE_THROWS_AS(f.send("ghost", 0.9), vad::SessionNotFoundError);
    f.registry.start("gone");
    f.registry.end("gone");
    REQUIRE_THROWS_AS(f.send("gone", 0.9), vad::SessionNotFoundError);
}

TEST_CASE("frames with a stale sequence number are rejected") {
    Fixture f;
    f.registry.start("seq");
    f.send("seq", 0.9, 1);
    f.send("seq", 0.9, 2);
    REQUIRE_THROWS_AS(f.send("seq", 0.9, 2), vad::OutOfOrderFrameError);
    REQUIRE_THROWS_AS(f.send("seq", 0.9, 1), vad::OutOfOrderFrameError);

    const auto snapshot = f.registry.snapshot("seq");
    REQUIRE(snapshot->frames_processed == 2);
    REQUIRE(*snapshot->last_sequence == 2);

    f.send("seq", 0.9, 7);
    f.send("seq", 0.9);
    REQUIRE(f.registry.snapshot("seq")->frames_processed == 4);
}

TEST_CASE("a failed frame leaves the session untouched") {
    Fixture f;
    f.registry.start("fail");
    f.send("fail", 0.9);
    const auto before = f.registry.snapshot("fail");

    REQUIRE_THROWS_AS(f.registry.process("fail", std::string(7, '\x01'), kRate, kHigh, kLow),
                      vad::InvalidAudioError);
    REQUIRE_THROWS_AS(f.registry.process("fail", make_frame(0.9), 22050, kHigh, kLow),
                      vad::InvalidAudioError);
    f.fake->fail_next = true;
    REQUIRE_THROWS_AS(f.send("fail", 0.9, 5), vad::ClassifierFailureError);

    const auto after = f.registry.snapshot("fail");
    REQUIRE(after->frames_processed == before->frames_processed);
    REQUIRE(after->voice_window == before->voice_window);
    REQUIRE(after->silence_run == before->silence_run);
    REQUIRE_FALSE(after->last_sequence);

    f.send("fail", 0.9, 5);
    REQUIRE(f.registry.snapshot("fail")->frames_processed == 2);
}

TEST_CASE("sessions fail with model unavailable when no classifier loaded") {
    vad::SessionRegistry registry(std::make_shared<vad::ClassifierAdapter>(nullptr));
    registry.start("no-model");
    REQUIRE_THROWS_AS(registry.process("no-model", make_frame(0.9), kRate, kHigh, kLow),
                      vad::ModelUnavailableError);
    REQUIRE(registry.snapshot("no-model")->frames_processed == 0);
    REQUIRE(registry.end("no-model").found);
}

TEST_CASE("concurrent sessions do not affect each other") {
    Fixture f;
    f.registry.start("loud");
    f.registry.start("quiet");

    std::atomic<int> loud_confirmed{0};
    std::atomic<int> quiet_confirmed{0};
    std::atomic<int> quiet_ended{0};
    std::thread loud([&]() {
        for (int i = 0; i < 60; ++i) {
            if (f.send("loud", 0.9).voice_confirmed) {
                ++loud_confirmed;
            }
        }
    });
    std::thread quiet([&]() {
        for (int i = 0; i < 60; ++i) {
            const auto event = f.send("quiet", 0.02);
            if (event.voice_confirmed) {
                ++quiet_confirmed;
            }
            if (event.speech_ended) {
                ++quiet_ended;
            }
        }
    });
    loud.join();
    quiet.join();

    REQUIRE(loud_confirmed == 58);
    REQUIRE(quiet_confirmed == 0);
    REQUIRE(quiet_ended == 1);
    REQUIRE(f.registry.end("loud").had_voice);
    REQUIRE_FALSE(f.registry.end("quiet").had_voice);
}

TEST_CASE("frames of one session from several threads are all applied") {
    Fixture f;
    f.registry.start("shared");
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&f]() {
            for (int i = 0; i < 25; ++i) {
                f.send("shared", 0.9);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    const auto snapshot = f.registry.snapshot("shared");
    REQUIRE(snapshot->frames_processed == 100);
    REQUIRE(snapshot->voice_count == 5);
    REQUIRE(snapshot->voice_window.size() == 5);
}

TEST_CASE("shutdown drops every session") {
    Fixture f;
    f.registry.start("a");
    f.registry.start("b");
    REQUIRE(f.registry.shutdown() == 2);
    REQUIRE(f.registry.size() == 0);
    REQUIRE_FALSE(f.registry.snapshot("a"));
}
