#include <catch2/catch_test_macros.hpp>

#include "voice_service/vad/silence.hpp"

using voice_service::vad::SilenceTracker;

namespace {

constexpr double kLow = 0.15;

int feed_silence(SilenceTracker& tracker, int frames) {
    int fired = 0;
    for (int i = 0; i < frames; ++i) {
        if (tracker.update(0.02, kLow, false)) {
            ++fired;
        }
    }
    return fired;
}

}

TEST_CASE("speech end fires on the sixteenth silent frame") {
    SilenceTracker tracker;
    REQUIRE_FALSE(tracker.update(0.9, kLow, true));
    REQUIRE(tracker.has_voice());

    for (int i = 1; i <= 15; ++i) {
        REQUIRE_FALSE(tracker.update(0.02, kLow, false));
        REQUIRE(tracker.silence_run() == i);
    }
    REQUIRE(tracker.update(0.02, kLow, false));
    REQUIRE_FALSE(tracker.has_voice());
    REQUIRE(tracker.ended());
}

TEST_CASE("speech end does not repeat while silence continues") {
    SilenceTracker tracker;
    tracker.update(0.9, kLow, true);
    REQUIRE(feed_silence(tracker, 16) == 1);
    REQUIRE(feed_silence(tracker, 50) == 0);
    REQUIRE(tracker.silence_run() == 66);
}

TEST_CASE("confirmed voice re-arms speech end") {
    SilenceTracker tracker;
    tracker.update(0.9, kLow, true);
    REQUIRE(feed_silence(tracker, 20) == 1);

    REQUIRE_FALSE(tracker.update(0.9, kLow, true));
    REQUIRE(tracker.silence_run() == 0);
    REQUIRE_FALSE(tracker.ended());
    REQUIRE(feed_silence(tracker, 16) == 1);
}

TEST_CASE("ambiguous frame restarts the silence run") {
    SilenceTracker tracker;
    tracker.update(0.9, kLow, true);
    REQUIRE(feed_silence(tracker, 10) == 0);
    REQUIRE_FALSE(tracker.update(0.3, kLow, false));
    REQUIRE(tracker.silence_run() == 0);
    REQUIRE(feed_silence(tracker, 15) == 0);
    REQUIRE(feed_silence(tracker, 1) == 1);
}

TEST_CASE("ambiguous frame after speech end does not re-arm") {
    SilenceTracker tracker;
    tracker.update(0.9, kLow, true);
    REQUIRE(feed_silence(tracker, 16) == 1);
    tracker.update(0.3, kLow, false);
    REQUIRE(feed_silence(tracker, 32) == 0);
}

TEST_CASE("probability equal to the low threshold counts as silence") {
    SilenceTracker tracker(1);
    REQUIRE(tracker.update(kLow, kLow, false));
}

TEST_CASE("stream that never had voice reports one speech end") {
    SilenceTracker tracker;
    REQUIRE(feed_silence(tracker, 40) == 1);
    REQUIRE_FALSE(tracker.has_voice());
}
