#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "voice_service/vad/hysteresis.hpp"
#include "voice_service/vad/silence.hpp"

namespace voice_service {
namespace vad {

struct SessionParams {
    int window_frames = HysteresisWindow::kDefaultWindowSize;
    int confirm_frames = HysteresisWindow::kDefaultConfirmFrames;
    int silence_frames = SilenceTracker::kDefaultSilenceFrames;
};

struct FrameEvent {
    float probability = 0.0f;
    bool voice_confirmed = false;
    bool speech_ended = false;
    bool session_active = true;
};

struct SessionSnapshot {
    std::string id;
    std::vector<bool> voice_window;
    int voice_count = 0;
    int silence_run = 0;
    bool has_voice = false;
    bool ended = false;
    uint64_t frames_processed = 0;
    std::optional<uint64_t> last_sequence;
};

// Debounce state of one audio stream. Not synchronized; SessionRegistry
// serializes access.
class Session {
public:
    Session(std::string id, const SessionParams& params);

    const std::string& id() const { return id_; }
    bool has_voice() const { return silence_.has_voice(); }

    // Throws OutOfOrderFrameError when sequence does not advance past the last
    // applied frame. Frames without a sequence are always accepted.
    void check_sequence(const std::optional<uint64_t>& sequence) const;
    FrameEvent apply(float probability,
                     double threshold,
                     double threshold_low,
                     const std::optional<uint64_t>& sequence);

    SessionSnapshot snapshot() const;

private:
    std::string id_;
    HysteresisWindow window_;
    SilenceTracker silence_;
    uint64_t frames_processed_ = 0;
    std::optional<uint64_t> last_sequence_;
};

}
}
