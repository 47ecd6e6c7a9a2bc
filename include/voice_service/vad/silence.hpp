#pragma once

namespace voice_service {
namespace vad {

// Counts consecutive frames at or below the low threshold and reports the end
// of an utterance once per silence run. Only a confirmed-voice frame re-arms
// the end-of-speech edge; ambiguous frames reset the run but not the latch.
class SilenceTracker {
public:
    static constexpr int kDefaultSilenceFrames = 16;

    explicit SilenceTracker(int silence_frames = kDefaultSilenceFrames);

    bool update(double probability, double threshold_low, bool voice_confirmed);

    int silence_run() const { return silence_run_; }
    bool has_voice() const { return has_voice_; }
    bool ended() const { return ended_; }

private:
    int silence_frames_;
    int silence_run_ = 0;
    bool has_voice_ = false;
    bool ended_ = false;
};

}
}
