#include "voice_service/vad/silence.hpp"

#include <algorithm>
#include <limits>

namespace voice_service {
namespace vad {

SilenceTracker::SilenceTracker(int silence_frames)
    : silence_frames_(std::max(1, silence_frames)) {}

bool SilenceTracker::update(double probability, double threshold_low, bool voice_confirmed) {
    if (voice_confirmed) {
        silence_run_ = 0;
        has_voice_ = true;
        ended_ = false;
        return false;
    }
    if (probability <= threshold_low) {
        if (silence_run_ < std::numeric_limits<int>::max()) {
            ++silence_run_;
        }
        if (silence_run_ >= silence_frames_ && !ended_) {
            ended_ = true;
            has_voice_ = false;
            return true;
        }
        return false;
    }
    silence_run_ = 0;
    return false;
}

}
}
