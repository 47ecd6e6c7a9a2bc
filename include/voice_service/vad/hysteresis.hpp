#pragma once

#include <cstddef>
#include <deque>
#include <vector>

namespace voice_service {
namespace vad {

// Majority-of-recent-frames debounce. Keeps the last window_size raw
// decisions and reports voice once confirm_frames of them are positive.
class HysteresisWindow {
public:
    static constexpr int kDefaultWindowSize = 5;
    static constexpr int kDefaultConfirmFrames = 3;

    HysteresisWindow(int window_size = kDefaultWindowSize,
                     int confirm_frames = kDefaultConfirmFrames);

    bool update(double probability, double threshold);

    bool confirmed() const;
    int voice_count() const;
    std::size_t size() const;
    std::vector<bool> contents() const;

private:
    std::size_t window_size_;
    int confirm_frames_;
    std::deque<bool> window_;
    int voice_count_ = 0;
};

}
}
