#include "voice_service/vad/hysteresis.hpp"

#include <algorithm>

namespace voice_service {
namespace vad {

HysteresisWindow::HysteresisWindow(int window_size, int confirm_frames)
    : window_size_(static_cast<std::size_t>(std::max(1, window_size))),
      confirm_frames_(std::max(1, confirm_frames)) {}

bool HysteresisWindow::update(double probability, double threshold) {
    const bool is_voice = probability >= threshold;
    window_.push_back(is_voice);
    if (is_voice) {
        ++voice_count_;
    }
    while (window_.size() > window_size_) {
        if (window_.front()) {
            --voice_count_;
        }
        window_.pop_front();
    }
    return confirmed();
}

bool HysteresisWindow::confirmed() const {
    return voice_count_ >= confirm_frames_;
}

int HysteresisWindow::voice_count() const {
    return voice_count_;
}

std::size_t HysteresisWindow::size() const {
    return window_.size();
}

std::vector<bool> HysteresisWindow::contents() const {
    return std::vector<bool>(window_.begin(), window_.end());
}

}
}
