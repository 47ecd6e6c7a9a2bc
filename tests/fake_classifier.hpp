#pragma once

#include <atomic>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "voice_service/vad/classifier.hpp"

namespace voice_service::testing {

// Scores a frame by its mean absolute amplitude, so a frame built with
// make_frame(p) classifies as (almost exactly) p.
class LevelClassifier : public vad::FrameClassifier {
public:
    bool supports_sample_rate(int sample_rate) const override {
        return sample_rate == 8000 || sample_rate == 16000;
    }

    float speech_probability(const std::vector<float>& samples, int) override {
        ++calls;
        if (fail_next) {
            fail_next = false;
            throw std::runtime_error("inference exploded");
        }
        double sum = 0.0;
        for (float sample : samples) {
            sum += std::fabs(sample);
        }
        return static_cast<float>(sum / static_cast<double>(samples.size())) * gain;
    }

    bool thread_safe() const override { return safe; }

    std::atomic<int> calls{0};
    bool fail_next = false;
    bool safe = true;
    float gain = 1.0f;
};

// 16-bit little-endian PCM of constant amplitude level (0..1).
inline std::string make_frame(double level, std::size_t samples = 512) {
    const auto value = static_cast<int16_t>(std::lround(level * 32767.0));
    std::string frame;
    frame.reserve(samples * 2);
    for (std::size_t i = 0; i < samples; ++i) {
        frame.push_back(static_cast<char>(value & 0xFF));
        frame.push_back(static_cast<char>((value >> 8) & 0xFF));
    }
    return frame;
}

}
