#include "voice_service/vad/classifier.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <utility>

#include "voice_service/logging.hpp"
#include "voice_service/metrics.hpp"
#include "voice_service/vad/errors.hpp"
#include "voice_service/vad/model.hpp"

namespace voice_service {
namespace vad {

OnnxFrameClassifier::OnnxFrameClassifier(std::shared_ptr<VadModel> model)
    : model_(std::move(model)) {}

bool OnnxFrameClassifier::supports_sample_rate(int sample_rate) const {
    return VadModel::supports_sampling_rate(sample_rate);
}

float OnnxFrameClassifier::speech_probability(const std::vector<float>& samples,
                                              int sample_rate) {
    const auto window_size = static_cast<size_t>(VadModel::window_size(sample_rate));
    auto state = model_->initialize_state();
    float best = 0.0f;
    std::vector<float> window(window_size, 0.0f);
    for (size_t offset = 0; offset < samples.size(); offset += window_size) {
        const size_t count = std::min(window_size, samples.size() - offset);
        std::copy(samples.begin() + offset, samples.begin() + offset + count, window.begin());
        std::fill(window.begin() + count, window.end(), 0.0f);
        best = std::max(best, model_->get_speech_prob(window, sample_rate, &state));
    }
    return best;
}

std::vector<float> decode_pcm16(const std::string& raw_bytes) {
    if (raw_bytes.size() % 2 != 0) {
        throw InvalidAudioError("audio length " + std::to_string(raw_bytes.size()) +
                                " is not a whole number of 16-bit samples");
    }
    std::vector<float> samples;
    samples.reserve(raw_bytes.size() / 2);
    for (size_t i = 0; i + 1 < raw_bytes.size(); i += 2) {
        const auto lo = static_cast<uint16_t>(static_cast<unsigned char>(raw_bytes[i]));
        const auto hi = static_cast<uint16_t>(static_cast<unsigned char>(raw_bytes[i + 1]));
        const auto sample = static_cast<int16_t>(static_cast<uint16_t>(lo | (hi << 8)));
        samples.push_back(static_cast<float>(sample) / 32768.0f);
    }
    return samples;
}

ClassifierAdapter::ClassifierAdapter(std::shared_ptr<FrameClassifier> classifier,
                                     bool serialize_calls,
                                     std::string unavailable_reason)
    : classifier_(std::move(classifier)),
      serialize_calls_(serialize_calls || (classifier_ && !classifier_->thread_safe())),
      unavailable_reason_(std::move(unavailable_reason)) {}

bool ClassifierAdapter::available() const {
    return static_cast<bool>(classifier_);
}

float ClassifierAdapter::classify(const std::string& raw_bytes, int sample_rate) const {
    if (!classifier_) {
        throw ModelUnavailableError(unavailable_reason_);
    }
    if (!classifier_->supports_sample_rate(sample_rate)) {
        throw InvalidAudioError("unsupported sample rate " + std::to_string(sample_rate));
    }
    const auto samples = decode_pcm16(raw_bytes);
    if (samples.empty()) {
        throw InvalidAudioError("audio frame is empty");
    }

    const auto start = std::chrono::steady_clock::now();
    float probability = 0.0f;
    try {
        if (serialize_calls_) {
            std::lock_guard<std::mutex> lock(inference_mutex_);
            probability = classifier_->speech_probability(samples, sample_rate);
        } else {
            probability = classifier_->speech_probability(samples, sample_rate);
        }
    } catch (const VadError&) {
        throw;
    } catch (const std::exception& ex) {
        logging::error("Frame classification failed",
                       {kv("error", ex.what()),
                        kv("samples", samples.size()),
                        kv("sample_rate", sample_rate)});
        throw ClassifierFailureError(std::string("classification failed: ") + ex.what());
    }
    const auto elapsed = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();
    Metrics::instance().observe_classifier_latency(elapsed);
    return std::clamp(probability, 0.0f, 1.0f);
}

}
}
