#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace voice_service {
namespace vad {

class VadModel;

// Anything that maps one frame of normalized samples to a speech probability.
class FrameClassifier {
public:
    virtual ~FrameClassifier() = default;

    virtual bool supports_sample_rate(int sample_rate) const = 0;
    virtual float speech_probability(const std::vector<float>& samples, int sample_rate) = 0;
    // False when concurrent speech_probability() calls must be serialized.
    virtual bool thread_safe() const { return true; }
};

// Runs a frame through the Silero model window by window. The recurrent state
// starts from zero for every frame so a frame always scores the same; the
// frame probability is the highest window probability.
class OnnxFrameClassifier : public FrameClassifier {
public:
    explicit OnnxFrameClassifier(std::shared_ptr<VadModel> model);

    bool supports_sample_rate(int sample_rate) const override;
    float speech_probability(const std::vector<float>& samples, int sample_rate) override;

private:
    std::shared_ptr<VadModel> model_;
};

// Little-endian signed 16-bit PCM to floats in [-1, 1).
std::vector<float> decode_pcm16(const std::string& raw_bytes);

class ClassifierAdapter {
public:
    ClassifierAdapter(std::shared_ptr<FrameClassifier> classifier,
                      bool serialize_calls = false,
                      std::string unavailable_reason = "VAD model not loaded");

    bool available() const;
    float classify(const std::string& raw_bytes, int sample_rate) const;

private:
    std::shared_ptr<FrameClassifier> classifier_;
    bool serialize_calls_;
    std::string unavailable_reason_;
    mutable std::mutex inference_mutex_;
};

}
}
