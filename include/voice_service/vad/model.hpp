#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace voice_service {
namespace vad {

// Silero VAD network loaded through ONNX Runtime. One instance is shared by
// every request; inference keeps no state in the model, the caller owns the
// recurrent state vector.
class VadModel {
public:
    explicit VadModel(const std::filesystem::path& model_path);
    ~VadModel();

    static bool supports_sampling_rate(int sampling_rate);
    // Samples per inference window: 512 at 16 kHz, 256 at 8 kHz.
    static int window_size(int sampling_rate);

    std::vector<float> initialize_state() const;
    float get_speech_prob(const std::vector<float>& window,
                          int sampling_rate,
                          std::vector<float>* state) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
