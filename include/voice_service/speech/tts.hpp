#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace voice_service {
namespace speech {

class ServiceClient;

struct SynthesisRequest {
    std::string text;
    std::string voice;
    std::string rate = "+0%";
    std::string pitch = "+0Hz";
    std::string volume = "+0%";
};

struct Voice {
    std::string name;
    std::string locale;
    std::string gender;
    std::string description;
};

// An empty voice list and a failed lookup are different outcomes.
struct VoiceListResult {
    std::vector<Voice> voices;
    std::optional<std::string> error;

    bool ok() const { return !error.has_value(); }
};

class TextToSpeech {
public:
    using ChunkCallback = std::function<bool(const char*, std::size_t)>;

    virtual ~TextToSpeech() = default;

    virtual std::string synthesize(const SynthesisRequest& request) = 0;
    // Stops early without raising when on_chunk returns false.
    virtual void synthesize_stream(const SynthesisRequest& request,
                                   const ChunkCallback& on_chunk) = 0;
    virtual VoiceListResult list_voices() = 0;
};

class RemoteTextToSpeech : public TextToSpeech {
public:
    RemoteTextToSpeech(std::shared_ptr<ServiceClient> client,
                       std::vector<std::string> locales,
                       int limit);

    std::string synthesize(const SynthesisRequest& request) override;
    void synthesize_stream(const SynthesisRequest& request,
                           const ChunkCallback& on_chunk) override;
    VoiceListResult list_voices() override;

private:
    std::shared_ptr<ServiceClient> client_;
    std::vector<std::string> locales_;
    int limit_;
};

// Keeps voices whose locale contains one of locales (all when empty), at most
// limit of them. Accepts a bare array or {"voices": [...]}, with either
// capitalized or lowercase field names.
std::vector<Voice> filter_voices(const nlohmann::json& payload,
                                 const std::vector<std::string>& locales,
                                 int limit);

}
}
