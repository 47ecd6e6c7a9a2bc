#include "voice_service/speech/stt.hpp"

#include <chrono>
#include <utility>

#include <nlohmann/json.hpp>

#include "voice_service/logging.hpp"
#include "voice_service/speech/client.hpp"
#include "voice_service/utils/base64.hpp"
#include "voice_service/utils/text.hpp"
#include "voice_service/vad/errors.hpp"

namespace voice_service {
namespace speech {

RemoteSpeechToText::RemoteSpeechToText(std::shared_ptr<ServiceClient> client)
    : client_(std::move(client)) {}

std::string RemoteSpeechToText::transcribe(const std::string& audio,
                                           const std::string& format,
                                           const std::string& language) {
    if (audio.empty()) {
        throw vad::InvalidAudioError("audio is empty");
    }
    if (format == "pcm" && audio.size() % 2 != 0) {
        throw vad::InvalidAudioError("PCM audio must have an even number of bytes");
    }

    nlohmann::json payload{
        {"audio_data", utils::base64_encode(audio)},
        {"format", format},
        {"language", language}
    };
    const auto started = std::chrono::steady_clock::now();
    const auto response = client_->post_json("", payload);
    if (!response.is_object() || !response.contains("text") || !response["text"].is_string()) {
        throw SpeechServiceError("speech-to-text response has no text field");
    }
    auto text = response["text"].get<std::string>();
    const auto elapsed = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - started).count();
    logging::info("Transcription complete",
                  {kv("bytes", audio.size()),
                   kv("format", format),
                   kv("language", language),
                   kv("elapsed_s", elapsed),
                   kv("text", utils::preview(text))});
    return text;
}

}
}
