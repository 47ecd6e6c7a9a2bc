#include "voice_service/speech/tts.hpp"

#include <utility>

#include "voice_service/logging.hpp"
#include "voice_service/speech/client.hpp"
#include "voice_service/utils/text.hpp"

namespace voice_service {
namespace speech {

namespace {

constexpr const char* kSynthesizeRoute = "/synthesize";
constexpr const char* kVoicesRoute = "/voices";

std::string field(const nlohmann::json& item, const char* upper, const char* lower) {
    for (const auto* key : {upper, lower}) {
        const auto it = item.find(key);
        if (it != item.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return "";
}

nlohmann::json to_payload(const SynthesisRequest& request) {
    return {
        {"text", request.text},
        {"voice", request.voice},
        {"rate", request.rate},
        {"pitch", request.pitch},
        {"volume", request.volume}
    };
}

}

std::vector<Voice> filter_voices(const nlohmann::json& payload,
                                 const std::vector<std::string>& locales,
                                 int limit) {
    const nlohmann::json* items = &payload;
    if (payload.is_object() && payload.contains("voices")) {
        items = &payload["voices"];
    }
    if (!items->is_array()) {
        throw SpeechServiceError("voice list response is not an array");
    }

    std::vector<Voice> voices;
    for (const auto& item : *items) {
        if (limit >= 0 && static_cast<int>(voices.size()) >= limit) {
            break;
        }
        if (!item.is_object()) {
            continue;
        }
        Voice voice;
        voice.name = field(item, "Name", "name");
        voice.locale = field(item, "Locale", "locale");
        voice.gender = field(item, "Gender", "gender");
        voice.description = field(item, "Description", "description");
        if (voice.name.empty()) {
            continue;
        }
        bool wanted = locales.empty();
        for (const auto& locale : locales) {
            if (voice.locale.find(locale) != std::string::npos) {
                wanted = true;
                break;
            }
        }
        if (wanted) {
            voices.push_back(std::move(voice));
        }
    }
    return voices;
}

RemoteTextToSpeech::RemoteTextToSpeech(std::shared_ptr<ServiceClient> client,
                                       std::vector<std::string> locales,
                                       int limit)
    : client_(std::move(client)),
      locales_(std::move(locales)),
      limit_(limit) {}

std::string RemoteTextToSpeech::synthesize(const SynthesisRequest& request) {
    logging::info("Synthesizing speech",
                  {kv("voice", request.voice),
                   kv("text", utils::preview(request.text))});
    auto audio = client_->post_for_bytes(kSynthesizeRoute, to_payload(request));
    logging::debug("Synthesis complete", {kv("bytes", audio.size())});
    return audio;
}

void RemoteTextToSpeech::synthesize_stream(const SynthesisRequest& request,
                                           const ChunkCallback& on_chunk) {
    logging::info("Streaming speech synthesis",
                  {kv("voice", request.voice),
                   kv("text", utils::preview(request.text))});
    std::size_t total = 0;
    client_->post_streaming(kSynthesizeRoute, to_payload(request),
                            [&](const char* data, std::size_t length) {
        total += length;
        return on_chunk(data, length);
    });
    logging::debug("Synthesis stream finished", {kv("bytes", total)});
}

VoiceListResult RemoteTextToSpeech::list_voices() {
    VoiceListResult result;
    try {
        result.voices = filter_voices(client_->get_json(kVoicesRoute), locales_, limit_);
    } catch (const std::exception& ex) {
        logging::error("Failed to list voices", {kv("error", ex.what())});
        result.error = ex.what();
    }
    return result;
}

}
}
