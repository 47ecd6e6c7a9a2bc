#pragma once

#include <functional>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "voice_service/config.hpp"
#include "voice_service/server/rest_server.hpp"

namespace voice_service {

namespace vad {
class ClassifierAdapter;
class OneShotDetector;
class SessionRegistry;
}
namespace server {
class VadRoutes;
}
namespace speech {
class SpeechToText;
class TextToSpeech;
}

class VoiceApp {
public:
    explicit VoiceApp(Config config);
    ~VoiceApp();

    void init();
    // Blocks until should_stop returns true.
    void run(const std::function<bool()>& should_stop);
    void stop();

private:
    void init_vad();
    void init_speech();
    void register_routes();

    RestResponse handle_health(const nlohmann::json& body);
    RestResponse handle_transcribe(const nlohmann::json& body);
    RestResponse handle_synthesize(const nlohmann::json& body);
    RestServer::StreamSource handle_synthesize_stream(const nlohmann::json& body);
    RestResponse handle_list_voices(const nlohmann::json& body);

    speech::SpeechToText& stt() const;
    speech::TextToSpeech& tts() const;

    Config config_;
    std::shared_ptr<vad::ClassifierAdapter> classifier_;
    std::unique_ptr<vad::OneShotDetector> detector_;
    std::unique_ptr<vad::SessionRegistry> sessions_;
    std::unique_ptr<server::VadRoutes> vad_routes_;
    std::unique_ptr<speech::SpeechToText> stt_;
    std::unique_ptr<speech::TextToSpeech> tts_;
    std::unique_ptr<RestServer> rest_server_;
    bool stopped_ = false;
};

}
