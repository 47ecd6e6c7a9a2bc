#include "voice_service/app.hpp"

#include <chrono>
#include <filesystem>
#include <system_error>
#include <thread>
#include <utility>

#include "voice_service/logging.hpp"
#include "voice_service/server/request.hpp"
#include "voice_service/server/vad_routes.hpp"
#include "voice_service/speech/client.hpp"
#include "voice_service/speech/stt.hpp"
#include "voice_service/speech/tts.hpp"
#include "voice_service/utils/base64.hpp"
#include "voice_service/utils/http.hpp"
#include "voice_service/utils/text.hpp"
#include "voice_service/vad/classifier.hpp"
#include "voice_service/vad/detector.hpp"
#include "voice_service/vad/model.hpp"
#include "voice_service/vad/registry.hpp"

namespace voice_service {

VoiceApp::VoiceApp(Config config)
    : config_(std::move(config)) {}

VoiceApp::~VoiceApp() {
    stop();
}

void VoiceApp::init() {
    init_vad();
    init_speech();

    vad::SessionParams params;
    params.window_frames = config_.vad_window_frames;
    params.confirm_frames = config_.vad_confirm_frames;
    params.silence_frames = config_.vad_silence_frames;
    detector_ = std::make_unique<vad::OneShotDetector>(classifier_);
    sessions_ = std::make_unique<vad::SessionRegistry>(classifier_, params);
    vad_routes_ = std::make_unique<server::VadRoutes>(
        *detector_, *sessions_,
        server::VadDefaults{config_.vad_sampling_rate,
                            config_.vad_threshold,
                            config_.vad_threshold_low});

    rest_server_ = std::make_unique<RestServer>(config_);
    register_routes();
    rest_server_->start();
}

void VoiceApp::run(const std::function<bool()>& should_stop) {
    while (!should_stop()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

void VoiceApp::stop() {
    if (stopped_) {
        return;
    }
    stopped_ = true;
    if (rest_server_) {
        rest_server_->stop();
    }
    if (sessions_) {
        sessions_->shutdown();
    }
}

void VoiceApp::init_vad() {
    std::error_code ec;
    std::filesystem::create_directories(config_.models_dir, ec);
    if (ec) {
        logging::warn("Cannot create models directory",
                      {kv("path", config_.models_dir.string()), kv("error", ec.message())});
    }

    if (!std::filesystem::exists(config_.vad_model_path)) {
        if (config_.vad_auto_download) {
            logging::info("Downloading VAD model",
                          {kv("url", config_.vad_model_url),
                           kv("path", config_.vad_model_path.string())});
            if (!utils::download_file(config_.vad_model_url, config_.vad_model_path)) {
                logging::error("VAD model download failed",
                               {kv("url", config_.vad_model_url)});
            }
        } else {
            logging::warn("VAD model missing and auto download disabled",
                          {kv("path", config_.vad_model_path.string())});
        }
    }

    std::shared_ptr<vad::FrameClassifier> classifier;
    std::string reason = "VAD model not loaded";
    try {
        auto model = std::make_shared<vad::VadModel>(config_.vad_model_path);
        classifier = std::make_shared<vad::OnnxFrameClassifier>(std::move(model));
        logging::info("VAD model loaded", {kv("path", config_.vad_model_path.string())});
    } catch (const std::exception& ex) {
        reason = std::string("VAD model not loaded: ") + ex.what();
        logging::error("Failed to load VAD model",
                       {kv("path", config_.vad_model_path.string()), kv("error", ex.what())});
    }
    classifier_ = std::make_shared<vad::ClassifierAdapter>(
        std::move(classifier), config_.vad_serialize_inference, reason);
}

void VoiceApp::init_speech() {
    speech::ServiceRequestOptions options;
    options.connect_timeout = std::chrono::seconds(config_.upstream_connect_timeout);
    options.read_timeout = std::chrono::seconds(config_.upstream_read_timeout);
    options.write_timeout = std::chrono::seconds(config_.upstream_write_timeout);

    if (config_.stt_url) {
        stt_ = std::make_unique<speech::RemoteSpeechToText>(
            std::make_shared<speech::ServiceClient>(*config_.stt_url, options));
        logging::info("Speech-to-text engine configured", {kv("url", *config_.stt_url)});
    } else {
        logging::warn("STT_URL not set; /asr is unavailable");
    }
    if (config_.tts_url) {
        tts_ = std::make_unique<speech::RemoteTextToSpeech>(
            std::make_shared<speech::ServiceClient>(*config_.tts_url, options),
            config_.tts_voice_locales,
            config_.tts_voice_limit);
        logging::info("Text-to-speech engine configured", {kv("url", *config_.tts_url)});
    } else {
        logging::warn("TTS_URL not set; /tts routes are unavailable");
    }
}

void VoiceApp::register_routes() {
    auto route = [this](RestResponse (VoiceApp::*method)(const nlohmann::json&)) {
        return [this, method](const nlohmann::json& body) { return (this->*method)(body); };
    };
    rest_server_->get("/health", route(&VoiceApp::handle_health));
    const auto* vad = vad_routes_.get();
    rest_server_->post("/vad", [vad](const nlohmann::json& body) { return vad->detect(body); });
    rest_server_->post("/vad/session/start",
                       [vad](const nlohmann::json& body) { return vad->start(body); });
    rest_server_->post("/vad/session/process",
                       [vad](const nlohmann::json& body) { return vad->process(body); });
    rest_server_->post("/vad/session/end",
                       [vad](const nlohmann::json& body) { return vad->end(body); });
    rest_server_->post("/asr", route(&VoiceApp::handle_transcribe));
    rest_server_->post("/tts", route(&VoiceApp::handle_synthesize));
    rest_server_->post_stream("/tts/stream", "audio/mpeg",
                              [this](const nlohmann::json& body) {
                                  return handle_synthesize_stream(body);
                              });
    rest_server_->get("/tts/voices", route(&VoiceApp::handle_list_voices));
}

RestResponse VoiceApp::handle_health(const nlohmann::json&) {
    const bool vad_loaded = classifier_ && classifier_->available();
    nlohmann::json payload{
        {"status", vad_loaded ? "healthy" : "degraded"},
        {"service", "voice_service"},
        {"vad_loaded", vad_loaded},
        {"asr_loaded", static_cast<bool>(stt_)},
        {"tts_configured", static_cast<bool>(tts_)},
        {"active_sessions", sessions_ ? sessions_->size() : 0},
        {"models_dir", config_.models_dir.string()},
        {"models_exist", std::filesystem::exists(config_.models_dir)}
    };
    logging::debug("Health check served");
    return {200, payload};
}

RestResponse VoiceApp::handle_transcribe(const nlohmann::json& body) {
    auto& engine = stt();
    const auto audio = server::require_audio(body, "audio_data");
    const auto format = server::optional_string(body, "format", "pcm");
    const auto language = server::optional_string(body, "language", config_.stt_language);
    const auto text = engine.transcribe(audio, format, language);
    return {200, {{"text", text}, {"language", language}}};
}

namespace {

speech::SynthesisRequest read_synthesis_request(const nlohmann::json& body,
                                                const std::string& default_voice) {
    speech::SynthesisRequest request;
    request.text = utils::sanitize_speech_text(server::require_string(body, "text"));
    if (request.text.empty()) {
        throw server::invalid_request("text is empty after removing unsupported characters");
    }
    request.voice = server::optional_string(body, "voice", default_voice);
    request.rate = server::optional_string(body, "rate", request.rate);
    request.pitch = server::optional_string(body, "pitch", request.pitch);
    request.volume = server::optional_string(body, "volume", request.volume);
    return request;
}

}

RestResponse VoiceApp::handle_synthesize(const nlohmann::json& body) {
    auto& engine = tts();
    const auto request = read_synthesis_request(body, config_.tts_voice);
    const auto audio = engine.synthesize(request);
    return {200, {{"audio_data", utils::base64_encode(audio)}, {"format", "mp3"}}};
}

RestServer::StreamSource VoiceApp::handle_synthesize_stream(const nlohmann::json& body) {
    auto* engine = &tts();
    auto request = read_synthesis_request(body, config_.tts_voice);
    return [engine, request = std::move(request)](const RestServer::ChunkSink& sink) {
        engine->synthesize_stream(request, sink);
    };
}

RestResponse VoiceApp::handle_list_voices(const nlohmann::json&) {
    auto result = tts().list_voices();
    if (!result.ok()) {
        throw speech::SpeechServiceError("failed to list voices: " + *result.error);
    }
    nlohmann::json voices = nlohmann::json::array();
    for (const auto& voice : result.voices) {
        voices.push_back({
            {"name", voice.name},
            {"locale", voice.locale},
            {"gender", voice.gender},
            {"description", voice.description}
        });
    }
    return {200, {{"voices", voices}}};
}

speech::SpeechToText& VoiceApp::stt() const {
    if (!stt_) {
        throw server::service_unavailable("speech-to-text engine is not configured");
    }
    return *stt_;
}

speech::TextToSpeech& VoiceApp::tts() const {
    if (!tts_) {
        throw server::service_unavailable("text-to-speech engine is not configured");
    }
    return *tts_;
}

}
