#include "voice_service/server/vad_routes.hpp"

#include "voice_service/vad/detector.hpp"
#include "voice_service/vad/registry.hpp"

namespace voice_service {
namespace server {

VadRoutes::VadRoutes(vad::OneShotDetector& detector,
                     vad::SessionRegistry& sessions,
                     VadDefaults defaults)
    : detector_(detector),
      sessions_(sessions),
      defaults_(defaults) {}

RestResponse VadRoutes::detect(const nlohmann::json& body) const {
    const auto audio = require_audio(body, "audio_data");
    const auto sample_rate = optional_int(body, "sample_rate", defaults_.sample_rate);
    const auto threshold = optional_probability(body, "threshold", defaults_.threshold);
    const auto detection = detector_.detect(audio, sample_rate, threshold);
    return {200, {{"has_voice", detection.has_voice}, {"probability", detection.probability}}};
}

RestResponse VadRoutes::start(const nlohmann::json& body) const {
    const auto session_id = require_string(body, "session_id");
    if (session_id.empty()) {
        throw invalid_request("session_id must not be empty");
    }
    sessions_.start(session_id);
    return {200, {{"status", "started"}, {"session_id", session_id}}};
}

RestResponse VadRoutes::process(const nlohmann::json& body) const {
    const auto session_id = require_string(body, "session_id");
    const auto audio = require_audio(body, "audio_chunk");
    const auto sample_rate = optional_int(body, "sample_rate", defaults_.sample_rate);
    const auto thresholds = read_thresholds(body, {defaults_.threshold, defaults_.threshold_low});
    const auto sequence = optional_sequence(body, "sequence");

    const auto event = sessions_.process(session_id, audio, sample_rate,
                                         thresholds.high, thresholds.low, sequence);
    return {200, {
        {"has_voice", event.voice_confirmed},
        {"probability", event.probability},
        {"speech_ended", event.speech_ended},
        {"session_active", event.session_active}
    }};
}

RestResponse VadRoutes::end(const nlohmann::json& body) const {
    const auto session_id = require_string(body, "session_id");
    const auto result = sessions_.end(session_id);
    return {200, {
        {"status", result.found ? "ended" : "not_found"},
        {"session_id", session_id},
        {"had_voice", result.had_voice}
    }};
}

}
}
