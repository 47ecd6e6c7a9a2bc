#include "voice_service/app.hpp"
#include "voice_service/config.hpp"
#include "voice_service/logging.hpp"

#include <csignal>

namespace {

volatile std::sig_atomic_t stop_requested = 0;

void handle_signal(int) {
    stop_requested = 1;
}

}

int main() {
    try {
        const auto config = voice_service::Config::load();
        config.validate();
        voice_service::logging::init(config);
        voice_service::info(
            "Starting voice service",
            {voice_service::kv("host", config.service_host),
             voice_service::kv("port", config.service_port),
             voice_service::kv("model", config.vad_model_path.string()),
             voice_service::kv("sampling_rate", config.vad_sampling_rate)});

        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        voice_service::VoiceApp app(config);
        app.init();
        app.run([]() { return stop_requested != 0; });
        voice_service::info("Shutting down voice service");
        app.stop();
        voice_service::logging::shutdown();
    } catch (const std::exception& ex) {
        voice_service::error(
            "Startup failed",
            {voice_service::kv("error", ex.what())});
        return 1;
    }
    return 0;
}
