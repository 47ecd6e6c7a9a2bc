#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace voice_service {

struct Config {
    std::string service_host = "127.0.0.1";
    int service_port = 8765;
    std::optional<std::string> authorization_token;

    std::filesystem::path models_dir;
    std::filesystem::path vad_model_path;
    std::string vad_model_url;
    bool vad_auto_download = true;
    int vad_sampling_rate = 16000;
    double vad_threshold = 0.5;
    double vad_threshold_low = 0.15;
    int vad_window_frames = 5;
    int vad_confirm_frames = 3;
    int vad_silence_frames = 16;
    bool vad_serialize_inference = false;

    std::optional<std::string> stt_url;
    std::string stt_language = "zh";

    std::optional<std::string> tts_url;
    std::string tts_voice = "zh-CN-XiaoxiaoNeural";
    std::vector<std::string> tts_voice_locales;
    int tts_voice_limit = 20;

    int upstream_connect_timeout = 30;
    int upstream_read_timeout = 300;
    int upstream_write_timeout = 30;

    std::string log_level = "INFO";
    std::optional<std::string> log_filename;
    std::optional<std::filesystem::path> logs_dir;
    std::string log_name = "voice_service";

    static Config load();
    void validate() const;
};

}
