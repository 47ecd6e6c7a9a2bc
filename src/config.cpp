#include "voice_service/config.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace voice_service {

namespace {

std::string get_env_str(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

std::optional<std::string> get_env_optional(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    std::string result(value);
    if (result.empty()) {
        return std::nullopt;
    }
    return result;
}

bool get_env_bool(const char* name, bool fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    std::string normalized(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return normalized == "true" || normalized == "1" || normalized == "yes";
}

int get_env_int(const char* name, int fallback) {
    const char* value = std::getenv(name);
    if (!value || !*value) {
        return fallback;
    }
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string(name) + " must be an integer");
    }
}

double get_env_double(const char* name, double fallback) {
    const char* value = std::getenv(name);
    if (!value || !*value) {
        return fallback;
    }
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string(name) + " must be a number");
    }
}

std::string trim(std::string value) {
    auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
                                            [&](unsigned char ch) { return !is_space(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
                             [&](unsigned char ch) { return !is_space(ch); }).base(),
                value.end());
    return value;
}

std::vector<std::string> split_csv(const std::string& raw) {
    std::vector<std::string> result;
    std::stringstream stream(raw);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

std::string timestamp_suffix() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_value{};
#if defined(_WIN32)
    localtime_s(&tm_value, &time_t);
#else
    localtime_r(&time_t, &tm_value);
#endif
    std::ostringstream stream;
    stream << std::put_time(&tm_value, "%Y%m%d_%H%M%S");
    return stream.str();
}

void set_env_value(const std::string& key, const std::string& value) {
#if defined(_WIN32)
    _putenv_s(key.c_str(), value.c_str());
#else
    setenv(key.c_str(), value.c_str(), 0);
#endif
}

std::string strip_quotes(std::string value) {
    if (value.size() < 2) {
        return value;
    }
    if ((value.front() == '"' && value.back() == '"') ||
        (value.front() == '\'' && value.back() == '\'')) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

// Variables already present in the environment win over .env entries.
void load_dotenv() {
    const std::filesystem::path dotenv_path = std::filesystem::current_path() / ".env";
    if (!std::filesystem::exists(dotenv_path)) {
        return;
    }

    std::ifstream stream(dotenv_path);
    if (!stream.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line.rfind("#", 0) == 0) {
            continue;
        }

        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        const auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));
        if (key.empty()) {
            continue;
        }
        set_env_value(key, strip_quotes(value));
    }
}

}

Config Config::load() {
    load_dotenv();
    Config config;
    const auto cwd = std::filesystem::current_path();

    config.service_host = get_env_str("SERVICE_HOST", "127.0.0.1");
    config.service_port = get_env_int("SERVICE_PORT", 8765);
    config.authorization_token = get_env_optional("AUTHORIZATION_TOKEN");

    config.models_dir = get_env_str("MODELS_DIR", (cwd / "models").string());
    config.vad_model_path = get_env_str("VAD_MODEL_PATH",
                                        (config.models_dir / "silero_vad.onnx").string());
    config.vad_model_url = get_env_str(
        "VAD_MODEL_URL",
        "https://huggingface.co/onnx-community/silero-vad/resolve/main/onnx/model.onnx");
    config.vad_auto_download = get_env_bool("VAD_AUTO_DOWNLOAD", true);
    config.vad_sampling_rate = get_env_int("VAD_SAMPLING_RATE", 16000);
    config.vad_threshold = get_env_double("VAD_THRESHOLD", 0.5);
    config.vad_threshold_low = get_env_double("VAD_THRESHOLD_LOW", 0.15);
    config.vad_window_frames = get_env_int("VAD_WINDOW_FRAMES", 5);
    config.vad_confirm_frames = get_env_int("VAD_CONFIRM_FRAMES", 3);
    config.vad_silence_frames = get_env_int("VAD_SILENCE_FRAMES", 16);
    config.vad_serialize_inference = get_env_bool("VAD_SERIALIZE_INFERENCE", false);

    config.stt_url = get_env_optional("STT_URL");
    config.stt_language = get_env_str("STT_LANGUAGE", "zh");

    config.tts_url = get_env_optional("TTS_URL");
    config.tts_voice = get_env_str("TTS_VOICE", "zh-CN-XiaoxiaoNeural");
    config.tts_voice_locales = split_csv(get_env_str("TTS_VOICE_LOCALES", "zh-CN,en-US"));
    config.tts_voice_limit = get_env_int("TTS_VOICE_LIMIT", 20);

    config.upstream_connect_timeout = get_env_int("UPSTREAM_CONNECT_TIMEOUT", 30);
    config.upstream_read_timeout = get_env_int("UPSTREAM_READ_TIMEOUT", 300);
    config.upstream_write_timeout = get_env_int("UPSTREAM_WRITE_TIMEOUT", 30);

    config.log_level = get_env_str("LOG_LEVEL", "INFO");
    const auto log_filename_raw = get_env_str("LOG_FILENAME", "");
    if (!log_filename_raw.empty()) {
        const std::filesystem::path log_path(log_filename_raw);
        const auto stamped = log_path.stem().string() + "_" + timestamp_suffix() +
                             log_path.extension().string();
        if (const auto log_dir = get_env_optional("LOGS_DIR")) {
            config.logs_dir = std::filesystem::path(*log_dir);
            config.log_filename = (std::filesystem::path(*log_dir) / stamped).string();
        } else {
            config.log_filename = stamped;
        }
    }
    config.log_name = get_env_str("LOG_NAME", "voice_service");

    return config;
}

void Config::validate() const {
    if (service_host.empty()) {
        throw std::runtime_error("SERVICE_HOST is required");
    }
    if (service_port <= 0 || service_port > 65535) {
        throw std::runtime_error("SERVICE_PORT must be in 1..65535");
    }
    if (vad_sampling_rate != 8000 && vad_sampling_rate != 16000) {
        throw std::runtime_error("VAD_SAMPLING_RATE must be 8000 or 16000");
    }
    if (vad_threshold < 0.0 || vad_threshold > 1.0) {
        throw std::runtime_error("VAD_THRESHOLD must be within [0, 1]");
    }
    if (vad_threshold_low < 0.0 || vad_threshold_low > vad_threshold) {
        throw std::runtime_error("VAD_THRESHOLD_LOW must be within [0, VAD_THRESHOLD]");
    }
    if (vad_window_frames <= 0) {
        throw std::runtime_error("VAD_WINDOW_FRAMES must be positive");
    }
    if (vad_confirm_frames <= 0 || vad_confirm_frames > vad_window_frames) {
        throw std::runtime_error("VAD_CONFIRM_FRAMES must be in 1..VAD_WINDOW_FRAMES");
    }
    if (vad_silence_frames <= 0) {
        throw std::runtime_error("VAD_SILENCE_FRAMES must be positive");
    }
    if (tts_voice_limit <= 0) {
        throw std::runtime_error("TTS_VOICE_LIMIT must be positive");
    }
    if (upstream_connect_timeout <= 0 || upstream_read_timeout <= 0 ||
        upstream_write_timeout <= 0) {
        throw std::runtime_error("UPSTREAM_*_TIMEOUT values must be positive");
    }
}

}
