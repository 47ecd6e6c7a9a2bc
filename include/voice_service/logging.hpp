#pragma once

#include <initializer_list>
#include <memory>
#include <sstream>
#include <string>
#include <type_traits>

#include "voice_service/config.hpp"
#include "spdlog/logger.h"

namespace voice_service {
namespace logging {

struct KeyValue {
    std::string key;
    std::string value;
};

// Probabilities and latencies are logged with four decimals.
template <typename T>
inline std::string render_value(const T& value) {
    std::ostringstream oss;
    if constexpr (std::is_same_v<T, bool>) {
        oss << (value ? "true" : "false");
    } else if constexpr (std::is_floating_point_v<T>) {
        oss.setf(std::ios::fixed);
        oss.precision(4);
        oss << value;
    } else {
        oss << value;
    }
    return oss.str();
}

template <typename T>
inline KeyValue kv(const std::string& key, const T& value) {
    return {key, render_value(value)};
}

// key=value pairs separated by ", ". Values that are empty or contain a
// separator are double-quoted with embedded quotes escaped.
std::string format_kv(std::initializer_list<KeyValue> items);

inline std::string with_kv(const std::string& message,
                           std::initializer_list<KeyValue> items) {
    const auto context = format_kv(items);
    if (context.empty()) {
        return message;
    }
    return message + " [" + context + "]";
}

// Installs the service logger as the spdlog default; a second call replaces
// the sinks.
void init(const Config& config);
std::shared_ptr<spdlog::logger> get_logger();
// Flushes and releases every sink.
void shutdown();

inline void log(spdlog::level::level_enum level,
                const std::string& message,
                std::initializer_list<KeyValue> items = {}) {
    auto logger = get_logger();
    if (logger && logger->should_log(level)) {
        logger->log(level, with_kv(message, items));
    }
}

inline void trace(const std::string& message,
                  std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::trace, message, items);
}

inline void debug(const std::string& message,
                  std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::debug, message, items);
}

inline void info(const std::string& message,
                 std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::info, message, items);
}

inline void warn(const std::string& message,
                 std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::warn, message, items);
}

inline void error(const std::string& message,
                  std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::err, message, items);
}

}

using logging::kv;
using logging::with_kv;
using logging::debug;
using logging::error;
using logging::info;
using logging::trace;
using logging::warn;

}
