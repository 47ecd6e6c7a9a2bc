#include "voice_service/vad/registry.hpp"

#include <utility>

#include "voice_service/logging.hpp"
#include "voice_service/metrics.hpp"
#include "voice_service/vad/classifier.hpp"
#include "voice_service/vad/errors.hpp"

namespace voice_service {
namespace vad {

SessionRegistry::SessionRegistry(std::shared_ptr<const ClassifierAdapter> classifier,
                                 SessionParams params)
    : classifier_(std::move(classifier)),
      params_(params) {}

SessionRegistry::~SessionRegistry() {
    shutdown();
}

void SessionRegistry::start(const std::string& session_id) {
    auto entry = std::make_shared<Entry>(Session(session_id, params_));
    bool replaced = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = sessions_[session_id];
        replaced = static_cast<bool>(slot);
        slot = std::move(entry);
        publish_size_locked();
    }
    logging::info("VAD session started",
                  {kv("session_id", session_id),
                   kv("replaced", replaced)});
}

FrameEvent SessionRegistry::process(const std::string& session_id,
                                    const std::string& frame,
                                    int sample_rate,
                                    double threshold,
                                    double threshold_low,
                                    std::optional<uint64_t> sequence) {
    auto entry = find(session_id);
    if (!entry) {
        throw SessionNotFoundError(session_id);
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->session.check_sequence(sequence);
    const float probability = classifier_->classify(frame, sample_rate);
    const auto event = entry->session.apply(probability, threshold, threshold_low, sequence);

    logging::trace("VAD frame processed",
                   {kv("session_id", session_id),
                    kv("probability", event.probability),
                    kv("voice_confirmed", event.voice_confirmed)});
    if (event.speech_ended) {
        Metrics::instance().increment_speech_ended();
        logging::info("VAD speech ended",
                      {kv("session_id", session_id),
                       kv("frames", entry->session.snapshot().frames_processed)});
    }
    return event;
}

EndResult SessionRegistry::end(const std::string& session_id) {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it != sessions_.end()) {
            entry = std::move(it->second);
            sessions_.erase(it);
            publish_size_locked();
        }
    }

    EndResult result;
    if (!entry) {
        logging::debug("VAD session end for unknown id",
                       {kv("session_id", session_id)});
        return result;
    }

    // Waits for an in-flight process() on this session to finish.
    std::lock_guard<std::mutex> lock(entry->mutex);
    result.found = true;
    result.had_voice = entry->session.has_voice();
    logging::info("VAD session ended",
                  {kv("session_id", session_id),
                   kv("had_voice", result.had_voice)});
    return result;
}

std::optional<SessionSnapshot> SessionRegistry::snapshot(const std::string& session_id) const {
    auto entry = find(session_id);
    if (!entry) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->session.snapshot();
}

std::size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::size_t SessionRegistry::shutdown() {
    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped = sessions_.size();
        sessions_.clear();
        publish_size_locked();
    }
    if (dropped > 0) {
        logging::info("VAD sessions dropped at shutdown",
                      {kv("count", dropped)});
    }
    return dropped;
}

std::shared_ptr<SessionRegistry::Entry> SessionRegistry::find(
    const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

void SessionRegistry::publish_size_locked() const {
    Metrics::instance().set_active_sessions(sessions_.size());
}

}
}
