#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

#include "voice_service/vad/session.hpp"

namespace voice_service {
namespace vad {

class ClassifierAdapter;

struct EndResult {
    bool found = false;
    bool had_voice = false;
};

// Owns every live streaming session. The map lock is only held to look up,
// insert or remove entries; each session carries its own lock, held for the
// whole of a process() call including classification, so frames of one
// session apply in arrival order while different sessions run in parallel.
class SessionRegistry {
public:
    explicit SessionRegistry(std::shared_ptr<const ClassifierAdapter> classifier,
                             SessionParams params = {});
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Replaces any existing session with the same id.
    void start(const std::string& session_id);
    FrameEvent process(const std::string& session_id,
                       const std::string& frame,
                       int sample_rate,
                       double threshold,
                       double threshold_low,
                       std::optional<uint64_t> sequence = std::nullopt);
    // Never throws for an unknown id; found is false instead.
    EndResult end(const std::string& session_id);

    std::optional<SessionSnapshot> snapshot(const std::string& session_id) const;
    std::size_t size() const;
    std::size_t shutdown();

private:
    struct Entry {
        explicit Entry(Session session_in) : session(std::move(session_in)) {}

        std::mutex mutex;
        Session session;
    };

    std::shared_ptr<Entry> find(const std::string& session_id) const;
    void publish_size_locked() const;

    std::shared_ptr<const ClassifierAdapter> classifier_;
    SessionParams params_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> sessions_;
};

}
}
