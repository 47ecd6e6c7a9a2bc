#include "voice_service/vad/session.hpp"

#include <utility>

#include "voice_service/vad/errors.hpp"

namespace voice_service {
namespace vad {

Session::Session(std::string id, const SessionParams& params)
    : id_(std::move(id)),
      window_(params.window_frames, params.confirm_frames),
      silence_(params.silence_frames) {}

void Session::check_sequence(const std::optional<uint64_t>& sequence) const {
    if (!sequence || !last_sequence_) {
        return;
    }
    if (*sequence <= *last_sequence_) {
        throw OutOfOrderFrameError("frame sequence " + std::to_string(*sequence) +
                                   " does not follow " + std::to_string(*last_sequence_) +
                                   " in session " + id_);
    }
}

FrameEvent Session::apply(float probability,
                          double threshold,
                          double threshold_low,
                          const std::optional<uint64_t>& sequence) {
    FrameEvent event;
    event.probability = probability;
    event.voice_confirmed = window_.update(probability, threshold);
    event.speech_ended = silence_.update(probability, threshold_low, event.voice_confirmed);
    ++frames_processed_;
    if (sequence) {
        last_sequence_ = sequence;
    }
    return event;
}

SessionSnapshot Session::snapshot() const {
    SessionSnapshot result;
    result.id = id_;
    result.voice_window = window_.contents();
    result.voice_count = window_.voice_count();
    result.silence_run = silence_.silence_run();
    result.has_voice = silence_.has_voice();
    result.ended = silence_.ended();
    result.frames_processed = frames_processed_;
    result.last_sequence = last_sequence_;
    return result;
}

}
}
