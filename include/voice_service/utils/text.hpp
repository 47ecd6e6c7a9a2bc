#pragma once

#include <cstddef>
#include <string>

namespace voice_service::utils {

// Drops emoji and pictographs and collapses whitespace runs to one space.
// Case and punctuation are preserved; the synthesizer needs them for prosody.
std::string sanitize_speech_text(const std::string& text);

// At most max_chars code points, with "..." appended when shortened. Never
// splits a UTF-8 sequence.
std::string preview(const std::string& text, std::size_t max_chars = 50);

}
