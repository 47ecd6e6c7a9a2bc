#include "voice_service/utils/text.hpp"

#include <cctype>
#include <cstdint>

namespace voice_service::utils {

namespace {

// Byte length of the UTF-8 sequence starting at text[index]. Malformed or
// truncated sequences count as a single byte.
std::size_t sequence_length(const std::string& text, std::size_t index, uint32_t& codepoint) {
    const auto lead = static_cast<unsigned char>(text[index]);
    std::size_t length = 1;
    if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        codepoint = lead & 0x07;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        codepoint = lead & 0x0F;
    } else if (lead >= 0xC2 && lead < 0xE0) {
        length = 2;
        codepoint = lead & 0x1F;
    } else {
        codepoint = lead;
        return 1;
    }
    if (index + length > text.size()) {
        codepoint = lead;
        return 1;
    }
    for (std::size_t i = 1; i < length; ++i) {
        const auto next = static_cast<unsigned char>(text[index + i]);
        if ((next & 0xC0) != 0x80) {
            codepoint = lead;
            return 1;
        }
        codepoint = (codepoint << 6) | (next & 0x3F);
    }
    return length;
}

bool is_pictograph(uint32_t cp) {
    return (cp >= 0x1F300 && cp <= 0x1FAFF) ||  // symbols, emoticons, transport, extended
           (cp >= 0x2600 && cp <= 0x27BF) ||    // misc symbols, dingbats
           (cp >= 0x1F1E6 && cp <= 0x1F1FF) ||  // regional indicators
           cp == 0x200D ||                      // zero width joiner
           (cp >= 0xFE00 && cp <= 0xFE0F);      // variation selectors
}

}

std::string sanitize_speech_text(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    bool pending_space = false;
    for (std::size_t i = 0; i < text.size();) {
        uint32_t codepoint = 0;
        const auto length = sequence_length(text, i, codepoint);
        if (length == 1 && std::isspace(static_cast<unsigned char>(text[i]))) {
            pending_space = !result.empty();
        } else if (length == 1 || !is_pictograph(codepoint)) {
            if (pending_space) {
                result.push_back(' ');
                pending_space = false;
            }
            result.append(text, i, length);
        }
        i += length;
    }
    return result;
}

std::string preview(const std::string& text, std::size_t max_chars) {
    std::size_t count = 0;
    for (std::size_t i = 0; i < text.size();) {
        if (count == max_chars) {
            return text.substr(0, i) + "...";
        }
        uint32_t codepoint = 0;
        i += sequence_length(text, i, codepoint);
        ++count;
    }
    return text;
}

}
