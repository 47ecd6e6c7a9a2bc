#include "voice_service/utils/base64.hpp"

#include <array>
#include <cctype>
#include <cstdint>

namespace voice_service::utils {

namespace {

constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr int8_t kInvalid = -1;

std::array<int8_t, 256> make_reverse_table() {
    std::array<int8_t, 256> table{};
    table.fill(kInvalid);
    for (int i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<int8_t>(i);
    }
    return table;
}

}

std::string base64_encode(const std::string& data) {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);
    size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        const uint32_t chunk = (static_cast<uint32_t>(static_cast<unsigned char>(data[i])) << 16) |
                               (static_cast<uint32_t>(static_cast<unsigned char>(data[i + 1])) << 8) |
                               static_cast<uint32_t>(static_cast<unsigned char>(data[i + 2]));
        out.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 6) & 0x3F]);
        out.push_back(kAlphabet[chunk & 0x3F]);
    }
    const size_t rest = data.size() - i;
    if (rest == 1) {
        const uint32_t chunk = static_cast<uint32_t>(static_cast<unsigned char>(data[i])) << 16;
        out.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
        out += "==";
    } else if (rest == 2) {
        const uint32_t chunk = (static_cast<uint32_t>(static_cast<unsigned char>(data[i])) << 16) |
                               (static_cast<uint32_t>(static_cast<unsigned char>(data[i + 1])) << 8);
        out.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

std::optional<std::string> base64_decode(const std::string& encoded) {
    static const auto reverse = make_reverse_table();

    std::string out;
    out.reserve(encoded.size() / 4 * 3);
    uint32_t buffer = 0;
    int bits = 0;
    int symbols = 0;
    int padding = 0;
    for (unsigned char ch : encoded) {
        if (std::isspace(ch)) {
            continue;
        }
        if (ch == '=') {
            ++padding;
            continue;
        }
        if (padding > 0) {
            return std::nullopt;
        }
        const auto value = reverse[ch];
        if (value == kInvalid) {
            return std::nullopt;
        }
        buffer = (buffer << 6) | static_cast<uint32_t>(value);
        bits += 6;
        ++symbols;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<char>((buffer >> bits) & 0xFF));
        }
    }
    const int remainder = symbols % 4;
    if (remainder == 1 || padding > 2) {
        return std::nullopt;
    }
    if (padding > 0 && (symbols + padding) % 4 != 0) {
        return std::nullopt;
    }
    return out;
}

}
