#pragma once

#include <optional>
#include <string>

namespace voice_service::utils {

std::string base64_encode(const std::string& data);
// Standard alphabet, padding optional, ASCII whitespace ignored. nullopt on
// any other character or a truncated quantum.
std::optional<std::string> base64_decode(const std::string& encoded);

}
