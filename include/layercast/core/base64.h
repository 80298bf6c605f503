#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace layercast::core {

std::string base64_encode(const std::vector<std::uint8_t>& bytes);
std::string base64_encode(const std::string& bytes);

// Decodes standard (RFC 4648) base64. Whitespace is skipped and decoding
// stops at the first '='. Returns false on any other non-alphabet character.
bool base64_decode(const std::string& input, std::vector<std::uint8_t>& output);

}  // namespace layercast::core
