#pragma once

#include "result.hpp"
#include <cstdint>
#include <string_view>
#include <vector>

namespace sk1p::engine {

// parse "de ad be ef" style patterns into raw bytes
result<std::vector<uint8_t>> parse_hex_pattern(std::string_view hex);

// literal text pattern; rejects empty input
result<std::vector<uint8_t>> literal_pattern(std::string_view text);

} // namespace sk1p::engine
