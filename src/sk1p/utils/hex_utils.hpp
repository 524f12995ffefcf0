#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace sk1p::utils {

// "0x" followed by at least 8 hex digits
std::string format_offset(uint64_t offset);

// space separated lowercase hex pairs, e.g. "de ad be ef"
std::string format_bytes(std::span<const uint8_t> bytes);

// printable ascii kept as is, backslash doubled, everything else as \xNN
std::string escape_bytes(std::span<const uint8_t> bytes);

// value of a hex digit, or -1
int hex_digit_value(char c) noexcept;

} // namespace sk1p::utils
