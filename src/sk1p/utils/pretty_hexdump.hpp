#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace sk1p::utils {

struct hexdump_options {
  size_t bytes_per_line = 16;
  bool show_ascii = true;
  size_t context_bytes = 16; // bytes shown on each side of a match
  size_t max_lines = 32;
};

// hexdump of `data`, first byte labelled with `base_offset`; colors follow redlog's color settings
std::string format_hexdump(std::span<const uint8_t> data, uint64_t base_offset = 0, const hexdump_options& opts = {});

/**
 * hexdump of the region around a match inside `text`, with the matched bytes highlighted.
 * line labels are offsets into `text`. returns an empty string when the match lies outside the text.
 */
std::string format_match_hexdump(
    std::span<const uint8_t> text, size_t match_offset, size_t match_size, const hexdump_options& opts = {}
);

} // namespace sk1p::utils
