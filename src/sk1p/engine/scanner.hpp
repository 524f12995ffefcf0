#pragma once

#include "engine/matcher.hpp"
#include "engine/pattern_index.hpp"
#include "engine/result.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace sk1p::engine {

inline constexpr size_t k_default_chunk_size = 1024 * 1024;

struct scan_options {
  size_t max_matches = 0; // 0 = unlimited
  bool single = false;    // exactly one match required
  size_t chunk_size = k_default_chunk_size;
  match_options matching;

  // reads SK1P_CHUNK_SIZE on top of match_options::from_env()
  static scan_options from_env();
};

// collect match offsets in an in-memory text
result<std::vector<uint64_t>> scan(
    std::span<const uint8_t> text, const pattern_index& index, const scan_options& options
);

// collect match offsets in a file, reading it in chunks that overlap by P - 1 bytes
result<std::vector<uint64_t>> scan_file(
    const std::string& path, const pattern_index& index, const scan_options& options
);

} // namespace sk1p::engine
