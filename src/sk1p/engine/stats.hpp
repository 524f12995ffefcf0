#pragma once

#include "engine/matcher.hpp"
#include "engine/pattern_index.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace sk1p::engine {

// structural summary of a built index
struct index_stats {
  size_t pattern_size = 0;
  size_t node_count = 0;
  size_t branch_nodes = 0;
  size_t chain_nodes = 0;
  size_t boundary_nodes = 0;
  size_t edges = 0;
  size_t dense_tables = 0;
  size_t chain_bytes = 0;
  size_t max_depth = 0;
  size_t memory_bytes = 0;
};

index_stats describe(const pattern_index& index);

// observed behaviour of the matcher over one text
struct scan_stats {
  size_t windows = 0;        // windows inspected
  size_t matches = 0;
  size_t fast_path_hits = 0; // windows resolved by the last-byte table
  uint64_t total_shift = 0;
  uint64_t total_depth = 0;  // bytes compared

  double average_shift() const noexcept {
    return windows == 0 ? 0.0 : static_cast<double>(total_shift) / static_cast<double>(windows);
  }

  double average_depth() const noexcept {
    return windows == 0 ? 0.0 : static_cast<double>(total_depth) / static_cast<double>(windows);
  }
};

// run the matcher over the whole text, recording every step; purely informational
scan_stats average_shift_stats(
    std::span<const uint8_t> text, const pattern_index& index, const match_options& options = {}
);

// textual rendering of the trie, one node per line, stopping after max_lines
std::string dump_index(const pattern_index& index, size_t max_lines = 256);

} // namespace sk1p::engine
