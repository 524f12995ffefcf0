#pragma once

#include "engine/result.hpp"
#include "engine/shift_table.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace sk1p::engine {

class index_builder;

// node kinds of the reversed-suffix trie
enum class node_kind : uint8_t { terminal, chain, branch };

// one arena slot. fields are interpreted per kind:
//   chain:  first = pattern index of the first byte compared, count = run length, next = following node.
//           bytes are compared right-to-left: pattern[first], pattern[first - 1], ...
//   branch: first = offset into the edge arena, count = edge count, next = dense table slot or no_node.
//   terminal: no fields; a single shared instance lives at slot 0.
// prefix_boundary applies at the node's entry depth, before any of its bytes are consumed.
struct index_node {
  node_kind kind = node_kind::terminal;
  bool prefix_boundary = false;
  uint32_t first = 0;
  uint32_t count = 0;
  uint32_t next = 0;
};

struct index_edge {
  uint8_t byte = 0;
  uint32_t target = 0;
};

// outcome of walking a byte string through the trie as a window suffix (read right-to-left)
struct trie_lookup {
  size_t matched = 0;           // bytes consumed before divergence or exhaustion
  bool complete = false;        // every byte of the input was consumed
  bool prefix_boundary = false; // the consumed string is a prefix of the pattern (only meaningful when complete)
  bool terminal = false;        // the walk ended on the terminal node
};

/**
 * immutable trie over the suffixes of every pattern prefix, read right-to-left.
 *
 * walking the trie with the bytes of a text window, starting at the window's last byte,
 * yields both a match decision and the smallest safe shift: the deepest prefix boundary
 * passed on the way down. nodes live in a single arena and reference each other by index,
 * so an index can be copied, moved and shared across threads without synchronization.
 */
class pattern_index {
public:
  static constexpr uint32_t terminal_node = 0;
  static constexpr uint32_t no_node = UINT32_MAX;

  pattern_index() = default;

  bool empty() const noexcept { return pattern_.empty(); }
  size_t pattern_size() const noexcept { return pattern_.size(); }
  std::span<const uint8_t> pattern() const noexcept { return pattern_; }

  uint32_t root() const noexcept { return root_; }
  size_t node_count() const noexcept { return nodes_.size(); }
  const index_node& node(uint32_t id) const noexcept { return nodes_[id]; }

  size_t edge_count() const noexcept { return edges_.size(); }
  size_t dense_table_count() const noexcept { return dense_.size(); }

  std::span<const index_edge> edges(const index_node& branch) const noexcept {
    return std::span<const index_edge>(edges_.data() + branch.first, branch.count);
  }

  // child of a branch node for the given byte, or no_node
  uint32_t child(const index_node& branch, uint8_t byte) const noexcept {
    if (branch.next != no_node) {
      return dense_[branch.next][byte];
    }
    const index_edge* edge = edges_.data() + branch.first;
    for (uint32_t i = 0; i < branch.count; ++i) {
      if (edge[i].byte == byte) {
        return edge[i].target;
      }
      if (edge[i].byte > byte) {
        break;
      }
    }
    return no_node;
  }

  // j-th byte of a chain run
  uint8_t chain_byte(const index_node& chain, uint32_t j) const noexcept { return pattern_[chain.first - j]; }

  const shift_table& last_byte_shifts() const noexcept { return shifts_; }

  // walk `suffix` from its last byte towards its first, the way the matcher reads a window
  trie_lookup lookup(std::span<const uint8_t> suffix) const noexcept;

  // approximate heap footprint of the frozen structure
  size_t memory_bytes() const noexcept;

private:
  friend class index_builder;

  std::vector<uint8_t> pattern_;
  std::vector<index_node> nodes_;
  std::vector<index_edge> edges_;
  std::vector<std::array<uint32_t, 256>> dense_;
  uint32_t root_ = terminal_node;
  shift_table shifts_;
};

// build the index for a pattern; empty patterns are rejected with invalid_pattern
result<pattern_index> build_index(std::span<const uint8_t> pattern);
result<pattern_index> build_index(std::string_view pattern);

} // namespace sk1p::engine
