#include "pattern_index.hpp"
#include "index_builder.hpp"
#include <redlog.hpp>
#include <chrono>
#include <utility>

namespace sk1p::engine {

namespace {

// node references are 32-bit and the builder needs up to two slots per pattern byte
constexpr size_t k_max_pattern_size = (size_t{1} << 30);

} // namespace

trie_lookup pattern_index::lookup(std::span<const uint8_t> suffix) const noexcept {
  trie_lookup out;
  if (empty()) {
    return out;
  }

  const size_t length = suffix.size();
  size_t depth = 0;
  uint32_t id = root_;

  for (;;) {
    const index_node& current = nodes_[id];
    if (depth == length) {
      out.matched = depth;
      out.complete = true;
      out.prefix_boundary = current.prefix_boundary;
      out.terminal = current.kind == node_kind::terminal;
      return out;
    }

    switch (current.kind) {
    case node_kind::terminal:
      out.matched = depth;
      out.terminal = true;
      return out;

    case node_kind::chain:
      for (uint32_t j = 0; j < current.count; ++j) {
        if (depth == length) {
          // ended inside a run; interior points are never prefix boundaries
          out.matched = depth;
          out.complete = true;
          return out;
        }
        if (suffix[length - 1 - depth] != chain_byte(current, j)) {
          out.matched = depth;
          return out;
        }
        ++depth;
      }
      id = current.next;
      break;

    case node_kind::branch: {
      uint32_t next = child(current, suffix[length - 1 - depth]);
      if (next == no_node) {
        out.matched = depth;
        return out;
      }
      ++depth;
      id = next;
      break;
    }
    }
  }
}

size_t pattern_index::memory_bytes() const noexcept {
  return pattern_.capacity() + nodes_.capacity() * sizeof(index_node) + edges_.capacity() * sizeof(index_edge) +
         dense_.capacity() * sizeof(std::array<uint32_t, 256>) + sizeof(shift_table);
}

result<pattern_index> build_index(std::span<const uint8_t> pattern) {
  auto log = redlog::get_logger("sk1p.index");

  if (pattern.empty()) {
    log.dbg("rejecting empty pattern");
    return error_result<pattern_index>(error_code::invalid_pattern, "pattern must not be empty");
  }

  if (pattern.size() > k_max_pattern_size) {
    log.err("pattern too large", redlog::field("size", pattern.size()), redlog::field("limit", k_max_pattern_size));
    return error_result<pattern_index>(error_code::pattern_too_large, "pattern exceeds the maximum indexable size");
  }

  auto start = std::chrono::steady_clock::now();

  index_builder builder(pattern);
  while (builder.insert_next_prefix()) {
  }
  size_t states = builder.state_count();
  pattern_index index = std::move(builder).freeze();

  auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);
  log.dbg(
      "built pattern index", redlog::field("pattern_size", index.pattern_size()), redlog::field("states", states),
      redlog::field("nodes", index.node_count()), redlog::field("edges", index.edge_count()),
      redlog::field("dense_tables", index.dense_table_count()), redlog::field("elapsed_us", elapsed.count())
  );

  return ok_result(std::move(index));
}

result<pattern_index> build_index(std::string_view pattern) {
  return build_index(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(pattern.data()), pattern.size()));
}

} // namespace sk1p::engine
