#include "stats.hpp"
#include "utils/hex_utils.hpp"
#include <algorithm>
#include <sstream>
#include <utility>
#include <vector>

namespace sk1p::engine {

namespace {

constexpr uint32_t k_max_run_shown = 48;

} // namespace

index_stats describe(const pattern_index& index) {
  index_stats stats;
  stats.pattern_size = index.pattern_size();
  stats.node_count = index.node_count();
  stats.edges = index.edge_count();
  stats.dense_tables = index.dense_table_count();
  stats.memory_bytes = index.memory_bytes();

  if (index.empty()) {
    return stats;
  }

  for (uint32_t id = 0; id < index.node_count(); ++id) {
    const index_node& node = index.node(id);
    if (node.prefix_boundary) {
      ++stats.boundary_nodes;
    }
    switch (node.kind) {
    case node_kind::terminal:
      break;
    case node_kind::chain:
      ++stats.chain_nodes;
      stats.chain_bytes += node.count;
      break;
    case node_kind::branch:
      ++stats.branch_nodes;
      break;
    }
  }

  // deepest point reachable in the trie; the terminal is reached at depth P at most
  std::vector<std::pair<uint32_t, size_t>> pending;
  pending.emplace_back(index.root(), 0);
  while (!pending.empty()) {
    auto [id, depth] = pending.back();
    pending.pop_back();
    stats.max_depth = std::max(stats.max_depth, depth);

    const index_node& node = index.node(id);
    switch (node.kind) {
    case node_kind::terminal:
      break;
    case node_kind::chain:
      pending.emplace_back(node.next, depth + node.count);
      break;
    case node_kind::branch:
      for (const index_edge& edge : index.edges(node)) {
        pending.emplace_back(edge.target, depth + 1);
      }
      break;
    }
  }

  return stats;
}

scan_stats average_shift_stats(
    std::span<const uint8_t> text, const pattern_index& index, const match_options& options
) {
  scan_stats stats;
  const size_t pattern_len = index.pattern_size();
  if (pattern_len == 0 || pattern_len > text.size()) {
    return stats;
  }

  const bool fast_path = options.fast_path_enabled(pattern_len);
  const size_t last_window = text.size() - pattern_len;
  size_t pos = 0;
  while (pos <= last_window) {
    window_step step = step_window(text, index, pos, fast_path);
    ++stats.windows;
    stats.total_shift += step.shift;
    stats.total_depth += step.depth;
    if (step.matched) {
      ++stats.matches;
    }
    if (step.fast_path) {
      ++stats.fast_path_hits;
    }
    pos += step.shift;
  }

  return stats;
}

std::string dump_index(const pattern_index& index, size_t max_lines) {
  std::ostringstream out;
  if (index.empty()) {
    out << "(empty index)\n";
    return out.str();
  }

  struct frame {
    uint32_t id;
    size_t depth;
    size_t indent;
    int label; // dispatch byte that led here, or -1
  };

  std::vector<frame> pending;
  pending.push_back(frame{index.root(), 0, 0, -1});
  size_t lines = 0;

  while (!pending.empty()) {
    if (lines >= max_lines) {
      out << "... (truncated)\n";
      break;
    }

    frame current = pending.back();
    pending.pop_back();
    const index_node& node = index.node(current.id);

    out << std::string(current.indent * 2, ' ');
    if (current.label >= 0) {
      uint8_t byte = static_cast<uint8_t>(current.label);
      out << "[" << utils::escape_bytes(std::span<const uint8_t>(&byte, 1)) << "] ";
    }
    out << "#" << current.id << " depth=" << current.depth;
    if (node.prefix_boundary) {
      out << " prefix";
    }

    switch (node.kind) {
    case node_kind::terminal:
      out << " terminal";
      break;

    case node_kind::chain: {
      uint32_t shown = std::min<uint32_t>(node.count, k_max_run_shown);
      std::vector<uint8_t> run(shown);
      for (uint32_t j = 0; j < shown; ++j) {
        run[j] = index.chain_byte(node, j);
      }
      out << " chain len=" << node.count << " \"" << utils::escape_bytes(run);
      if (shown < node.count) {
        out << "...";
      }
      out << "\"";
      pending.push_back(frame{node.next, current.depth + node.count, current.indent, -1});
      break;
    }

    case node_kind::branch: {
      out << " branch edges=" << node.count;
      if (node.next != pattern_index::no_node) {
        out << " dense";
      }
      auto edges = index.edges(node);
      // push in reverse so edges print in byte order
      for (auto it = edges.rbegin(); it != edges.rend(); ++it) {
        pending.push_back(frame{it->target, current.depth + 1, current.indent + 1, it->byte});
      }
      break;
    }
    }

    out << "\n";
    ++lines;
  }

  return out.str();
}

} // namespace sk1p::engine
