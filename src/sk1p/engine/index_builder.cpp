#include "index_builder.hpp"
#include <algorithm>

namespace sk1p::engine {

namespace {

// branch fan-out above which a node gets a flat 256-slot dispatch table
constexpr uint32_t k_dense_fanout = 16;

} // namespace

uint32_t index_builder::transition_map::find(uint8_t byte) const noexcept {
  auto it = std::lower_bound(
      entries_.begin(), entries_.end(), byte,
      [](const std::pair<uint8_t, uint32_t>& entry, uint8_t value) { return entry.first < value; }
  );
  if (it == entries_.end() || it->first != byte) {
    return no_state;
  }
  return it->second;
}

void index_builder::transition_map::set(uint8_t byte, uint32_t state) {
  auto it = std::lower_bound(
      entries_.begin(), entries_.end(), byte,
      [](const std::pair<uint8_t, uint32_t>& entry, uint8_t value) { return entry.first < value; }
  );
  if (it != entries_.end() && it->first == byte) {
    it->second = state;
    return;
  }
  entries_.insert(it, {byte, state});
}

index_builder::index_builder(std::span<const uint8_t> pattern) : pattern_(pattern) {
  states_.reserve(pattern.size() * 2 + 1);
  states_.emplace_back();
}

bool index_builder::insert_next_prefix() {
  if (inserted_ >= pattern_.size()) {
    return false;
  }

  const uint8_t byte = pattern_[inserted_];
  const uint32_t current = static_cast<uint32_t>(states_.size());
  {
    build_state state;
    state.length = states_[last_].length + 1;
    state.end = static_cast<uint32_t>(inserted_);
    state.prefix = true;
    states_.push_back(std::move(state));
  }

  uint32_t walker = last_;
  while (walker != no_state && states_[walker].next.find(byte) == no_state) {
    states_[walker].next.set(byte, current);
    walker = states_[walker].link;
  }

  if (walker == no_state) {
    states_[current].link = 0;
  } else {
    const uint32_t target = states_[walker].next.find(byte);
    if (states_[walker].length + 1 == states_[target].length) {
      states_[current].link = target;
    } else {
      // the new prefix diverges inside target's run: split it at the shared length
      const uint32_t split = static_cast<uint32_t>(states_.size());
      build_state state;
      state.length = states_[walker].length + 1;
      state.link = states_[target].link;
      state.end = states_[target].end;
      state.next = states_[target].next;
      states_.push_back(std::move(state));

      while (walker != no_state && states_[walker].next.find(byte) == target) {
        states_[walker].next.set(byte, split);
        walker = states_[walker].link;
      }
      states_[target].link = split;
      states_[current].link = split;
    }
  }

  last_ = current;
  ++inserted_;
  return true;
}

pattern_index index_builder::freeze() && {
  while (insert_next_prefix()) {
  }

  pattern_index index;
  index.pattern_.assign(pattern_.begin(), pattern_.end());
  index.shifts_ = shift_table(index.pattern_);

  const size_t state_total = states_.size();
  const std::vector<uint8_t>& bytes = index.pattern_;

  // forward transitions are only needed while inserting
  for (auto& state : states_) {
    state.next = transition_map{};
  }

  auto first_byte = [&](uint32_t id) -> uint8_t {
    const build_state& state = states_[id];
    return bytes[state.end - states_[state.link].length];
  };

  // group link-tree children by parent, ordered by the first byte of their run
  std::vector<uint32_t> child_begin(state_total + 1, 0);
  for (uint32_t id = 1; id < state_total; ++id) {
    ++child_begin[states_[id].link + 1];
  }
  for (size_t i = 1; i <= state_total; ++i) {
    child_begin[i] += child_begin[i - 1];
  }

  std::vector<uint32_t> children(state_total > 0 ? state_total - 1 : 0);
  std::vector<uint32_t> cursor(child_begin.begin(), child_begin.end() - 1);
  for (uint32_t id = 1; id < state_total; ++id) {
    children[cursor[states_[id].link]++] = id;
  }
  for (size_t id = 0; id < state_total; ++id) {
    auto begin = children.begin() + child_begin[id];
    auto end = children.begin() + child_begin[id + 1];
    if (end - begin > 1) {
      std::sort(begin, end, [&](uint32_t a, uint32_t b) { return first_byte(a) < first_byte(b); });
    }
  }

  index.nodes_.reserve(state_total * 2);
  index_node terminal;
  terminal.kind = node_kind::terminal;
  terminal.prefix_boundary = true;
  index.nodes_.push_back(terminal);

  // every state with children owns the node at its end point; leaves share the terminal
  std::vector<uint32_t> point(state_total, pattern_index::terminal_node);
  for (size_t id = 0; id < state_total; ++id) {
    if (child_begin[id + 1] > child_begin[id]) {
      point[id] = static_cast<uint32_t>(index.nodes_.size());
      index.nodes_.emplace_back();
    }
  }

  for (size_t id = 0; id < state_total; ++id) {
    const uint32_t begin = child_begin[id];
    const uint32_t count = child_begin[id + 1] - begin;
    if (count == 0) {
      continue;
    }

    const build_state& state = states_[id];
    index_node node;
    node.prefix_boundary = state.prefix;

    if (count == 1) {
      // single continuation: the child's whole run hangs off this point as one chain
      const build_state& child = states_[children[begin]];
      node.kind = node_kind::chain;
      node.first = child.end - state.length;
      node.count = child.length - state.length;
      node.next = point[children[begin]];
      index.nodes_[point[id]] = node;
      continue;
    }

    node.kind = node_kind::branch;
    node.first = static_cast<uint32_t>(index.edges_.size());
    node.count = count;
    node.next = pattern_index::no_node;

    for (uint32_t i = 0; i < count; ++i) {
      const uint32_t child_id = children[begin + i];
      const build_state& child = states_[child_id];
      const uint32_t run = child.length - state.length;

      uint32_t entry = point[child_id];
      if (run > 1) {
        // the dispatch consumes the first byte; the rest of the run becomes a chain
        index_node chain;
        chain.kind = node_kind::chain;
        chain.first = child.end - state.length - 1;
        chain.count = run - 1;
        chain.next = point[child_id];
        entry = static_cast<uint32_t>(index.nodes_.size());
        index.nodes_.push_back(chain);
      }

      index.edges_.push_back(index_edge{first_byte(child_id), entry});
    }

    if (count > k_dense_fanout) {
      node.next = static_cast<uint32_t>(index.dense_.size());
      index.dense_.emplace_back();
      auto& table = index.dense_.back();
      table.fill(pattern_index::no_node);
      for (uint32_t i = 0; i < count; ++i) {
        const index_edge& edge = index.edges_[node.first + i];
        table[edge.byte] = edge.target;
      }
    }

    index.nodes_[point[id]] = node;
  }

  index.root_ = point[0];
  states_.clear();
  return index;
}

} // namespace sk1p::engine
