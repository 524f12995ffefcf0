#pragma once

#include "engine/pattern_index.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace sk1p::engine {

/**
 * build-time representation of the pattern index.
 *
 * prefixes are inserted one byte at a time (prefix length 1 through P). each insertion extends
 * a suffix automaton of the pattern; the automaton's suffix links form exactly the trie of
 * pattern substrings read right-to-left, with every state owning one chain of that trie.
 * a state that has to be split during insertion is the chain split of the trie: the shared run
 * becomes a shorter chain ending in a new branch point. this keeps construction linear in P.
 *
 * freeze() converts the growable states into the compact, read-only arena used for matching.
 */
class index_builder {
public:
  explicit index_builder(std::span<const uint8_t> pattern);

  // insert the next prefix; returns false once the whole pattern has been inserted
  bool insert_next_prefix();

  size_t inserted() const noexcept { return inserted_; }
  size_t state_count() const noexcept { return states_.size(); }

  pattern_index freeze() &&;

private:
  static constexpr uint32_t no_state = UINT32_MAX;

  // sorted byte -> state transitions of one build state
  class transition_map {
  public:
    uint32_t find(uint8_t byte) const noexcept;
    void set(uint8_t byte, uint32_t state);

  private:
    std::vector<std::pair<uint8_t, uint32_t>> entries_;
  };

  struct build_state {
    uint32_t length = 0;     // length of the longest string in the state
    uint32_t link = no_state;
    uint32_t end = 0;        // pattern index where the longest string ends
    bool prefix = false;     // the longest string is a prefix of the pattern
    transition_map next;
  };

  std::span<const uint8_t> pattern_;
  std::vector<build_state> states_;
  uint32_t last_ = 0;
  size_t inserted_ = 0;
};

} // namespace sk1p::engine
