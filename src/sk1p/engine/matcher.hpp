#pragma once

#include "engine/pattern_index.hpp"
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <span>
#include <string_view>

namespace sk1p::engine {

enum class fast_path_mode { automatic, always, never };

struct match_options {
  fast_path_mode fast_path = fast_path_mode::automatic;
  size_t fast_path_limit = 32; // automatic mode enables the last-byte table up to this pattern size

  bool fast_path_enabled(size_t pattern_size) const noexcept {
    switch (fast_path) {
    case fast_path_mode::always:
      return true;
    case fast_path_mode::never:
      return false;
    case fast_path_mode::automatic:
      return pattern_size <= fast_path_limit;
    }
    return false;
  }

  // reads SK1P_FAST_PATH (auto|always|never) and SK1P_FAST_PATH_LIMIT
  static match_options from_env();
};

// result of walking one window through the trie
struct window_probe {
  bool matched = false;
  size_t shift = 0; // safe advance for the next window, always >= 1
  size_t depth = 0; // bytes compared
};

// one matcher step: a trie walk, or a last-byte table skip when the fast path applies
struct window_step {
  bool matched = false;
  size_t shift = 0;
  size_t depth = 0;
  bool fast_path = false;
};

// walk the window text[pos, pos + P) right-to-left; requires pos + P <= text.size()
window_probe probe_window(std::span<const uint8_t> text, const pattern_index& index, size_t pos) noexcept;

window_step step_window(
    std::span<const uint8_t> text, const pattern_index& index, size_t pos, bool fast_path
) noexcept;

// explicit scan cursor; borrows both the text and the index for its lifetime
class match_cursor {
public:
  match_cursor(
      std::span<const uint8_t> text, const pattern_index& index, size_t start = 0, const match_options& options = {}
  );

  // next match at or after the current position
  std::optional<size_t> next() noexcept;

  // first window the next call will inspect
  size_t position() const noexcept { return pos_; }
  bool exhausted() const noexcept;

private:
  std::span<const uint8_t> text_;
  const pattern_index* index_;
  size_t pos_;
  bool fast_path_;
};

// single-pass input range over the matches of a cursor
class match_range {
public:
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = size_t;
    using difference_type = std::ptrdiff_t;
    using pointer = const size_t*;
    using reference = const size_t&;

    iterator() = default;
    explicit iterator(match_cursor* cursor) : cursor_(cursor) { advance(); }

    reference operator*() const noexcept { return current_; }
    pointer operator->() const noexcept { return &current_; }

    iterator& operator++() {
      advance();
      return *this;
    }

    iterator operator++(int) {
      iterator previous = *this;
      advance();
      return previous;
    }

    bool operator==(const iterator& other) const noexcept { return cursor_ == other.cursor_; }
    bool operator!=(const iterator& other) const noexcept { return cursor_ != other.cursor_; }

  private:
    void advance() {
      if (!cursor_) {
        return;
      }
      auto found = cursor_->next();
      if (!found) {
        cursor_ = nullptr;
        return;
      }
      current_ = *found;
    }

    match_cursor* cursor_ = nullptr;
    size_t current_ = 0;
  };

  explicit match_range(match_cursor cursor) : cursor_(cursor) {}

  iterator begin() { return iterator(&cursor_); }
  iterator end() { return iterator(); }

private:
  match_cursor cursor_;
};

// first match at or after `start`, or nullopt; start beyond the text yields nullopt
std::optional<size_t> find_first(
    std::span<const uint8_t> text, const pattern_index& index, size_t start = 0, const match_options& options = {}
);

// lazy sequence of every match at or after `start`, including overlapping ones
match_range find_all(
    std::span<const uint8_t> text, const pattern_index& index, size_t start = 0, const match_options& options = {}
);

size_t count_matches(
    std::span<const uint8_t> text, const pattern_index& index, size_t start = 0, const match_options& options = {}
);

inline std::span<const uint8_t> byte_view(std::string_view text) noexcept {
  return std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

} // namespace sk1p::engine
