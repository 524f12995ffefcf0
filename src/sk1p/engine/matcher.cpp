#include "matcher.hpp"
#include "utils/env_config.hpp"

namespace sk1p::engine {

match_options match_options::from_env() {
  utils::env_config config("SK1P");
  match_options options;
  options.fast_path = config.get_enum<fast_path_mode>(
      {{"auto", fast_path_mode::automatic},
       {"automatic", fast_path_mode::automatic},
       {"always", fast_path_mode::always},
       {"never", fast_path_mode::never}},
      "FAST_PATH", options.fast_path
  );
  options.fast_path_limit = config.get<size_t>("FAST_PATH_LIMIT", options.fast_path_limit);
  return options;
}

window_probe probe_window(std::span<const uint8_t> text, const pattern_index& index, size_t pos) noexcept {
  const size_t pattern_len = index.pattern_size();
  const uint8_t* pattern = index.pattern().data();
  // byte at depth d of the window is last[-d]
  const uint8_t* last = text.data() + pos + pattern_len - 1;

  size_t depth = 0;
  size_t boundary = 0;
  uint32_t id = index.root();

  for (;;) {
    const index_node& current = index.node(id);
    if (current.prefix_boundary && depth < pattern_len) {
      boundary = depth;
    }

    switch (current.kind) {
    case node_kind::terminal:
      return window_probe{depth == pattern_len, pattern_len - boundary, depth};

    case node_kind::chain: {
      const uint8_t* run = pattern + current.first;
      for (uint32_t j = 0; j < current.count; ++j) {
        if (*(last - depth) != *(run - j)) {
          return window_probe{false, pattern_len - boundary, depth};
        }
        ++depth;
      }
      id = current.next;
      break;
    }

    case node_kind::branch: {
      uint32_t next = index.child(current, *(last - depth));
      if (next == pattern_index::no_node) {
        return window_probe{false, pattern_len - boundary, depth};
      }
      ++depth;
      id = next;
      break;
    }
    }
  }
}

window_step step_window(
    std::span<const uint8_t> text, const pattern_index& index, size_t pos, bool fast_path
) noexcept {
  const size_t pattern_len = index.pattern_size();
  if (fast_path) {
    const uint8_t tail = text[pos + pattern_len - 1];
    if (tail != index.pattern()[pattern_len - 1]) {
      return window_step{false, index.last_byte_shifts()[tail], 1, true};
    }
  }

  window_probe probe = probe_window(text, index, pos);
  return window_step{probe.matched, probe.shift, probe.depth, false};
}

match_cursor::match_cursor(
    std::span<const uint8_t> text, const pattern_index& index, size_t start, const match_options& options
)
    : text_(text), index_(&index), pos_(start), fast_path_(options.fast_path_enabled(index.pattern_size())) {}

bool match_cursor::exhausted() const noexcept {
  const size_t pattern_len = index_->pattern_size();
  return pattern_len == 0 || pattern_len > text_.size() || pos_ > text_.size() - pattern_len;
}

std::optional<size_t> match_cursor::next() noexcept {
  if (exhausted()) {
    return std::nullopt;
  }

  const size_t last_window = text_.size() - index_->pattern_size();
  while (pos_ <= last_window) {
    window_step step = step_window(text_, *index_, pos_, fast_path_);
    size_t window = pos_;
    pos_ += step.shift;
    if (step.matched) {
      return window;
    }
  }

  return std::nullopt;
}

std::optional<size_t> find_first(
    std::span<const uint8_t> text, const pattern_index& index, size_t start, const match_options& options
) {
  match_cursor cursor(text, index, start, options);
  return cursor.next();
}

match_range find_all(
    std::span<const uint8_t> text, const pattern_index& index, size_t start, const match_options& options
) {
  return match_range(match_cursor(text, index, start, options));
}

size_t count_matches(
    std::span<const uint8_t> text, const pattern_index& index, size_t start, const match_options& options
) {
  match_cursor cursor(text, index, start, options);
  size_t count = 0;
  while (cursor.next()) {
    ++count;
  }
  return count;
}

} // namespace sk1p::engine
