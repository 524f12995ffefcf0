#include "shift_table.hpp"

namespace sk1p::engine {

shift_table::shift_table(std::span<const uint8_t> pattern) : pattern_size_(pattern.size()) {
  const size_t pattern_len = pattern.size();
  shifts_.fill(pattern_len);
  if (pattern_len == 0) {
    return;
  }

  // later positions overwrite earlier ones so each byte keeps its rightmost occurrence
  for (size_t i = 0; i + 1 < pattern_len; ++i) {
    shifts_[pattern[i]] = pattern_len - 1 - i;
  }
}

} // namespace sk1p::engine
