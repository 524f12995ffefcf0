#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace sk1p::engine {

// last-byte shift table: the safe shift when only the window's final byte is known.
// shift(b) = P - 1 - i for the rightmost i < P - 1 with pattern[i] == b, or P when b does not occur there.
class shift_table {
public:
  shift_table() { shifts_.fill(0); }
  explicit shift_table(std::span<const uint8_t> pattern);

  size_t operator[](uint8_t byte) const noexcept { return shifts_[byte]; }

  // number of bytes the table was built for
  size_t pattern_size() const noexcept { return pattern_size_; }

private:
  std::array<size_t, 256> shifts_;
  size_t pattern_size_ = 0;
};

} // namespace sk1p::engine
