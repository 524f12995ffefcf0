#include "reference.hpp"

namespace sk1p::engine {

bool matches_at(std::span<const uint8_t> text, std::span<const uint8_t> pattern, size_t pos) noexcept {
  if (pattern.empty() || pos > text.size() || text.size() - pos < pattern.size()) {
    return false;
  }
  for (size_t i = 0; i < pattern.size(); ++i) {
    if (text[pos + i] != pattern[i]) {
      return false;
    }
  }
  return true;
}

std::vector<size_t> reference_find_all(std::span<const uint8_t> text, std::span<const uint8_t> pattern, size_t start) {
  std::vector<size_t> positions;
  if (pattern.empty() || pattern.size() > text.size()) {
    return positions;
  }

  for (size_t pos = start; pos + pattern.size() <= text.size(); ++pos) {
    if (matches_at(text, pattern, pos)) {
      positions.push_back(pos);
    }
  }
  return positions;
}

} // namespace sk1p::engine
