#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace sk1p::engine {

// naive O(|text| * |pattern|) scanner; the ground truth the indexed matcher is checked against
std::vector<size_t> reference_find_all(
    std::span<const uint8_t> text, std::span<const uint8_t> pattern, size_t start = 0
);

bool matches_at(std::span<const uint8_t> text, std::span<const uint8_t> pattern, size_t pos) noexcept;

} // namespace sk1p::engine
