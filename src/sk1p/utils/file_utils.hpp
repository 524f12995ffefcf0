#pragma once

#include "engine/result.hpp"
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <span>
#include <string>
#include <vector>

namespace sk1p::utils {

// whole file into memory; io_error names the path on failure
engine::result<std::vector<uint8_t>> read_file(const std::string& path);

// size in bytes without opening the file
engine::result<uint64_t> file_size(const std::string& path);

// read exactly `size` bytes at `offset` into `out` (resized to fit)
engine::status read_range(std::ifstream& file, uint64_t offset, size_t size, std::vector<uint8_t>& out);

bool write_file(const std::string& path, std::span<const uint8_t> data);

} // namespace sk1p::utils
