#include "scanner.hpp"
#include "utils/env_config.hpp"
#include "utils/file_utils.hpp"
#include "utils/hex_utils.hpp"
#include <redlog.hpp>
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <utility>

namespace sk1p::engine {

namespace {

size_t effective_max_matches(const scan_options& options) {
  if (!options.single) {
    return options.max_matches;
  }
  if (options.max_matches == 0) {
    return 2;
  }
  return std::max<size_t>(options.max_matches, 2);
}

bool limit_reached(const std::vector<uint64_t>& results, size_t max_matches) {
  return max_matches > 0 && results.size() >= max_matches;
}

result<std::vector<uint64_t>> finish_scan(std::vector<uint64_t> results, const scan_options& options) {
  auto log = redlog::get_logger("sk1p.scanner");

  if (options.single) {
    if (results.empty()) {
      log.dbg("single scan found no matches");
      return error_result<std::vector<uint64_t>>(error_code::not_found, "pattern not found");
    }
    if (results.size() > 1) {
      log.dbg("single scan found multiple matches", redlog::field("matches", results.size()));
      return error_result<std::vector<uint64_t>>(error_code::multiple_matches, "multiple matches found");
    }
  }

  return ok_result(std::move(results));
}

} // namespace

scan_options scan_options::from_env() {
  utils::env_config config("SK1P");
  scan_options options;
  options.matching = match_options::from_env();
  options.chunk_size = config.get<size_t>("CHUNK_SIZE", options.chunk_size);
  return options;
}

result<std::vector<uint64_t>> scan(
    std::span<const uint8_t> text, const pattern_index& index, const scan_options& options
) {
  if (index.empty()) {
    return error_result<std::vector<uint64_t>>(error_code::invalid_argument, "index has no pattern");
  }

  std::vector<uint64_t> results;
  size_t max_matches = effective_max_matches(options);

  match_cursor cursor(text, index, 0, options.matching);
  while (auto found = cursor.next()) {
    results.push_back(*found);
    if (limit_reached(results, max_matches)) {
      break;
    }
  }

  return finish_scan(std::move(results), options);
}

result<std::vector<uint64_t>> scan_file(
    const std::string& path, const pattern_index& index, const scan_options& options
) {
  auto log = redlog::get_logger("sk1p.scanner");

  if (index.empty()) {
    return error_result<std::vector<uint64_t>>(error_code::invalid_argument, "index has no pattern");
  }

  auto file_size = utils::file_size(path);
  if (!file_size.ok()) {
    log.err(
        "failed to stat input file", redlog::field("path", path),
        redlog::field("error", file_size.status_info.message)
    );
    return error_result<std::vector<uint64_t>>(error_code::io_error, file_size.status_info.message);
  }

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    log.err("failed to open input file", redlog::field("path", path));
    return error_result<std::vector<uint64_t>>(error_code::io_error, "could not open file: " + path);
  }

  const uint64_t size = file_size.value;
  const size_t overlap = index.pattern_size() - 1;
  const size_t chunk_size = options.chunk_size == 0 ? k_default_chunk_size : options.chunk_size;
  const size_t max_matches = effective_max_matches(options);

  log.trc(
      "starting file scan", redlog::field("path", path), redlog::field("size", size),
      redlog::field("pattern_size", index.pattern_size()), redlog::field("chunk_size", chunk_size)
  );

  std::vector<uint64_t> results;
  std::vector<uint8_t> buffer;
  uint64_t offset = 0;

  while (offset < size && !limit_reached(results, max_matches)) {
    const size_t remaining = static_cast<size_t>(std::min<uint64_t>(size - offset, SIZE_MAX));
    const size_t base_chunk_size = std::min(chunk_size, remaining);
    const size_t read_size = std::min(remaining, base_chunk_size + overlap);

    auto read = utils::read_range(file, offset, read_size, buffer);
    if (!read.ok()) {
      log.err("chunk read failed", redlog::field("path", path), redlog::field("error", read.message));
      return error_result<std::vector<uint64_t>>(error_code::io_error, path + ": " + read.message);
    }

    log.ped(
        "scanning chunk", redlog::field("offset", utils::format_offset(offset)), redlog::field("size", read_size)
    );

    // matches starting in the overlap belong to the next chunk
    match_cursor cursor(buffer, index, 0, options.matching);
    while (auto found = cursor.next()) {
      if (*found >= base_chunk_size) {
        break;
      }
      results.push_back(offset + *found);
      if (limit_reached(results, max_matches)) {
        break;
      }
    }

    offset += base_chunk_size;
  }

  log.trc("file scan completed", redlog::field("matches", results.size()));
  return finish_scan(std::move(results), options);
}

} // namespace sk1p::engine
