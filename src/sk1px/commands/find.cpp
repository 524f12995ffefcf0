#include "find.hpp"

#include <algorithm>
#include <iostream>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <redlog.hpp>

#include <sk1p/engine/matcher.hpp>
#include <sk1p/engine/reference.hpp>
#include <sk1p/engine/scanner.hpp>
#include <sk1p/utils/file_utils.hpp>
#include <sk1p/utils/hex_utils.hpp>
#include <sk1p/utils/pretty_hexdump.hpp>

namespace sk1px::commands {

namespace {

// cross-check scan results against the naive scanner
bool verify_results(
    const std::vector<uint8_t>& data, const sk1p::engine::pattern_index& index, const std::vector<uint64_t>& found,
    bool complete
) {
  auto log = redlog::get_logger("sk1px.find");
  auto expected = sk1p::engine::reference_find_all(data, index.pattern());

  bool consistent = true;
  if (complete) {
    consistent = expected.size() == found.size() && std::equal(expected.begin(), expected.end(), found.begin());
  } else {
    // truncated scans must agree with the reference on the prefix they report
    consistent = found.size() <= expected.size() && std::equal(found.begin(), found.end(), expected.begin());
  }

  if (!consistent) {
    log.err(
        "verification failed", redlog::field("found", found.size()), redlog::field("expected", expected.size())
    );
    return false;
  }

  log.vrb("verification passed", redlog::field("matches", found.size()));
  return true;
}

} // namespace

int find_command(const find_request& request) {
  auto log = redlog::get_logger("sk1px.find");

  if (request.input_file.empty()) {
    log.err("input file required");
    std::cerr << "error: input file (-i/--input) is required" << std::endl;
    return 1;
  }

  auto index = load_pattern(request.pattern);
  if (!index.ok()) {
    return 1;
  }

  // verification and context dumps need the whole text in memory; plain scans stream the file
  bool need_buffer = request.verify || request.context;
  std::vector<uint8_t> data;
  if (need_buffer) {
    auto file_data = sk1p::utils::read_file(request.input_file);
    if (!file_data.ok()) {
      log.err("failed to read input file", redlog::field("error", file_data.status_info.message));
      std::cerr << "error: " << file_data.status_info.message << std::endl;
      return 1;
    }
    data = std::move(file_data.value);
  }

  auto options = sk1p::engine::scan_options::from_env();
  options.single = request.single;
  options.max_matches = request.first_only ? 1 : request.max_matches;

  auto results = need_buffer ? sk1p::engine::scan(data, index.value, options)
                             : sk1p::engine::scan_file(request.input_file, index.value, options);
  if (!results.ok()) {
    log.err(
        "scan failed", redlog::field("code", sk1p::engine::error_code_name(results.status_info.code)),
        redlog::field("error", results.status_info.message)
    );
    std::cerr << "error: " << results.status_info.message << std::endl;
    return 1;
  }

  if (request.verify) {
    bool complete = options.max_matches == 0;
    if (!verify_results(data, index.value, results.value, complete)) {
      std::cerr << "error: indexed scan disagrees with reference scan" << std::endl;
      return 1;
    }
  }

  if (results.value.empty()) {
    log.dbg("pattern not found", redlog::field("input", request.input_file));
    if (request.count_only) {
      std::cout << 0 << std::endl;
    }
    return 1;
  }

  if (request.count_only) {
    std::cout << results.value.size() << std::endl;
    return 0;
  }

  for (uint64_t offset : results.value) {
    std::cout << sk1p::utils::format_offset(offset) << "\n";

    if (request.context) {
      std::string dump =
          sk1p::utils::format_match_hexdump(data, static_cast<size_t>(offset), index.value.pattern_size());
      log.vrb("match", redlog::field("offset", sk1p::utils::format_offset(offset)));
      if (!dump.empty()) {
        log.vrb(redlog::fmt("context\n%s", dump.c_str()));
      }
    }
  }

  return 0;
}

} // namespace sk1px::commands
