#include "stats.hpp"

#include <iomanip>
#include <iostream>

#include <redlog.hpp>

#include <sk1p/engine/matcher.hpp>
#include <sk1p/engine/stats.hpp>
#include <sk1p/utils/file_utils.hpp>

namespace sk1px::commands {

int stats_command(const stats_request& request) {
  auto log = redlog::get_logger("sk1px.stats");

  auto index = load_pattern(request.pattern);
  if (!index.ok()) {
    return 1;
  }

  auto summary = sk1p::engine::describe(index.value);
  std::cout << "pattern size:   " << summary.pattern_size << "\n";
  std::cout << "nodes:          " << summary.node_count << " (branch " << summary.branch_nodes << ", chain "
            << summary.chain_nodes << ", prefix " << summary.boundary_nodes << ")\n";
  std::cout << "edges:          " << summary.edges << " (dense tables " << summary.dense_tables << ")\n";
  std::cout << "chain bytes:    " << summary.chain_bytes << "\n";
  std::cout << "max depth:      " << summary.max_depth << "\n";
  std::cout << "memory:         " << summary.memory_bytes << " bytes\n";

  if (request.input_file.empty()) {
    return 0;
  }

  auto file_data = sk1p::utils::read_file(request.input_file);
  if (!file_data.ok()) {
    log.err("failed to read input file", redlog::field("error", file_data.status_info.message));
    std::cerr << "error: " << file_data.status_info.message << std::endl;
    return 1;
  }

  auto options = sk1p::engine::match_options::from_env();
  auto observed = sk1p::engine::average_shift_stats(file_data.value, index.value, options);
  log.dbg(
      "collected scan statistics", redlog::field("windows", observed.windows),
      redlog::field("fast_path", options.fast_path_enabled(index.value.pattern_size()))
  );

  std::cout << "text size:      " << file_data.value.size() << "\n";
  std::cout << "windows:        " << observed.windows << "\n";
  std::cout << "matches:        " << observed.matches << "\n";
  std::cout << "fast path hits: " << observed.fast_path_hits << "\n";
  std::cout << std::fixed << std::setprecision(3);
  std::cout << "average shift:  " << observed.average_shift() << "\n";
  std::cout << "average depth:  " << observed.average_depth() << "\n";
  return 0;
}

} // namespace sk1px::commands
