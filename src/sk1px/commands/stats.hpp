#pragma once

#include "pattern_source.hpp"

#include <string>

namespace sk1px::commands {

struct stats_request {
  pattern_source pattern;
  std::string input_file; // optional; enables observed scan statistics
};

int stats_command(const stats_request& request);

} // namespace sk1px::commands
