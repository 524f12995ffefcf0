#pragma once

#include "pattern_source.hpp"

#include <cstddef>
#include <string>

namespace sk1px::commands {

struct find_request {
  pattern_source pattern;
  std::string input_file;
  bool first_only = false;
  bool count_only = false;
  bool single = false;
  bool verify = false;
  bool context = false;
  size_t max_matches = 0;
};

int find_command(const find_request& request);

} // namespace sk1px::commands
