#pragma once

#include "pattern_source.hpp"

#include <cstddef>

namespace sk1px::commands {

struct dump_request {
  pattern_source pattern;
  size_t max_lines = 256;
};

int dump_command(const dump_request& request);

} // namespace sk1px::commands
