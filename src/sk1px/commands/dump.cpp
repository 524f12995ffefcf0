#include "dump.hpp"

#include <iostream>
#include <string>

#include <redlog.hpp>

#include <sk1p/engine/stats.hpp>
#include <sk1p/utils/pretty_hexdump.hpp>

namespace sk1px::commands {

int dump_command(const dump_request& request) {
  auto log = redlog::get_logger("sk1px.dump");

  auto index = load_pattern(request.pattern);
  if (!index.ok()) {
    return 1;
  }

  std::string pattern_dump = sk1p::utils::format_hexdump(index.value.pattern());
  log.vrb(redlog::fmt("pattern\n%s", pattern_dump.c_str()));

  std::cout << sk1p::engine::dump_index(index.value, request.max_lines);
  return 0;
}

} // namespace sk1px::commands
