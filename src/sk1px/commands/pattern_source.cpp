#include "pattern_source.hpp"

#include <algorithm>
#include <iostream>

#include <redlog.hpp>

#include <sk1p/engine/pattern.hpp>
#include <sk1p/utils/hex_utils.hpp>

namespace sk1px::commands {

using sk1p::engine::error_code;
using sk1p::engine::error_result;
using sk1p::engine::pattern_index;
using sk1p::engine::result;

result<pattern_index> load_pattern(const pattern_source& source) {
  auto log = redlog::get_logger("sk1px.pattern");

  if (!source.text.empty() && !source.hex.empty()) {
    log.err("both text and hex patterns given");
    std::cerr << "error: use either -p/--pattern or -x/--hex, not both" << std::endl;
    return error_result<pattern_index>(error_code::invalid_argument, "conflicting pattern sources");
  }

  auto bytes = source.hex.empty() ? sk1p::engine::literal_pattern(source.text)
                                  : sk1p::engine::parse_hex_pattern(source.hex);
  if (!bytes.ok()) {
    log.err("invalid pattern", redlog::field("error", bytes.status_info.message));
    std::cerr << "error: " << bytes.status_info.message << std::endl;
    return error_result<pattern_index>(bytes.status_info.code, bytes.status_info.message);
  }

  auto index = sk1p::engine::build_index(bytes.value);
  if (!index.ok()) {
    log.err("failed to build pattern index", redlog::field("error", index.status_info.message));
    std::cerr << "error: " << index.status_info.message << std::endl;
    return index;
  }

  auto pattern = index.value.pattern();
  log.vrb(
      "pattern index ready", redlog::field("pattern_size", pattern.size()),
      redlog::field("bytes", sk1p::utils::format_bytes(pattern.first(std::min<size_t>(pattern.size(), 32))))
  );
  return index;
}

} // namespace sk1px::commands
