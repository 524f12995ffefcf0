#pragma once

#include <sk1p/engine/pattern_index.hpp>
#include <sk1p/engine/result.hpp>
#include <string>

namespace sk1px::commands {

// where the pattern bytes come from: literal text (-p) or hex (-x)
struct pattern_source {
  std::string text;
  std::string hex;
};

// parse the pattern and build its index, reporting failures on stderr
sk1p::engine::result<sk1p::engine::pattern_index> load_pattern(const pattern_source& source);

} // namespace sk1px::commands
