#pragma once

// index construction and matching
#include "engine/matcher.hpp"
#include "engine/pattern.hpp"
#include "engine/pattern_index.hpp"
#include "engine/reference.hpp"
#include "engine/result.hpp"
#include "engine/scanner.hpp"
#include "engine/shift_table.hpp"
#include "engine/stats.hpp"

// utilities
#include "utils/env_config.hpp"
#include "utils/file_utils.hpp"
#include "utils/hex_utils.hpp"
#include "utils/pretty_hexdump.hpp"
