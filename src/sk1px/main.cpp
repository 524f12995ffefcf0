#include "commands/dump.hpp"
#include "commands/find.hpp"
#include "commands/stats.hpp"
#include <args.hxx>
#include <redlog.hpp>
#include <sk1p/cli/verbosity.hpp>
#include <iostream>
#include <string>

namespace cli {
args::Group arguments("arguments");
args::HelpFlag help_flag(arguments, "help", "help", {'h', "help"});
args::CounterFlag verbosity_flag(arguments, "verbosity", "verbosity level", {'v'});

void apply_verbosity() { sk1p::cli::apply_verbosity(args::get(verbosity_flag)); }
} // namespace cli

namespace {

sk1px::commands::pattern_source pattern_from_flags(
    args::ValueFlag<std::string>& text_flag, args::ValueFlag<std::string>& hex_flag
) {
  sk1px::commands::pattern_source source;
  if (text_flag) {
    source.text = args::get(text_flag);
  }
  if (hex_flag) {
    source.hex = args::get(hex_flag);
  }
  return source;
}

bool require_pattern(args::ValueFlag<std::string>& text_flag, args::ValueFlag<std::string>& hex_flag) {
  if (!text_flag && !hex_flag) {
    auto log = redlog::get_logger("sk1px");
    log.err("pattern required");
    std::cerr << "error: a pattern (-p/--pattern or -x/--hex) is required" << std::endl;
    return false;
  }
  return true;
}

} // namespace

int main(int argc, char* argv[]) {
  args::ArgumentParser parser("sk1px - indexed substring search");
  parser.helpParams.showTerminator = false;
  parser.helpParams.helpindent = 2;
  parser.helpParams.width = 120;

  parser.Add(cli::arguments);

  // find command
  args::Command find_cmd(parser, "find", "find every occurrence of a pattern in a file");
  args::ValueFlag<std::string> find_text_flag(find_cmd, "text", "literal pattern", {'p', "pattern"});
  args::ValueFlag<std::string> find_hex_flag(find_cmd, "hex", "hex pattern, e.g. \"de ad be ef\"", {'x', "hex"});
  args::ValueFlag<std::string> find_input_flag(find_cmd, "input", "input file path", {'i', "input"});
  args::Flag find_first_flag(find_cmd, "first", "report only the first match", {"first"});
  args::Flag find_count_flag(find_cmd, "count", "print the number of matches", {"count"});
  args::Flag find_single_flag(find_cmd, "single", "fail unless there is exactly one match", {"single"});
  args::Flag find_verify_flag(find_cmd, "verify", "cross-check against the naive scanner", {"verify"});
  args::Flag find_context_flag(find_cmd, "context", "log a hexdump around each match (-v)", {"context"});
  args::ValueFlag<size_t> find_max_flag(find_cmd, "max", "stop after this many matches", {"max"});

  // stats command
  args::Command stats_cmd(parser, "stats", "show index statistics and observed shifts");
  args::ValueFlag<std::string> stats_text_flag(stats_cmd, "text", "literal pattern", {'p', "pattern"});
  args::ValueFlag<std::string> stats_hex_flag(stats_cmd, "hex", "hex pattern", {'x', "hex"});
  args::ValueFlag<std::string> stats_input_flag(stats_cmd, "input", "optional text to scan", {'i', "input"});

  // dump command
  args::Command dump_cmd(parser, "dump", "print the pattern trie");
  args::ValueFlag<std::string> dump_text_flag(dump_cmd, "text", "literal pattern", {'p', "pattern"});
  args::ValueFlag<std::string> dump_hex_flag(dump_cmd, "hex", "hex pattern", {'x', "hex"});
  args::ValueFlag<size_t> dump_lines_flag(dump_cmd, "lines", "maximum lines to print", {"lines"});

  try {
    parser.ParseCLI(argc, argv);
    cli::apply_verbosity();

    if (find_cmd) {
      if (!require_pattern(find_text_flag, find_hex_flag)) {
        return 1;
      }
      sk1px::commands::find_request request;
      request.pattern = pattern_from_flags(find_text_flag, find_hex_flag);
      request.input_file = find_input_flag ? args::get(find_input_flag) : std::string();
      request.first_only = args::get(find_first_flag);
      request.count_only = args::get(find_count_flag);
      request.single = args::get(find_single_flag);
      request.verify = args::get(find_verify_flag);
      request.context = args::get(find_context_flag);
      request.max_matches = find_max_flag ? args::get(find_max_flag) : 0;
      return sk1px::commands::find_command(request);
    } else if (stats_cmd) {
      if (!require_pattern(stats_text_flag, stats_hex_flag)) {
        return 1;
      }
      sk1px::commands::stats_request request;
      request.pattern = pattern_from_flags(stats_text_flag, stats_hex_flag);
      request.input_file = stats_input_flag ? args::get(stats_input_flag) : std::string();
      return sk1px::commands::stats_command(request);
    } else if (dump_cmd) {
      if (!require_pattern(dump_text_flag, dump_hex_flag)) {
        return 1;
      }
      sk1px::commands::dump_request request;
      request.pattern = pattern_from_flags(dump_text_flag, dump_hex_flag);
      if (dump_lines_flag) {
        request.max_lines = args::get(dump_lines_flag);
      }
      return sk1px::commands::dump_command(request);
    } else {
      std::cerr << "error: no command specified" << std::endl;
      std::cerr << parser;
      return 1;
    }

  } catch (const args::Help&) {
    std::cout << parser;
    return 0;
  } catch (const args::ParseError& e) {
    std::cerr << e.what() << std::endl;
    std::cerr << parser;
    return 1;
  } catch (const args::ValidationError& e) {
    std::cerr << e.what() << std::endl;
    std::cerr << parser;
    return 1;
  }

  return 0;
}
