#include "ranges.h"

#include "cli_io.h"
#include "ranges_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct RangesCliConfig {
  std::optional<std::string> out_path;
  std::optional<std::string> range_id;
  std::optional<std::string> ranges_path;
  liftkit::codec::ParseOptions parse;
};

liftkit::apps::Option<RangesCliConfig> out_option() {
  return {"--out", true, "Write the result to this file instead of stdout",
          [](RangesCliConfig& c, const std::string& v) {
            c.out_path = v;
            return true;
          }};
}

int emit(const RangesCliConfig& config, const nlohmann::json& out) {
  auto written = write_output(config.out_path, out.dump(2));
  if (!written.has_value()) {
    std::cerr << "Error: " << written.error() << "\n";
    return 1;
  }
  return 0;
}

}  // namespace

int cmd_ranges(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<liftkit::apps::Option<RangesCliConfig>> options = {
      out_option(),
      {"--range", true, "Print only the range with this id",
       [](RangesCliConfig& c, const std::string& v) {
         c.range_id = v;
         return true;
       }},
  };
  auto args = liftkit::apps::parse_options(argc, argv, options);
  if (!args.ok || args.positionals.size() != 1) {
    std::cerr << "Usage: liftkit_cli ranges <file.lift-ranges|-> [options]\n";
    liftkit::apps::print_options(std::cerr, options);
    return 1;
  }

  auto input = read_input(args.positionals.front());
  if (!input.has_value()) {
    std::cerr << "Error: " << input.error() << "\n";
    return 1;
  }

  auto result = execute_ranges(input.value(), args.config.range_id);
  if (!result.has_value()) {
    std::cerr << "Error: " << result.error() << "\n";
    return 1;
  }
  return emit(args.config, result.value());
}

int cmd_check(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<liftkit::apps::Option<RangesCliConfig>> options = {
      out_option(),
      {"--ranges", true, "Ranges file to validate against (required)",
       [](RangesCliConfig& c, const std::string& v) {
         c.ranges_path = v;
         return true;
       }},
      {"--lenient", false, "Skip invalid constructs instead of failing",
       [](RangesCliConfig& c, const std::string&) {
         c.parse.mode = liftkit::codec::ParseMode::kLenient;
         return true;
       }},
  };
  auto args = liftkit::apps::parse_options(argc, argv, options);
  if (!args.ok || args.positionals.size() != 1 || !args.config.ranges_path.has_value()) {
    std::cerr << "Usage: liftkit_cli check <file.lift|-> --ranges <file.lift-ranges> [options]\n";
    liftkit::apps::print_options(std::cerr, options);
    return 1;
  }

  auto lift_input = read_input(args.positionals.front());
  if (!lift_input.has_value()) {
    std::cerr << "Error: " << lift_input.error() << "\n";
    return 1;
  }
  auto ranges_input = read_input(*args.config.ranges_path);
  if (!ranges_input.has_value()) {
    std::cerr << "Error: " << ranges_input.error() << "\n";
    return 1;
  }

  auto result = execute_check(lift_input.value(), ranges_input.value(), args.config.parse,
                              liftkit::validation::RangeBindings{}, std::cerr);
  if (!result.has_value()) {
    std::cerr << "Error: " << result.error() << "\n";
    return 1;
  }
  return emit(args.config, result.value());
}
