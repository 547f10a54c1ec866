#include "inspect.h"

#include "cli_io.h"
#include "inspect_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct InspectCliConfig {
  std::optional<std::string> out_path;
  std::optional<std::string> entry_id;
  liftkit::codec::ParseOptions parse;
};

std::vector<liftkit::apps::Option<InspectCliConfig>> common_options() {
  return {
      {"--out", true, "Write the result to this file instead of stdout",
       [](InspectCliConfig& c, const std::string& v) {
         c.out_path = v;
         return true;
       }},
      {"--lenient", false, "Skip invalid constructs instead of failing",
       [](InspectCliConfig& c, const std::string&) {
         c.parse.mode = liftkit::codec::ParseMode::kLenient;
         return true;
       }},
      {"--known-subset", false, "Drop unmodeled elements instead of preserving them",
       [](InspectCliConfig& c, const std::string&) {
         c.parse.unknown_elements = liftkit::codec::UnknownElementPolicy::kKnownSubset;
         return true;
       }},
  };
}

// run_inspect reads the single positional input and hands it to execute.
template <typename Execute>
int run_inspect(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                const std::vector<liftkit::apps::Option<InspectCliConfig>>& options,
                const char* usage, Execute execute) {
  auto args = liftkit::apps::parse_options(argc, argv, options);
  if (!args.ok || args.positionals.size() != 1) {
    std::cerr << "Usage: " << usage << "\n";
    liftkit::apps::print_options(std::cerr, options);
    return 1;
  }

  auto input = read_input(args.positionals.front());
  if (!input.has_value()) {
    std::cerr << "Error: " << input.error() << "\n";
    return 1;
  }

  auto result = execute(input.value(), args.config);
  if (!result.has_value()) {
    std::cerr << "Error: " << result.error() << "\n";
    return 1;
  }

  auto written = write_output(args.config.out_path, result.value().dump(2));
  if (!written.has_value()) {
    std::cerr << "Error: " << written.error() << "\n";
    return 1;
  }
  return 0;
}

}  // namespace

int cmd_to_json(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  auto options = common_options();
  options.push_back({"--entry-id", true, "Convert only the entry with this id",
                     [](InspectCliConfig& c, const std::string& v) {
                       c.entry_id = v;
                       return true;
                     }});
  return run_inspect(argc, argv, options, "liftkit_cli to-json <file.lift|-> [options]",
                     [](const std::string& xml, const InspectCliConfig& config) {
                       return execute_to_json(xml, config.parse, config.entry_id, std::cerr);
                     });
}

int cmd_languages(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  return run_inspect(argc, argv, common_options(), "liftkit_cli languages <file.lift|-> [options]",
                     [](const std::string& xml, const InspectCliConfig& config) {
                       return execute_languages(xml, config.parse, std::cerr);
                     });
}
