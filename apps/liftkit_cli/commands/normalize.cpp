#include "normalize.h"

#include "cli_io.h"
#include "normalize_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct NormalizeCliConfig {
  std::optional<std::string> out_path;
  NormalizeRequest request;
};

}  // namespace

int cmd_normalize(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<liftkit::apps::Option<NormalizeCliConfig>> options = {
      {"--out", true, "Write the result to this file instead of stdout",
       [](NormalizeCliConfig& c, const std::string& v) {
         c.out_path = v;
         return true;
       }},
      {"--lenient", false, "Skip invalid constructs instead of failing",
       [](NormalizeCliConfig& c, const std::string&) {
         c.request.parse.mode = liftkit::codec::ParseMode::kLenient;
         return true;
       }},
      {"--known-subset", false, "Drop unmodeled elements instead of preserving them",
       [](NormalizeCliConfig& c, const std::string&) {
         c.request.parse.unknown_elements = liftkit::codec::UnknownElementPolicy::kKnownSubset;
         return true;
       }},
      {"--prefixed", false, "Write lift:-prefixed element names",
       [](NormalizeCliConfig& c, const std::string&) {
         c.request.generate.ns_style = liftkit::codec::NamespaceStyle::kPrefixed;
         return true;
       }},
      {"--producer", true, "Producer attribute for the <lift> root",
       [](NormalizeCliConfig& c, const std::string& v) {
         c.request.generate.producer = v;
         return true;
       }},
  };
  auto args = liftkit::apps::parse_options(argc, argv, options);
  if (!args.ok || args.positionals.size() != 1) {
    std::cerr << "Usage: liftkit_cli normalize <file.lift|-> [options]\n";
    liftkit::apps::print_options(std::cerr, options);
    return 1;
  }

  auto input = read_input(args.positionals.front());
  if (!input.has_value()) {
    std::cerr << "Error: " << input.error() << "\n";
    return 1;
  }

  auto result = execute_normalize(input.value(), args.config.request, std::cerr);
  if (!result.has_value()) {
    std::cerr << "Error: " << result.error() << "\n";
    return 1;
  }

  auto written = write_output(args.config.out_path, result.value());
  if (!written.has_value()) {
    std::cerr << "Error: " << written.error() << "\n";
    return 1;
  }
  return 0;
}
