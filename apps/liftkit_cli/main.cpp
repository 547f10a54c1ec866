#include "liftkit/core/version.h"

#include "commands/inspect.h"
#include "commands/normalize.h"
#include "commands/ranges.h"
#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "liftkit_cli " << liftkit::core::kBuildVersion << "\n"
            << "Usage: liftkit_cli <command> [args]\n\n"
            << "Commands:\n"
            << "  normalize <file.lift>   Parse and regenerate a LIFT document\n"
            << "  to-json <file.lift>     Print the document or one entry as JSON\n"
            << "  languages <file.lift>   List language codes and trait vocabularies\n"
            << "  ranges <file>           Print a .lift-ranges file as JSON\n"
            << "  check <file.lift>       Validate values against a ranges file\n\n"
            << "Run a command without arguments to see its options.\n";
}

}  // namespace

int main(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "normalize") {
    return cmd_normalize(argc, argv);
  }
  if (subcommand == "to-json") {
    return cmd_to_json(argc, argv);
  }
  if (subcommand == "languages") {
    return cmd_languages(argc, argv);
  }
  if (subcommand == "ranges") {
    return cmd_ranges(argc, argv);
  }
  if (subcommand == "check") {
    return cmd_check(argc, argv);
  }
  if (subcommand == "--version") {
    std::cout << "liftkit_cli " << liftkit::core::kBuildVersion << "\n";
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 1;
}
