#include "cli_io.h"

#include <fstream>
#include <iostream>
#include <sstream>

liftkit::core::Result<std::string, std::string> read_input(const std::string& path) {
  using ReadResult = liftkit::core::Result<std::string, std::string>;

  std::ostringstream buffer;
  if (path == "-") {
    buffer << std::cin.rdbuf();
    return ReadResult::ok(buffer.str());
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return ReadResult::err("cannot open " + path);
  }
  buffer << in.rdbuf();
  if (in.bad()) {
    return ReadResult::err("failed reading " + path);
  }
  return ReadResult::ok(buffer.str());
}

liftkit::core::Result<bool, std::string> write_output(const std::optional<std::string>& path,
                                                      const std::string& text) {
  using WriteResult = liftkit::core::Result<bool, std::string>;

  if (!path.has_value()) {
    std::cout << text;
    if (!text.empty() && text.back() != '\n') {
      std::cout << "\n";
    }
    return WriteResult::ok(true);
  }

  std::ofstream out(*path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return WriteResult::err("cannot open " + *path + " for writing");
  }
  out << text;
  out.flush();
  if (!out) {
    return WriteResult::err("failed writing " + *path);
  }
  return WriteResult::ok(true);
}

void print_report(const liftkit::codec::ParseReport& report, std::ostream& diagnostics) {
  for (const auto& issue : report.issues) {
    diagnostics << "[" << liftkit::codec::to_string(issue.kind) << "] " << issue.path << ": "
                << issue.message << "\n";
  }
}
