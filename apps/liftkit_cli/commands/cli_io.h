#pragma once

#include "liftkit/codec/parse_result.h"
#include "liftkit/core/result.h"

#include <iosfwd>
#include <optional>
#include <string>

// read_input returns the contents of path, or of standard input for "-".
liftkit::core::Result<std::string, std::string> read_input(const std::string& path);

// write_output writes text to path, or to standard output when path is absent.
liftkit::core::Result<bool, std::string> write_output(const std::optional<std::string>& path,
                                                      const std::string& text);

// print_report writes one line per parse issue ("[Kind] path: message").
void print_report(const liftkit::codec::ParseReport& report, std::ostream& diagnostics);
