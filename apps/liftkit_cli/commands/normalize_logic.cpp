#include "normalize_logic.h"

#include "liftkit/codec/lift_parser.h"

#include "cli_io.h"

#include <ostream>

liftkit::core::Result<std::string, std::string> execute_normalize(std::string_view xml,
                                                                  const NormalizeRequest& request,
                                                                  std::ostream& diagnostics) {
  using NormalizeResult = liftkit::core::Result<std::string, std::string>;

  const liftkit::codec::LiftParser parser(request.parse);
  auto parsed = parser.parse(xml);
  if (!parsed.has_value()) {
    return NormalizeResult::err(liftkit::codec::format_error(parsed.error()));
  }
  print_report(parsed.value().report, diagnostics);

  const liftkit::codec::LiftGenerator generator(request.generate);
  auto generated = generator.generate(parsed.value().document);
  if (!generated.has_value()) {
    const auto& error = generated.error();
    return NormalizeResult::err(std::string{liftkit::codec::to_string(error.kind)} + " at " +
                                error.path + ": " + error.message);
  }
  return NormalizeResult::ok(generated.value());
}
