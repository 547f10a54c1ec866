#pragma once

#include "liftkit/codec/lift_generator.h"
#include "liftkit/codec/parse_options.h"
#include "liftkit/core/result.h"

#include <iosfwd>
#include <string>
#include <string_view>

struct NormalizeRequest {
  liftkit::codec::ParseOptions parse;
  liftkit::codec::GenerateOptions generate;
};

// execute_normalize parses a LIFT document and regenerates it in canonical
// form. Parse issues go to diagnostics; a fatal parse or generate error is
// returned as the error message.
liftkit::core::Result<std::string, std::string> execute_normalize(std::string_view xml,
                                                                  const NormalizeRequest& request,
                                                                  std::ostream& diagnostics);
