#pragma once

#include "liftkit/codec/parse_options.h"
#include "liftkit/core/result.h"
#include "liftkit/validation/range_validator.h"

#include <nlohmann/json.hpp>

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

// execute_ranges converts a ranges document (or one range of it) to JSON.
liftkit::core::Result<nlohmann::json, std::string> execute_ranges(
    std::string_view ranges_xml, const std::optional<std::string>& range_id);

// execute_check validates a LIFT document against a ranges document. Warnings
// are advisory: they are printed to diagnostics and summarized in the result,
// never turned into an error.
liftkit::core::Result<nlohmann::json, std::string> execute_check(
    std::string_view lift_xml, std::string_view ranges_xml,
    const liftkit::codec::ParseOptions& options,
    const liftkit::validation::RangeBindings& bindings, std::ostream& diagnostics);
