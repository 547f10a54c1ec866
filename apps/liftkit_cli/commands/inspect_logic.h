#pragma once

#include "liftkit/codec/parse_options.h"
#include "liftkit/core/result.h"

#include <nlohmann/json.hpp>

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

// execute_to_json converts a LIFT document (or only the entry entry_id) to JSON.
liftkit::core::Result<nlohmann::json, std::string> execute_to_json(
    std::string_view xml, const liftkit::codec::ParseOptions& options,
    const std::optional<std::string>& entry_id, std::ostream& diagnostics);

// execute_languages summarizes the vocabularies in use: language codes,
// variant types, complex form types and relation types.
liftkit::core::Result<nlohmann::json, std::string> execute_languages(
    std::string_view xml, const liftkit::codec::ParseOptions& options, std::ostream& diagnostics);
