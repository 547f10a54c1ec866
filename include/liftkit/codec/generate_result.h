#pragma once

#include "liftkit/core/result.h"

#include <string>
#include <string_view>

namespace liftkit::codec {

// Precondition failures of generation. The generator refuses to write XML that
// its own parser would reject in strict mode.
enum class GenerateErrorKind {
  kMissingEntryId,             // Entry id is empty or blank; the generator never invents ids
  kMissingTraitName,           // Trait with an empty name
  kMissingFieldType,           // Field with an empty type
  kInvalidExtraAttribute,      // Preserved attribute with an empty name or one the element already writes
  kMalformedPreservedElement,  // A preserved extension element is no longer well-formed XML
};

struct GenerateError {
  GenerateErrorKind kind{GenerateErrorKind::kMissingEntryId};
  std::string path;  // "/lift/entry[2]", "/lift/header", "/entry" for fragments
  std::string message;
};

using GenerateResult = core::Result<std::string, GenerateError>;

[[nodiscard]] std::string_view to_string(GenerateErrorKind kind);

}  // namespace liftkit::codec
