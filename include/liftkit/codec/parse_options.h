#pragma once

namespace liftkit::codec {

// ParseMode decides what a schema violation (entry without id, relation
// without ref, trait without name) does.
enum class ParseMode {
  kStrict,   // Abort the whole parse with kSchemaViolation
  kLenient,  // Skip the offending construct and report it as kSkippedConstruct
};

// UnknownElementPolicy decides what happens to elements the model does not cover
// (e.g. <illustration>, or extension elements of other producers).
enum class UnknownElementPolicy {
  kStrictLossless,  // Keep them verbatim on the owning entry/sense and re-emit them
  kKnownSubset,     // Drop them; each one is reported as kUnknownConstruct
};

struct ParseOptions {
  ParseMode mode{ParseMode::kStrict};
  UnknownElementPolicy unknown_elements{UnknownElementPolicy::kStrictLossless};
};

}  // namespace liftkit::codec
