#include "liftkit/codec/generate_result.h"

namespace liftkit::codec {

std::string_view to_string(GenerateErrorKind kind) {
  switch (kind) {
    case GenerateErrorKind::kMissingEntryId:
      return "MissingEntryId";
    case GenerateErrorKind::kMissingTraitName:
      return "MissingTraitName";
    case GenerateErrorKind::kMissingFieldType:
      return "MissingFieldType";
    case GenerateErrorKind::kInvalidExtraAttribute:
      return "InvalidExtraAttribute";
    case GenerateErrorKind::kMalformedPreservedElement:
      return "MalformedPreservedElement";
  }
  return "Unknown";
}

}  // namespace liftkit::codec
