#pragma once

#include "liftkit/core/result.h"
#include "liftkit/ranges/range.h"

#include <string>
#include <string_view>

namespace liftkit::ranges {

enum class RangesErrorKind {
  kMalformedXml,
  kSchemaViolation,  // Root is not a ranges container
};

struct RangesError {
  RangesErrorKind kind{RangesErrorKind::kMalformedXml};
  std::string path;
  std::string message;
};

using RangesParseResult = core::Result<RangeSet, RangesError>;

[[nodiscard]] std::string_view to_string(RangesErrorKind kind);

// parse_ranges reads range definitions from any of:
//   <lift-ranges> with <range> children (a .lift-ranges file)
//   a single <range> element
//   <lift> or <header> carrying ranges inline under <header><ranges>
//
// Both hierarchy styles are accepted: parent="" attributes, and
// <range-element> nested inside <range-element>. Ranges or elements without an
// id are skipped. Element names are namespace-tolerant like the entry parser.
[[nodiscard]] RangesParseResult parse_ranges(std::string_view xml);

// generate_ranges renders a <lift-ranges> document. Hierarchy is written as
// parent attributes with all elements of a range as siblings.
[[nodiscard]] std::string generate_ranges(const RangeSet& ranges, bool indent = true);

}  // namespace liftkit::ranges
