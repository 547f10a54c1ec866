#pragma once

#include "liftkit/codec/parse_options.h"
#include "liftkit/codec/parse_result.h"

#include <string_view>

namespace liftkit::codec {

// Maximum subsense nesting accepted below a top-level sense.
constexpr int kMaxSenseDepth = 32;

// LiftParser converts LIFT 0.13 XML text into the document model.
//
// Input may be a complete <lift> document or a single <entry> element (as read
// back from an XML database). Element names are matched namespace-tolerantly
// (see xml::NameResolver). The parser is stateless apart from its options and
// may be shared between threads.
class LiftParser {
 public:
  explicit LiftParser(ParseOptions options = {});

  // parse reads a whole document. A <header> is optional; its absence yields an
  // empty Header. Schema violations abort in kStrict mode and are skipped and
  // reported in kLenient mode.
  [[nodiscard]] ParseResult parse(std::string_view xml) const;

  // parse_entry reads a single <entry> fragment, or the first entry of a <lift>
  // document. Fails with kSchemaViolation when no entry can be produced.
  [[nodiscard]] EntryParseResult parse_entry(std::string_view xml) const;

  [[nodiscard]] const ParseOptions& options() const { return options_; }

 private:
  ParseOptions options_;
};

}  // namespace liftkit::codec
