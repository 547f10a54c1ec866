#pragma once

#include "liftkit/core/result.h"
#include "liftkit/model/document.h"
#include "liftkit/model/entry.h"
#include "liftkit/model/header.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace liftkit::codec {

// Fatal outcomes of a parse call.
enum class ParseErrorKind {
  kMalformedXml,     // Not well-formed XML; always fatal
  kSchemaViolation,  // Required attribute/element missing (strict mode), or not a LIFT document
};

struct ParseError {
  ParseErrorKind kind{ParseErrorKind::kMalformedXml};
  std::string path;  // Element path, e.g. "/lift/entry[2]"; empty when unknown
  std::string message;
};

// Non-fatal findings collected while parsing.
enum class ParseIssueKind {
  kSkippedConstruct,     // Schema violation skipped in lenient mode
  kUnknownConstruct,     // Unmodeled element (dropped or preserved per policy)
  kUnresolvedNamespace,  // Document does not bind the LIFT namespace
};

struct ParseIssue {
  ParseIssueKind kind{ParseIssueKind::kUnknownConstruct};
  std::string path;
  std::string message;
};

struct ParseReport {
  std::vector<ParseIssue> issues;
  std::optional<std::string> lift_version;  // <lift version="">
  std::optional<std::string> producer;      // <lift producer="">

  [[nodiscard]] std::size_t count(ParseIssueKind kind) const;
};

struct ParseOutput {
  model::Document document;
  ParseReport report;
};

using ParseResult = core::Result<ParseOutput, ParseError>;
using EntryParseResult = core::Result<model::Entry, ParseError>;
using HeaderParseResult = core::Result<model::Header, ParseError>;

[[nodiscard]] std::string_view to_string(ParseErrorKind kind);
[[nodiscard]] std::string_view to_string(ParseIssueKind kind);

// format_error renders "kind at path: message" for diagnostics.
[[nodiscard]] std::string format_error(const ParseError& error);

}  // namespace liftkit::codec
