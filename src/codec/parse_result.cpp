#include "liftkit/codec/parse_result.h"

#include <algorithm>

namespace liftkit::codec {

std::size_t ParseReport::count(ParseIssueKind kind) const {
  return static_cast<std::size_t>(std::count_if(
      issues.begin(), issues.end(), [kind](const ParseIssue& issue) { return issue.kind == kind; }));
}

std::string_view to_string(ParseErrorKind kind) {
  switch (kind) {
    case ParseErrorKind::kMalformedXml:
      return "MalformedXml";
    case ParseErrorKind::kSchemaViolation:
      return "SchemaViolation";
  }
  return "Unknown";
}

std::string_view to_string(ParseIssueKind kind) {
  switch (kind) {
    case ParseIssueKind::kSkippedConstruct:
      return "SkippedConstruct";
    case ParseIssueKind::kUnknownConstruct:
      return "UnknownConstruct";
    case ParseIssueKind::kUnresolvedNamespace:
      return "UnresolvedNamespace";
  }
  return "Unknown";
}

std::string format_error(const ParseError& error) {
  std::string text{to_string(error.kind)};
  if (!error.path.empty()) {
    text += " at " + error.path;
  }
  text += ": " + error.message;
  return text;
}

}  // namespace liftkit::codec
