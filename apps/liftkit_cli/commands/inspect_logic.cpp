#include "inspect_logic.h"

#include "liftkit/codec/lift_parser.h"
#include "liftkit/json/entry_json.h"
#include "liftkit/query/lexicon_queries.h"

#include "cli_io.h"

#include <ostream>

liftkit::core::Result<nlohmann::json, std::string> execute_to_json(
    std::string_view xml, const liftkit::codec::ParseOptions& options,
    const std::optional<std::string>& entry_id, std::ostream& diagnostics) {
  using JsonResult = liftkit::core::Result<nlohmann::json, std::string>;

  const liftkit::codec::LiftParser parser(options);
  auto parsed = parser.parse(xml);
  if (!parsed.has_value()) {
    return JsonResult::err(liftkit::codec::format_error(parsed.error()));
  }
  print_report(parsed.value().report, diagnostics);

  const auto& document = parsed.value().document;
  if (!entry_id.has_value()) {
    return JsonResult::ok(liftkit::json::document_to_json(document));
  }

  const auto* entry = document.find_entry(*entry_id);
  if (entry == nullptr) {
    return JsonResult::err("no entry with id '" + *entry_id + "'");
  }
  return JsonResult::ok(liftkit::json::entry_to_json(*entry));
}

liftkit::core::Result<nlohmann::json, std::string> execute_languages(
    std::string_view xml, const liftkit::codec::ParseOptions& options, std::ostream& diagnostics) {
  using JsonResult = liftkit::core::Result<nlohmann::json, std::string>;

  const liftkit::codec::LiftParser parser(options);
  auto parsed = parser.parse(xml);
  if (!parsed.has_value()) {
    return JsonResult::err(liftkit::codec::format_error(parsed.error()));
  }
  print_report(parsed.value().report, diagnostics);

  const auto& document = parsed.value().document;
  nlohmann::json out;
  out["languages"] = liftkit::query::language_codes(document);
  out["variant_types"] = liftkit::query::variant_type_values(document);
  out["complex_form_types"] = liftkit::query::trait_values(document, "complex-form-type");
  out["relation_types"] = liftkit::query::relation_types(document);
  return JsonResult::ok(out);
}
