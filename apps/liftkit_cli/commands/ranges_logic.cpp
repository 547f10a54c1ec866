#include "ranges_logic.h"

#include "liftkit/codec/lift_parser.h"
#include "liftkit/json/ranges_json.h"
#include "liftkit/query/lexicon_queries.h"
#include "liftkit/ranges/range_registry.h"
#include "liftkit/ranges/ranges_codec.h"

#include "cli_io.h"

#include <ostream>
#include <utility>

namespace {

std::string format_ranges_error(const liftkit::ranges::RangesError& error) {
  std::string text{liftkit::ranges::to_string(error.kind)};
  if (!error.path.empty()) {
    text += " at " + error.path;
  }
  return text + ": " + error.message;
}

}  // namespace

liftkit::core::Result<nlohmann::json, std::string> execute_ranges(
    std::string_view ranges_xml, const std::optional<std::string>& range_id) {
  using JsonResult = liftkit::core::Result<nlohmann::json, std::string>;

  auto parsed = liftkit::ranges::parse_ranges(ranges_xml);
  if (!parsed.has_value()) {
    return JsonResult::err(format_ranges_error(parsed.error()));
  }

  const auto& set = parsed.value();
  if (!range_id.has_value()) {
    return JsonResult::ok(liftkit::json::range_set_to_json(set));
  }
  const auto* range = set.find_range(*range_id);
  if (range == nullptr) {
    return JsonResult::err("no range with id '" + *range_id + "'");
  }
  return JsonResult::ok(liftkit::json::range_to_json(*range));
}

liftkit::core::Result<nlohmann::json, std::string> execute_check(
    std::string_view lift_xml, std::string_view ranges_xml,
    const liftkit::codec::ParseOptions& options,
    const liftkit::validation::RangeBindings& bindings, std::ostream& diagnostics) {
  using JsonResult = liftkit::core::Result<nlohmann::json, std::string>;

  auto ranges = liftkit::ranges::parse_ranges(ranges_xml);
  if (!ranges.has_value()) {
    return JsonResult::err(format_ranges_error(ranges.error()));
  }

  const liftkit::codec::LiftParser parser(options);
  auto parsed = parser.parse(lift_xml);
  if (!parsed.has_value()) {
    return JsonResult::err(liftkit::codec::format_error(parsed.error()));
  }
  print_report(parsed.value().report, diagnostics);

  const auto& document = parsed.value().document;
  const liftkit::ranges::RangeRegistry registry(std::move(ranges.value()));
  const liftkit::validation::RangeValidator validator(registry, bindings);
  const auto warnings = validator.validate(document);

  nlohmann::json out;
  out["entries"] = document.entries.size();
  out["ranges"] = registry.range_ids();

  nlohmann::json warnings_json = nlohmann::json::array();
  for (const auto& warning : warnings) {
    diagnostics << "[" << liftkit::validation::to_string(warning.kind) << "] entry "
                << warning.entry_id << " " << warning.location << ": " << warning.message
                << "\n";
    warnings_json.push_back(nlohmann::json{{"entry_id", warning.entry_id},
                                           {"location", warning.location},
                                           {"range_id", warning.range_id},
                                           {"value", warning.value}});
  }
  out["warnings"] = warnings_json;

  nlohmann::json dangling_json = nlohmann::json::array();
  for (const auto& relation : liftkit::query::dangling_relations(document)) {
    dangling_json.push_back(nlohmann::json{
        {"entry_id", relation.entry_id}, {"type", relation.type}, {"ref", relation.ref}});
  }
  out["dangling_relations"] = dangling_json;
  return JsonResult::ok(out);
}
