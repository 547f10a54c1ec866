#include "liftkit/json/ranges_json.h"

#include "liftkit/json/entry_json.h"

#include <vector>

namespace liftkit::json {

namespace {

nlohmann::json traits_to_json(const std::vector<model::Trait>& traits) {
  nlohmann::json array = nlohmann::json::array();
  for (const auto& trait : traits) {
    array.push_back(nlohmann::json{{"name", trait.name}, {"value", trait.value}});
  }
  return array;
}

}  // namespace

nlohmann::json range_element_to_json(const ranges::RangeElement& element) {
  nlohmann::json j;
  j["id"] = element.id;
  if (element.guid.has_value()) {
    j["guid"] = element.guid.value();
  }
  if (element.parent.has_value()) {
    j["parent"] = element.parent.value();
  }
  j["label"] = multitext_to_json(element.label);
  j["description"] = multitext_to_json(element.description);
  j["abbrev"] = multitext_to_json(element.abbrev);
  j["traits"] = traits_to_json(element.traits);

  nlohmann::json fields = nlohmann::json::object();
  for (const auto& field : element.fields) {
    fields[field.type] = multitext_to_json(field.content);
  }
  j["fields"] = fields;
  return j;
}

nlohmann::json range_to_json(const ranges::Range& range) {
  nlohmann::json j;
  j["id"] = range.id;
  if (range.guid.has_value()) {
    j["guid"] = range.guid.value();
  }
  if (range.href.has_value()) {
    j["href"] = range.href.value();
  }
  j["label"] = multitext_to_json(range.label);
  j["description"] = multitext_to_json(range.description);

  nlohmann::json elements = nlohmann::json::array();
  for (const auto& element : range.elements) {
    elements.push_back(range_element_to_json(element));
  }
  j["elements"] = elements;
  return j;
}

nlohmann::json range_set_to_json(const ranges::RangeSet& set) {
  nlohmann::json array = nlohmann::json::array();
  for (const auto& range : set.ranges) {
    array.push_back(range_to_json(range));
  }
  return array;
}

}  // namespace liftkit::json
