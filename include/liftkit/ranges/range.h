#pragma once

#include "liftkit/model/extension.h"
#include "liftkit/model/multitext.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace liftkit::ranges {

// RangeElement is one controlled-vocabulary value (<range-element>).
// Hierarchy is expressed by parent id only; nested elements in the source are
// flattened with their enclosing element as parent.
struct RangeElement {
  std::string id;
  std::optional<std::string> guid;
  std::optional<std::string> parent;
  model::Multitext label;
  model::Multitext description;
  model::Multitext abbrev;
  std::vector<model::Trait> traits;
  std::vector<model::Field> fields;  // reverse-label, reverse-abbrev, custom

  bool operator==(const RangeElement&) const = default;
};

// Range is a named vocabulary (grammatical-info, variant-type, ...).
struct Range {
  std::string id;
  std::optional<std::string> guid;
  std::optional<std::string> href;
  model::Multitext label;
  model::Multitext description;
  std::vector<RangeElement> elements;  // Document order; parents precede children

  [[nodiscard]] const RangeElement* find_element(std::string_view element_id) const;

  bool operator==(const Range&) const = default;
};

struct RangeSet {
  std::vector<Range> ranges;

  [[nodiscard]] const Range* find_range(std::string_view range_id) const;

  bool operator==(const RangeSet&) const = default;
};

// Well-known FieldWorks field types on range elements.
constexpr const char* kReverseLabelField = "reverse-label";
constexpr const char* kReverseAbbrevField = "reverse-abbrev";

}  // namespace liftkit::ranges
