#pragma once

#include "liftkit/ranges/range.h"

#include <nlohmann/json.hpp>

namespace liftkit::json {

/// Serialize one range element, including its parent id when set.
[[nodiscard]] nlohmann::json range_element_to_json(const ranges::RangeElement& element);

/// Serialize a range with its elements in document order.
[[nodiscard]] nlohmann::json range_to_json(const ranges::Range& range);

/// Serialize a range set as an array of ranges.
[[nodiscard]] nlohmann::json range_set_to_json(const ranges::RangeSet& set);

}  // namespace liftkit::json
