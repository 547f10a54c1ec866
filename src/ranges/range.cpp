#include "liftkit/ranges/range.h"

namespace liftkit::ranges {

const RangeElement* Range::find_element(std::string_view element_id) const {
  for (const auto& element : elements) {
    if (element.id == element_id) {
      return &element;
    }
  }
  return nullptr;
}

const Range* RangeSet::find_range(std::string_view range_id) const {
  for (const auto& range : ranges) {
    if (range.id == range_id) {
      return &range;
    }
  }
  return nullptr;
}

}  // namespace liftkit::ranges
