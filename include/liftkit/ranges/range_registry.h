#pragma once

#include "liftkit/ranges/range.h"

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace liftkit::ranges {

// ElementLocation names an element found by a cross-range lookup.
struct ElementLocation {
  const Range* range{nullptr};
  const RangeElement* element{nullptr};
};

// RangeRegistry is an immutable, indexed view over a RangeSet.
//
// All lookups are const and return pointers into the registry's own copy, so
// results stay valid for the registry's lifetime. A registry may be shared by
// const reference between threads. When a range id or an element id within one
// range repeats, the first occurrence wins.
class RangeRegistry {
 public:
  RangeRegistry() = default;
  explicit RangeRegistry(RangeSet ranges);

  RangeRegistry(const RangeRegistry&) = delete;
  RangeRegistry& operator=(const RangeRegistry&) = delete;
  RangeRegistry(RangeRegistry&&) = default;
  RangeRegistry& operator=(RangeRegistry&&) = default;

  [[nodiscard]] const Range* find_range(std::string_view range_id) const;
  [[nodiscard]] const RangeElement* find_element(std::string_view range_id,
                                                 std::string_view element_id) const;

  // find_element_anywhere returns every range holding element_id, in range order.
  [[nodiscard]] std::vector<ElementLocation> find_element_anywhere(
      std::string_view element_id) const;

  // contains is true when range_id is loaded and holds element_id.
  [[nodiscard]] bool contains(std::string_view range_id, std::string_view element_id) const;
  [[nodiscard]] bool has_range(std::string_view range_id) const;

  [[nodiscard]] std::vector<const RangeElement*> children(std::string_view range_id,
                                                          std::string_view element_id) const;

  // roots lists elements without a parent, or whose parent is not in the range.
  [[nodiscard]] std::vector<const RangeElement*> roots(std::string_view range_id) const;

  // ancestors walks parent links from element_id upward, nearest first. Cycles
  // and dangling parents end the walk.
  [[nodiscard]] std::vector<const RangeElement*> ancestors(std::string_view range_id,
                                                           std::string_view element_id) const;

  [[nodiscard]] std::vector<std::string> range_ids() const;
  [[nodiscard]] const RangeSet& range_set() const { return ranges_; }

 private:
  struct RangeIndex {
    std::size_t position{0};
    std::map<std::string, std::size_t, std::less<>> elements;
  };

  [[nodiscard]] const RangeIndex* index_of(std::string_view range_id) const;

  RangeSet ranges_;
  std::map<std::string, RangeIndex, std::less<>> index_;
};

}  // namespace liftkit::ranges
