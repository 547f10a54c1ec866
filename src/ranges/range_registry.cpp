#include "liftkit/ranges/range_registry.h"

#include <algorithm>
#include <utility>

namespace liftkit::ranges {

RangeRegistry::RangeRegistry(RangeSet ranges) : ranges_(std::move(ranges)) {
  for (std::size_t i = 0; i < ranges_.ranges.size(); ++i) {
    const Range& range = ranges_.ranges[i];
    auto [it, inserted] = index_.try_emplace(range.id);
    if (!inserted) {
      continue;
    }
    it->second.position = i;
    for (std::size_t j = 0; j < range.elements.size(); ++j) {
      it->second.elements.try_emplace(range.elements[j].id, j);
    }
  }
}

const RangeRegistry::RangeIndex* RangeRegistry::index_of(std::string_view range_id) const {
  auto it = index_.find(range_id);
  if (it == index_.end()) {
    return nullptr;
  }
  return &it->second;
}

const Range* RangeRegistry::find_range(std::string_view range_id) const {
  const RangeIndex* index = index_of(range_id);
  return index == nullptr ? nullptr : &ranges_.ranges[index->position];
}

const RangeElement* RangeRegistry::find_element(std::string_view range_id,
                                                std::string_view element_id) const {
  const RangeIndex* index = index_of(range_id);
  if (index == nullptr) {
    return nullptr;
  }
  auto it = index->elements.find(element_id);
  if (it == index->elements.end()) {
    return nullptr;
  }
  return &ranges_.ranges[index->position].elements[it->second];
}

std::vector<ElementLocation> RangeRegistry::find_element_anywhere(
    std::string_view element_id) const {
  std::vector<ElementLocation> found;
  for (const auto& range : ranges_.ranges) {
    if (find_range(range.id) != &range) {
      continue;  // Shadowed duplicate range id
    }
    if (const RangeElement* element = find_element(range.id, element_id)) {
      found.push_back({&range, element});
    }
  }
  return found;
}

bool RangeRegistry::contains(std::string_view range_id, std::string_view element_id) const {
  return find_element(range_id, element_id) != nullptr;
}

bool RangeRegistry::has_range(std::string_view range_id) const {
  return index_of(range_id) != nullptr;
}

std::vector<const RangeElement*> RangeRegistry::children(std::string_view range_id,
                                                         std::string_view element_id) const {
  std::vector<const RangeElement*> result;
  const Range* range = find_range(range_id);
  if (range == nullptr) {
    return result;
  }
  for (const auto& element : range->elements) {
    if (element.parent.has_value() && *element.parent == element_id) {
      result.push_back(&element);
    }
  }
  return result;
}

std::vector<const RangeElement*> RangeRegistry::roots(std::string_view range_id) const {
  std::vector<const RangeElement*> result;
  const Range* range = find_range(range_id);
  if (range == nullptr) {
    return result;
  }
  for (const auto& element : range->elements) {
    if (!element.parent.has_value() || !contains(range_id, *element.parent)) {
      result.push_back(&element);
    }
  }
  return result;
}

std::vector<const RangeElement*> RangeRegistry::ancestors(std::string_view range_id,
                                                          std::string_view element_id) const {
  std::vector<const RangeElement*> result;
  const RangeElement* current = find_element(range_id, element_id);
  while (current != nullptr && current->parent.has_value()) {
    const RangeElement* parent = find_element(range_id, *current->parent);
    if (parent == nullptr || parent->id == element_id ||
        std::find(result.begin(), result.end(), parent) != result.end()) {
      break;
    }
    result.push_back(parent);
    current = parent;
  }
  return result;
}

std::vector<std::string> RangeRegistry::range_ids() const {
  std::vector<std::string> ids;
  ids.reserve(index_.size());
  for (const auto& range : ranges_.ranges) {
    if (find_range(range.id) == &range) {
      ids.push_back(range.id);
    }
  }
  return ids;
}

}  // namespace liftkit::ranges
