#pragma once

#include "liftkit/model/entry.h"
#include "liftkit/model/header.h"

#include <string_view>
#include <vector>

namespace liftkit::model {

// Document is the unit produced by one parse call and consumed by one generate call.
struct Document {
  Header header;
  std::vector<Entry> entries;

  // find_entry returns the entry with the given id, or nullptr.
  [[nodiscard]] const Entry* find_entry(std::string_view id) const;
  [[nodiscard]] Entry* find_entry(std::string_view id);

  bool operator==(const Document&) const = default;
};

}  // namespace liftkit::model
