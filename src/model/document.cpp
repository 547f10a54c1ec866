#include "liftkit/model/document.h"

namespace liftkit::model {

const Entry* Document::find_entry(std::string_view id) const {
  for (const auto& entry : entries) {
    if (entry.id == id) {
      return &entry;
    }
  }
  return nullptr;
}

Entry* Document::find_entry(std::string_view id) {
  for (auto& entry : entries) {
    if (entry.id == id) {
      return &entry;
    }
  }
  return nullptr;
}

}  // namespace liftkit::model
