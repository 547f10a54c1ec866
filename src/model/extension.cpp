#include "liftkit/model/extension.h"

namespace liftkit::model {

const Trait* find_trait(const std::vector<Trait>& traits, std::string_view name) {
  for (const auto& trait : traits) {
    if (trait.name == name) {
      return &trait;
    }
  }
  return nullptr;
}

std::vector<std::string> trait_values(const std::vector<Trait>& traits, std::string_view name) {
  std::vector<std::string> values;
  for (const auto& trait : traits) {
    if (trait.name == name) {
      values.push_back(trait.value);
    }
  }
  return values;
}

const Field* find_field(const std::vector<Field>& fields, std::string_view type) {
  for (const auto& field : fields) {
    if (field.type == type) {
      return &field;
    }
  }
  return nullptr;
}

}  // namespace liftkit::model
