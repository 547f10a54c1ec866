#include "liftkit/model/variant_view.h"

namespace liftkit::model {

namespace {

constexpr const char* kVariantTypeTrait = "variant-type";

}  // namespace

std::optional<std::string> VariantView::variant_type() const {
  if (const Trait* trait = find_trait(traits(), kVariantTypeTrait)) {
    return trait->value;
  }
  return std::nullopt;
}

const Multitext& RelationVariantView::forms() const {
  static const Multitext kNoForms;
  return kNoForms;
}

bool is_variant_relation(const Relation& relation) {
  return !relation.ref.empty() && find_trait(relation.traits, kVariantTypeTrait) != nullptr;
}

std::vector<std::unique_ptr<VariantView>> collect_variant_views(const Entry& entry) {
  std::vector<std::unique_ptr<VariantView>> views;
  for (const auto& variant : entry.variants) {
    views.push_back(std::make_unique<DirectVariantView>(variant));
  }
  for (const auto& relation : entry.relations) {
    if (is_variant_relation(relation)) {
      views.push_back(std::make_unique<RelationVariantView>(relation));
    }
  }
  return views;
}

}  // namespace liftkit::model
