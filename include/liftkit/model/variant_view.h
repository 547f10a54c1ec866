#pragma once

#include "liftkit/model/entry.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace liftkit::model {

enum class VariantKind {
  kDirect,    // <variant> with inline forms
  kRelation,  // <relation> carrying a variant-type trait
};

// VariantView is a read-only interface for enumerating both variant shapes
// uniformly (e.g. to list "all variants" in a host UI). It never merges the
// underlying data: each view refers to exactly one Variant or one Relation,
// and the referenced object must outlive the view.
class VariantView {
 public:
  virtual ~VariantView() = default;

  [[nodiscard]] virtual VariantKind kind() const noexcept = 0;

  // Inline forms. Empty for relation-typed variants, which point elsewhere.
  [[nodiscard]] virtual const Multitext& forms() const = 0;

  // Traits carried by the underlying object itself.
  [[nodiscard]] virtual const std::vector<Trait>& traits() const = 0;

  // Target entry id, when the variant refers to another entry.
  [[nodiscard]] virtual std::optional<std::string> target() const = 0;

  // variant_type reads the "variant-type" trait, when present.
  [[nodiscard]] std::optional<std::string> variant_type() const;

 protected:
  VariantView() = default;
  VariantView(const VariantView&) = default;
  VariantView& operator=(const VariantView&) = default;
  VariantView(VariantView&&) = default;
  VariantView& operator=(VariantView&&) = default;
};

class DirectVariantView final : public VariantView {
 public:
  explicit DirectVariantView(const Variant& variant) : variant_(&variant) {}

  [[nodiscard]] VariantKind kind() const noexcept override { return VariantKind::kDirect; }
  [[nodiscard]] const Multitext& forms() const override { return variant_->form; }
  [[nodiscard]] const std::vector<Trait>& traits() const override { return variant_->traits; }
  [[nodiscard]] std::optional<std::string> target() const override { return variant_->ref; }

  [[nodiscard]] const Variant& variant() const { return *variant_; }

 private:
  const Variant* variant_;
};

class RelationVariantView final : public VariantView {
 public:
  explicit RelationVariantView(const Relation& relation) : relation_(&relation) {}

  [[nodiscard]] VariantKind kind() const noexcept override { return VariantKind::kRelation; }
  [[nodiscard]] const Multitext& forms() const override;
  [[nodiscard]] const std::vector<Trait>& traits() const override { return relation_->traits; }
  [[nodiscard]] std::optional<std::string> target() const override { return relation_->ref; }

  [[nodiscard]] const Relation& relation() const { return *relation_; }

 private:
  const Relation* relation_;
};

// is_variant_relation: a relation with a non-empty ref and a variant-type trait.
[[nodiscard]] bool is_variant_relation(const Relation& relation);

// collect_variant_views lists direct variants first, then variant relations,
// each group in document order.
[[nodiscard]] std::vector<std::unique_ptr<VariantView>> collect_variant_views(const Entry& entry);

}  // namespace liftkit::model
