#pragma once

#include "liftkit/model/document.h"
#include "liftkit/model/entry.h"
#include "liftkit/ranges/range_registry.h"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace liftkit::validation {

enum class RangeWarningKind {
  kRangeReferenceUnresolved,  // Value not present in its bound range
};

// RangeWarning is advisory. Validation never blocks a parse or a generate call.
struct RangeWarning {
  RangeWarningKind kind{RangeWarningKind::kRangeReferenceUnresolved};
  std::string entry_id;
  std::string location;  // e.g. "sense[s1]/relation[2]"
  std::string range_id;
  std::string value;
  std::string message;
};

// RangeBindings maps model values to the range that defines them. Defaults
// follow the range ids FieldWorks writes.
struct RangeBindings {
  std::string grammatical_info{"grammatical-info"};
  std::string relation_type{"lexical-relation"};
  // Trait name -> range id.
  std::map<std::string, std::string> traits{
      {"morph-type", "morph-type"},
      {"variant-type", "variant-type"},
      {"semantic-domain-ddp4", "semantic-domain-ddp4"},
      {"usage-type", "usage-type"},
      {"domain-type", "domain-type"},
      {"complex-form-type", "complex-form-type"},
  };
  // "_"-prefixed relation types are application-private and not checked.
  bool skip_private_relation_types{true};
};

// RangeValidator checks controlled-vocabulary values against a registry.
// A binding whose range is not loaded is skipped, so partial range files only
// produce warnings for the ranges they contain.
class RangeValidator {
 public:
  // registry must outlive the validator.
  explicit RangeValidator(const ranges::RangeRegistry& registry, RangeBindings bindings = {});

  [[nodiscard]] std::vector<RangeWarning> validate(const model::Document& document) const;
  [[nodiscard]] std::vector<RangeWarning> validate_entry(const model::Entry& entry) const;

  [[nodiscard]] const RangeBindings& bindings() const { return bindings_; }

 private:
  const ranges::RangeRegistry& registry_;
  RangeBindings bindings_;
};

[[nodiscard]] std::string_view to_string(RangeWarningKind kind);

}  // namespace liftkit::validation
