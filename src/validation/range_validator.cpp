#include "liftkit/validation/range_validator.h"

#include "liftkit/core/normalization.h"

#include <optional>
#include <utility>

namespace liftkit::validation {

namespace {

std::string join(const std::string& base, const std::string& segment) {
  return base.empty() ? segment : base + "/" + segment;
}

std::string indexed(std::string_view kind, std::size_t index) {
  return std::string{kind} + "[" + std::to_string(index + 1) + "]";
}

// EntryChecker accumulates warnings for one entry.
class EntryChecker {
 public:
  EntryChecker(const ranges::RangeRegistry& registry, const RangeBindings& bindings,
               const std::string& entry_id, std::vector<RangeWarning>& out)
      : registry_(registry), bindings_(bindings), entry_id_(entry_id), out_(out) {}

  void check_entry(const model::Entry& entry) {
    check_grammatical_info(entry.grammatical_info, "");
    check_traits(entry.traits, "");
    for (std::size_t i = 0; i < entry.pronunciations.size(); ++i) {
      check_traits(entry.pronunciations[i].traits, indexed("pronunciation", i));
    }
    for (std::size_t i = 0; i < entry.senses.size(); ++i) {
      check_sense(entry.senses[i], sense_segment("sense", entry.senses[i], i), "");
    }
    for (std::size_t i = 0; i < entry.variants.size(); ++i) {
      const auto& variant = entry.variants[i];
      const std::string location = indexed("variant", i);
      check_traits(variant.traits, location);
      check_grammatical_info(variant.grammatical_info, location);
    }
    check_relations(entry.relations, "");
    for (std::size_t i = 0; i < entry.etymologies.size(); ++i) {
      check_traits(entry.etymologies[i].traits, indexed("etymology", i));
    }
  }

 private:
  static std::string sense_segment(std::string_view kind, const model::Sense& sense,
                                   std::size_t index) {
    if (sense.id.has_value() && !sense.id->empty()) {
      return std::string{kind} + "[" + *sense.id + "]";
    }
    return indexed(kind, index);
  }

  void check_sense(const model::Sense& sense, const std::string& segment,
                   const std::string& parent) {
    const std::string location = join(parent, segment);
    check_grammatical_info(sense.grammatical_info, location);
    check_traits(sense.traits, location);
    check_relations(sense.relations, location);
    for (std::size_t i = 0; i < sense.examples.size(); ++i) {
      check_traits(sense.examples[i].traits, join(location, indexed("example", i)));
    }
    for (std::size_t i = 0; i < sense.subsenses.size(); ++i) {
      check_sense(sense.subsenses[i], sense_segment("subsense", sense.subsenses[i], i), location);
    }
  }

  void check_relations(const std::vector<model::Relation>& relations, const std::string& parent) {
    for (std::size_t i = 0; i < relations.size(); ++i) {
      const auto& relation = relations[i];
      const std::string location = join(parent, indexed("relation", i));
      if (!(bindings_.skip_private_relation_types && core::is_private_type(relation.type))) {
        check_value(bindings_.relation_type, relation.type, location, "relation type");
      }
      check_traits(relation.traits, location);
    }
  }

  void check_grammatical_info(const std::optional<model::GrammaticalInfo>& info,
                              const std::string& parent) {
    if (!info.has_value()) {
      return;
    }
    const std::string location = join(parent, "grammatical-info");
    if (!info->value.empty()) {
      check_value(bindings_.grammatical_info, info->value, location, "grammatical-info value");
    }
    check_traits(info->traits, location);
  }

  void check_traits(const std::vector<model::Trait>& traits, const std::string& location) {
    for (const auto& trait : traits) {
      auto binding = bindings_.traits.find(trait.name);
      if (binding == bindings_.traits.end() || trait.value.empty()) {
        continue;
      }
      check_value(binding->second, trait.value, location, "trait '" + trait.name + "'");
    }
  }

  void check_value(const std::string& range_id, const std::string& value,
                   const std::string& location, const std::string& what) {
    if (range_id.empty() || !registry_.has_range(range_id) ||
        registry_.contains(range_id, value)) {
      return;
    }
    RangeWarning warning;
    warning.entry_id = entry_id_;
    warning.location = location;
    warning.range_id = range_id;
    warning.value = value;
    warning.message = what + " '" + value + "' is not defined in range '" + range_id + "'";
    out_.push_back(std::move(warning));
  }

  const ranges::RangeRegistry& registry_;
  const RangeBindings& bindings_;
  const std::string& entry_id_;
  std::vector<RangeWarning>& out_;
};

}  // namespace

std::string_view to_string(RangeWarningKind kind) {
  switch (kind) {
    case RangeWarningKind::kRangeReferenceUnresolved:
      return "RangeReferenceUnresolved";
  }
  return "Unknown";
}

RangeValidator::RangeValidator(const ranges::RangeRegistry& registry, RangeBindings bindings)
    : registry_(registry), bindings_(std::move(bindings)) {}

std::vector<RangeWarning> RangeValidator::validate(const model::Document& document) const {
  std::vector<RangeWarning> warnings;
  for (const auto& entry : document.entries) {
    EntryChecker checker(registry_, bindings_, entry.id, warnings);
    checker.check_entry(entry);
  }
  return warnings;
}

std::vector<RangeWarning> RangeValidator::validate_entry(const model::Entry& entry) const {
  std::vector<RangeWarning> warnings;
  EntryChecker checker(registry_, bindings_, entry.id, warnings);
  checker.check_entry(entry);
  return warnings;
}

}  // namespace liftkit::validation
