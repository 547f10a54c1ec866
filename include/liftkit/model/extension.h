#pragma once

#include "liftkit/model/multitext.h"

#include <string>
#include <string_view>
#include <vector>

namespace liftkit::model {

// Trait is the open name/value annotation of LIFT (<trait name="" value=""/>).
// Unknown names are kept verbatim; a parent may carry the same name more than once.
struct Trait {
  std::string name;
  std::string value;

  bool operator==(const Trait&) const = default;
};

// Field is the open, multilingual extension value of LIFT (<field type="">).
struct Field {
  std::string type;
  Multitext content;
  std::vector<Trait> traits;

  bool operator==(const Field&) const = default;
};

// PreservedElement holds an element the model does not understand, captured as
// serialized XML so that a lossless parse can re-emit it unchanged.
struct PreservedElement {
  std::string name;  // Local element name, e.g. "illustration"
  std::string xml;   // Outer XML with LIFT namespace prefixes removed

  bool operator==(const PreservedElement&) const = default;
};

// PreservedAttribute is an attribute of a modeled element that the model has no
// member for (dateCreated on a <sense>, a producer's private attribute).
struct PreservedAttribute {
  std::string name;  // As written, with a LIFT prefix removed
  std::string value;

  bool operator==(const PreservedAttribute&) const = default;
};

// find_trait returns the first trait with the given name, or nullptr.
[[nodiscard]] const Trait* find_trait(const std::vector<Trait>& traits, std::string_view name);

// trait_values returns every value recorded under name, in document order.
[[nodiscard]] std::vector<std::string> trait_values(const std::vector<Trait>& traits,
                                                    std::string_view name);

// find_field returns the first field with the given type, or nullptr.
[[nodiscard]] const Field* find_field(const std::vector<Field>& fields, std::string_view type);

}  // namespace liftkit::model
