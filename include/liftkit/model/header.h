#pragma once

#include "liftkit/model/extension.h"
#include "liftkit/model/multitext.h"

#include <optional>
#include <string>
#include <vector>

namespace liftkit::model {

// RangeRef is a <range id="" href=""/> child of the header's <ranges> block.
// It points at range content; it is not the content itself.
struct RangeRef {
  std::string id;
  std::string href;

  bool operator==(const RangeRef&) const = default;
};

// FieldDeclaration declares a custom field type (<fields><field tag="">).
// The declaration's forms describe the field and are its metadata.
struct FieldDeclaration {
  std::string type;
  Multitext description;
  std::vector<PreservedElement> extensions;

  bool operator==(const FieldDeclaration&) const = default;
};

// Header is file-scoped metadata. It belongs to the Document, not to any Entry,
// and is regenerated independently of entry edits.
struct Header {
  Multitext description;
  std::optional<std::string> ranges_href;
  std::vector<RangeRef> range_refs;
  std::vector<FieldDeclaration> field_declarations;
  std::vector<PreservedElement> extensions;  // Unmodeled <header> children

  [[nodiscard]] bool empty() const {
    return description.empty() && !ranges_href.has_value() && range_refs.empty() &&
           field_declarations.empty() && extensions.empty();
  }

  bool operator==(const Header&) const = default;
};

}  // namespace liftkit::model
