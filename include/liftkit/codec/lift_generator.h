#pragma once

#include "liftkit/codec/generate_result.h"
#include "liftkit/core/version.h"
#include "liftkit/model/document.h"
#include "liftkit/model/entry.h"

#include <string>

namespace liftkit::codec {

// LIFT version written on the <lift> root.
constexpr const char* kLiftVersion = "0.13";

enum class NamespaceStyle {
  kDefaultNamespace,  // <lift xmlns="..."><entry>
  kPrefixed,          // <lift:lift xmlns:lift="..."><lift:entry>
};

struct GenerateOptions {
  NamespaceStyle ns_style{NamespaceStyle::kDefaultNamespace};
  bool indent{true};
  std::string producer{core::kProducerName};
};

// LiftGenerator renders the model as LIFT 0.13 XML.
//
// Output is deterministic: element order is fixed per element kind, repeated
// elements keep the order of the model, and empty multitexts or collections
// produce no wrapper elements. Parsing the output yields a model equal to the
// input.
class LiftGenerator {
 public:
  explicit LiftGenerator(GenerateOptions options = {});

  // generate renders a complete document with XML declaration and <lift> root.
  [[nodiscard]] GenerateResult generate(const model::Document& document) const;

  // generate_entry renders a single <entry> element (no declaration), the shape
  // an XML store keeps per record.
  [[nodiscard]] GenerateResult generate_entry(const model::Entry& entry) const;

  [[nodiscard]] const GenerateOptions& options() const { return options_; }

 private:
  GenerateOptions options_;
};

}  // namespace liftkit::codec
