#pragma once

#include "liftkit/model/document.h"

#include <string>
#include <string_view>
#include <vector>

namespace liftkit::query {

// Read-only queries over a parsed lexicon. Results are sorted and distinct so
// they can populate host pick lists directly.

// language_codes lists every language tag used by any multitext in the
// document, header included.
[[nodiscard]] std::vector<std::string> language_codes(const model::Document& document);

enum class TraitScope {
  kRelations,  // Traits on <relation> elements only
  kAll,        // Traits anywhere (entries, senses, variants, relations, ...)
};

// trait_values collects the non-blank values recorded under trait_name.
[[nodiscard]] std::vector<std::string> trait_values(const model::Document& document,
                                                    std::string_view trait_name,
                                                    TraitScope scope = TraitScope::kAll);

// variant_type_values merges "variant-type" traits on relations and direct
// variants with the "type" traits older files put on <variant>.
[[nodiscard]] std::vector<std::string> variant_type_values(const model::Document& document);

// relation_types lists the relation types in use.
[[nodiscard]] std::vector<std::string> relation_types(const model::Document& document);

// DanglingRelation is a relation whose ref names neither an entry nor a sense
// of the document. LIFT allows these; they are reported, never removed.
struct DanglingRelation {
  std::string entry_id;
  std::string type;
  std::string ref;
};

[[nodiscard]] std::vector<DanglingRelation> dangling_relations(const model::Document& document);

}  // namespace liftkit::query
