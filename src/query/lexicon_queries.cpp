#include "liftkit/query/lexicon_queries.h"

#include "liftkit/core/normalization.h"

#include <functional>
#include <optional>
#include <set>

namespace liftkit::query {

namespace {

using TraitVisitor = std::function<void(const model::Trait&, bool in_relation)>;
using TextVisitor = std::function<void(const model::Multitext&)>;

std::vector<std::string> to_vector(const std::set<std::string>& values) {
  return {values.begin(), values.end()};
}

void visit_fields(const std::vector<model::Field>& fields, const TextVisitor& on_text,
                  const TraitVisitor& on_trait) {
  for (const auto& field : fields) {
    on_text(field.content);
    for (const auto& trait : field.traits) {
      on_trait(trait, false);
    }
  }
}

void visit_traits(const std::vector<model::Trait>& traits, const TraitVisitor& on_trait,
                  bool in_relation = false) {
  for (const auto& trait : traits) {
    on_trait(trait, in_relation);
  }
}

void visit_grammatical_info(const std::optional<model::GrammaticalInfo>& info,
                            const TraitVisitor& on_trait) {
  if (info.has_value()) {
    visit_traits(info->traits, on_trait);
  }
}

void visit_relations(const std::vector<model::Relation>& relations, const TextVisitor& on_text,
                     const TraitVisitor& on_trait) {
  for (const auto& relation : relations) {
    visit_traits(relation.traits, on_trait, true);
    visit_fields(relation.fields, on_text, on_trait);
  }
}

void visit_notes(const std::vector<model::Note>& notes, const TextVisitor& on_text) {
  for (const auto& note : notes) {
    on_text(note.content);
  }
}

void visit_pronunciations(const std::vector<model::Pronunciation>& pronunciations,
                          const TextVisitor& on_text, const TraitVisitor& on_trait) {
  for (const auto& pronunciation : pronunciations) {
    on_text(pronunciation.form);
    for (const auto& media : pronunciation.media) {
      on_text(media.label);
    }
    visit_fields(pronunciation.fields, on_text, on_trait);
    visit_traits(pronunciation.traits, on_trait);
  }
}

void visit_sense(const model::Sense& sense, const TextVisitor& on_text,
                 const TraitVisitor& on_trait) {
  visit_grammatical_info(sense.grammatical_info, on_trait);
  on_text(sense.gloss);
  on_text(sense.definition);
  visit_relations(sense.relations, on_text, on_trait);
  for (const auto& example : sense.examples) {
    on_text(example.form);
    for (const auto& translation : example.translations) {
      on_text(translation.form);
    }
    visit_notes(example.notes, on_text);
    visit_fields(example.fields, on_text, on_trait);
    visit_traits(example.traits, on_trait);
  }
  visit_notes(sense.notes, on_text);
  visit_fields(sense.fields, on_text, on_trait);
  visit_traits(sense.traits, on_trait);
  for (const auto& annotation : sense.annotations) {
    on_text(annotation.content);
  }
  for (const auto& subsense : sense.subsenses) {
    visit_sense(subsense, on_text, on_trait);
  }
}

// visit_entry walks every multitext and trait of entry in document order.
void visit_entry(const model::Entry& entry, const TextVisitor& on_text,
                 const TraitVisitor& on_trait) {
  on_text(entry.lexical_unit);
  on_text(entry.citation_form);
  visit_pronunciations(entry.pronunciations, on_text, on_trait);
  visit_grammatical_info(entry.grammatical_info, on_trait);
  for (const auto& sense : entry.senses) {
    visit_sense(sense, on_text, on_trait);
  }
  for (const auto& variant : entry.variants) {
    on_text(variant.form);
    visit_traits(variant.traits, on_trait);
    visit_grammatical_info(variant.grammatical_info, on_trait);
    visit_pronunciations(variant.pronunciations, on_text, on_trait);
    visit_fields(variant.fields, on_text, on_trait);
  }
  visit_relations(entry.relations, on_text, on_trait);
  for (const auto& etymology : entry.etymologies) {
    on_text(etymology.form);
    on_text(etymology.gloss);
    visit_fields(etymology.fields, on_text, on_trait);
    visit_traits(etymology.traits, on_trait);
  }
  visit_fields(entry.fields, on_text, on_trait);
  visit_notes(entry.notes, on_text);
  visit_traits(entry.traits, on_trait);
  for (const auto& annotation : entry.annotations) {
    on_text(annotation.content);
  }
}

void insert_value(std::set<std::string>& values, std::string_view value) {
  std::string trimmed = core::trim(value);
  if (!trimmed.empty()) {
    values.insert(std::move(trimmed));
  }
}

void collect_sense_ids(const std::vector<model::Sense>& senses, std::set<std::string>& ids) {
  for (const auto& sense : senses) {
    if (sense.id.has_value()) {
      ids.insert(*sense.id);
    }
    collect_sense_ids(sense.subsenses, ids);
  }
}

void collect_sense_relations(const std::vector<model::Sense>& senses,
                             std::vector<const model::Relation*>& out) {
  for (const auto& sense : senses) {
    for (const auto& relation : sense.relations) {
      out.push_back(&relation);
    }
    collect_sense_relations(sense.subsenses, out);
  }
}

}  // namespace

std::vector<std::string> language_codes(const model::Document& document) {
  std::set<std::string> codes;
  const TextVisitor on_text = [&codes](const model::Multitext& text) {
    for (const auto& [lang, value] : text) {
      codes.insert(lang);
    }
  };
  const TraitVisitor ignore_traits = [](const model::Trait&, bool) {};

  on_text(document.header.description);
  for (const auto& declaration : document.header.field_declarations) {
    on_text(declaration.description);
  }
  for (const auto& entry : document.entries) {
    visit_entry(entry, on_text, ignore_traits);
  }
  return to_vector(codes);
}

std::vector<std::string> trait_values(const model::Document& document,
                                      std::string_view trait_name, TraitScope scope) {
  std::set<std::string> values;
  const TextVisitor ignore_text = [](const model::Multitext&) {};
  const TraitVisitor on_trait = [&](const model::Trait& trait, bool in_relation) {
    if (trait.name != trait_name) {
      return;
    }
    if (scope == TraitScope::kRelations && !in_relation) {
      return;
    }
    insert_value(values, trait.value);
  };

  for (const auto& entry : document.entries) {
    visit_entry(entry, ignore_text, on_trait);
  }
  return to_vector(values);
}

std::vector<std::string> variant_type_values(const model::Document& document) {
  std::set<std::string> values;
  for (const auto& value : trait_values(document, "variant-type", TraitScope::kRelations)) {
    values.insert(value);
  }
  for (const auto& entry : document.entries) {
    for (const auto& variant : entry.variants) {
      for (const auto& trait : variant.traits) {
        if (trait.name == "variant-type" || trait.name == "type") {
          insert_value(values, trait.value);
        }
      }
    }
  }
  return to_vector(values);
}

std::vector<std::string> relation_types(const model::Document& document) {
  std::set<std::string> types;
  for (const auto& entry : document.entries) {
    for (const auto& relation : entry.relations) {
      insert_value(types, relation.type);
    }
    std::vector<const model::Relation*> sense_relations;
    collect_sense_relations(entry.senses, sense_relations);
    for (const model::Relation* relation : sense_relations) {
      insert_value(types, relation->type);
    }
  }
  return to_vector(types);
}

std::vector<DanglingRelation> dangling_relations(const model::Document& document) {
  std::set<std::string> known;
  for (const auto& entry : document.entries) {
    known.insert(entry.id);
    collect_sense_ids(entry.senses, known);
  }

  std::vector<DanglingRelation> dangling;
  for (const auto& entry : document.entries) {
    std::vector<const model::Relation*> relations;
    for (const auto& relation : entry.relations) {
      relations.push_back(&relation);
    }
    collect_sense_relations(entry.senses, relations);
    for (const model::Relation* relation : relations) {
      if (!relation->ref.empty() && known.count(relation->ref) == 0) {
        dangling.push_back({entry.id, relation->type, relation->ref});
      }
    }
  }
  return dangling;
}

}  // namespace liftkit::query
