#pragma once

#include "liftkit/model/extension.h"
#include "liftkit/model/multitext.h"

#include <optional>
#include <string>
#include <vector>

namespace liftkit::model {

// Entities of a LIFT lexicon. All of these are plain structs (C++ Core
// Guidelines C.2): members vary independently and equality is member-wise.
// Collections keep document order; generation re-emits them in that order.

// GrammaticalInfo is <grammatical-info value="">. Its traits are scoped to the
// part of speech and are distinct from the owner's own traits.
struct GrammaticalInfo {
  std::string value;
  std::vector<Trait> traits;

  bool operator==(const GrammaticalInfo&) const = default;
};

// Relation is a typed cross-reference to another entry or sense. The target
// (ref) may be unresolved; it is round-tripped unchanged. Traits belong to
// the relation for every relation type, standard or "_"-prefixed.
struct Relation {
  std::string type;
  std::string ref;
  std::optional<int> order;
  std::vector<Trait> traits;
  std::vector<Field> fields;
  std::vector<PreservedElement> extensions;
  std::vector<PreservedAttribute> extra_attributes;

  bool operator==(const Relation&) const = default;
};

struct Media {
  std::string href;
  Multitext label;

  bool operator==(const Media&) const = default;
};

// Pronunciation carries its extension data (cv-pattern, tone, ...) as typed
// fields rather than dedicated members.
struct Pronunciation {
  Multitext form;
  std::vector<Media> media;
  std::vector<Field> fields;
  std::vector<Trait> traits;
  std::vector<PreservedElement> extensions;
  std::vector<PreservedAttribute> extra_attributes;

  bool operator==(const Pronunciation&) const = default;
};

// Variant is a direct allomorph embedded in its entry (<variant> with inline
// forms). Cross-entry variants are Relations and are never stored here.
struct Variant {
  std::optional<std::string> ref;
  Multitext form;
  std::vector<Trait> traits;
  std::optional<GrammaticalInfo> grammatical_info;
  std::vector<Pronunciation> pronunciations;
  std::vector<Field> fields;
  std::vector<PreservedElement> extensions;
  std::vector<PreservedAttribute> extra_attributes;

  bool operator==(const Variant&) const = default;
};

struct Note {
  std::optional<std::string> type;
  Multitext content;

  bool operator==(const Note&) const = default;
};

struct Translation {
  std::optional<std::string> type;
  Multitext form;

  bool operator==(const Translation&) const = default;
};

struct Example {
  std::optional<std::string> source;
  Multitext form;
  std::vector<Translation> translations;
  std::vector<Note> notes;
  std::vector<Field> fields;
  std::vector<Trait> traits;
  std::vector<PreservedElement> extensions;
  std::vector<PreservedAttribute> extra_attributes;

  bool operator==(const Example&) const = default;
};

struct Etymology {
  std::string type;
  std::string source;
  Multitext form;
  Multitext gloss;
  std::vector<Field> fields;
  std::vector<Trait> traits;
  std::vector<PreservedElement> extensions;
  std::vector<PreservedAttribute> extra_attributes;

  bool operator==(const Etymology&) const = default;
};

struct Annotation {
  std::string name;
  std::optional<std::string> value;
  std::optional<std::string> who;
  std::optional<std::string> when;
  Multitext content;

  bool operator==(const Annotation&) const = default;
};

// Sense is exclusively owned by its Entry (or by a parent Sense, as a
// subsense). An absent id stays absent: the codec never synthesizes one.
struct Sense {
  std::optional<std::string> id;
  std::optional<int> order;
  std::optional<GrammaticalInfo> grammatical_info;
  Multitext gloss;
  Multitext definition;
  std::vector<Relation> relations;
  std::vector<Example> examples;
  std::vector<Note> notes;
  std::vector<Field> fields;
  std::vector<Trait> traits;
  std::vector<Annotation> annotations;
  std::vector<Sense> subsenses;
  std::vector<PreservedElement> extensions;
  std::vector<PreservedAttribute> extra_attributes;

  bool operator==(const Sense&) const = default;
};

// Entry is the aggregate root of a lexicon record. id is required, unique
// within a document, and is the join key for Relation::ref.
struct Entry {
  std::string id;
  std::optional<std::string> guid;
  std::optional<int> order;  // Homograph number
  std::optional<std::string> date_created;
  std::optional<std::string> date_modified;
  std::optional<std::string> date_deleted;

  Multitext lexical_unit;
  Multitext citation_form;
  std::vector<Pronunciation> pronunciations;
  std::optional<GrammaticalInfo> grammatical_info;
  std::vector<Sense> senses;
  std::vector<Variant> variants;
  std::vector<Relation> relations;
  std::vector<Etymology> etymologies;
  std::vector<Field> fields;
  std::vector<Note> notes;
  std::vector<Trait> traits;
  std::vector<Annotation> annotations;
  std::vector<PreservedElement> extensions;
  std::vector<PreservedAttribute> extra_attributes;

  bool operator==(const Entry&) const = default;
};

}  // namespace liftkit::model
