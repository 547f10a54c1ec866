#pragma once

#include "liftkit/core/clock.h"
#include "liftkit/core/id_generator.h"
#include "liftkit/model/document.h"
#include "liftkit/model/entry.h"

#include <cstddef>
#include <string>
#include <string_view>

namespace liftkit::model {

// Host-side editing helpers. None of these perform I/O; ids and timestamps come
// from injected collaborators so the results are reproducible in tests.

// find_sense searches senses and subsenses depth-first.
[[nodiscard]] const Sense* find_sense(const Entry& entry, std::string_view sense_id);
[[nodiscard]] Sense* find_sense(Entry& entry, std::string_view sense_id);

// remove_sense deletes the sense (or subsense) with the given id.
// Returns false when no such sense exists.
bool remove_sense(Entry& entry, std::string_view sense_id);

// headword returns the lexical-unit form for preferred_lang, falling back to
// "en" and then to the first form. Empty when the entry has no lexical unit.
[[nodiscard]] std::string headword(const Entry& entry, std::string_view preferred_lang = "en");

// IdAssignment selects which constructs assign_missing_ids fills in.
struct IdAssignment {
  bool entries{true};
  bool senses{false};  // Absent sense ids are legal LIFT; opt in explicitly
};

// assign_missing_ids gives every entry (and optionally every sense) with an
// empty id a fresh one from id_gen. Generated entry ids that are already used
// in the document are skipped. Returns the number of ids assigned.
std::size_t assign_missing_ids(Document& document, core::IIdGenerator& id_gen,
                               const IdAssignment& scope = {});

// mark_modified stamps dateModified, and dateCreated when it is still absent.
void mark_modified(Entry& entry, core::IClock& clock);

}  // namespace liftkit::model
