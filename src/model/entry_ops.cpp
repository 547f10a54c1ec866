#include "liftkit/model/entry_ops.h"

#include <algorithm>
#include <functional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace liftkit::model {

namespace {

// find_in serves both find_sense overloads; Senses is std::vector<Sense> with or
// without const.
template <typename Senses>
auto find_in(Senses& senses, std::string_view sense_id) -> decltype(&senses.front()) {
  for (auto& sense : senses) {
    if (sense.id.has_value() && *sense.id == sense_id) {
      return &sense;
    }
    if (auto* nested = find_in(sense.subsenses, sense_id)) {
      return nested;
    }
  }
  return nullptr;
}

bool remove_in(std::vector<Sense>& senses, std::string_view sense_id) {
  auto it = std::find_if(senses.begin(), senses.end(), [sense_id](const Sense& sense) {
    return sense.id.has_value() && *sense.id == sense_id;
  });
  if (it != senses.end()) {
    senses.erase(it);
    return true;
  }
  return std::any_of(senses.begin(), senses.end(),
                     [sense_id](Sense& sense) { return remove_in(sense.subsenses, sense_id); });
}

std::size_t assign_sense_ids(std::vector<Sense>& senses, core::IIdGenerator& id_gen) {
  std::size_t assigned = 0;
  for (auto& sense : senses) {
    if (!sense.id.has_value() || sense.id->empty()) {
      sense.id = id_gen.next("sense");
      ++assigned;
    }
    assigned += assign_sense_ids(sense.subsenses, id_gen);
  }
  return assigned;
}

}  // namespace

const Sense* find_sense(const Entry& entry, std::string_view sense_id) {
  return find_in(entry.senses, sense_id);
}

Sense* find_sense(Entry& entry, std::string_view sense_id) {
  return find_in(entry.senses, sense_id);
}

bool remove_sense(Entry& entry, std::string_view sense_id) {
  return remove_in(entry.senses, sense_id);
}

std::string headword(const Entry& entry, std::string_view preferred_lang) {
  if (const std::string* text = entry.lexical_unit.find(preferred_lang)) {
    return *text;
  }
  if (const std::string* text = entry.lexical_unit.find("en")) {
    return *text;
  }
  if (!entry.lexical_unit.empty()) {
    return entry.lexical_unit.forms().front().second;
  }
  return {};
}

std::size_t assign_missing_ids(Document& document, core::IIdGenerator& id_gen,
                               const IdAssignment& scope) {
  std::set<std::string, std::less<>> used;
  for (const auto& entry : document.entries) {
    if (!entry.id.empty()) {
      used.insert(entry.id);
    }
  }

  std::size_t assigned = 0;
  for (auto& entry : document.entries) {
    if (scope.entries && entry.id.empty()) {
      // Entry ids are relation targets and must stay unique within the document.
      std::string id = id_gen.next("entry");
      while (used.count(id) != 0) {
        id = id_gen.next("entry");
      }
      used.insert(id);
      entry.id = std::move(id);
      ++assigned;
    }
    if (scope.senses) {
      assigned += assign_sense_ids(entry.senses, id_gen);
    }
  }
  return assigned;
}

void mark_modified(Entry& entry, core::IClock& clock) {
  const std::string now = clock.timestamp();
  if (!entry.date_created.has_value()) {
    entry.date_created = now;
  }
  entry.date_modified = now;
}

}  // namespace liftkit::model
