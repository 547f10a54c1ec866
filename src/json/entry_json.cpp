#include "liftkit/json/entry_json.h"

#include "liftkit/core/normalization.h"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace liftkit::json {

namespace {

using nlohmann::json;

// --- Serialization helpers ---

void put_text(json& j, const char* key, const model::Multitext& text) {
  if (!text.empty()) {
    j[key] = multitext_to_json(text);
  }
}

template <typename T>
void put_optional(json& j, const char* key, const std::optional<T>& value) {
  if (value.has_value()) {
    j[key] = *value;
  }
}

template <typename T, typename Fn>
void put_list(json& j, const char* key, const std::vector<T>& items, Fn to_json) {
  if (items.empty()) {
    return;
  }
  json array = json::array();
  for (const auto& item : items) {
    array.push_back(to_json(item));
  }
  j[key] = std::move(array);
}

json trait_to_json(const model::Trait& trait) {
  return json{{"name", trait.name}, {"value", trait.value}};
}

json field_to_json(const model::Field& field) {
  json j;
  j["type"] = field.type;
  put_text(j, "content", field.content);
  put_list(j, "traits", field.traits, trait_to_json);
  return j;
}

json extension_to_json(const model::PreservedElement& element) {
  return json{{"name", element.name}, {"xml", element.xml}};
}

json extra_attribute_to_json(const model::PreservedAttribute& attribute) {
  return json{{"name", attribute.name}, {"value", attribute.value}};
}

json grammatical_info_to_json(const model::GrammaticalInfo& info) {
  json j;
  j["value"] = info.value;
  put_list(j, "traits", info.traits, trait_to_json);
  return j;
}

void put_grammatical_info(json& j, const std::optional<model::GrammaticalInfo>& info) {
  if (info.has_value()) {
    j["grammatical_info"] = grammatical_info_to_json(*info);
  }
}

json relation_to_json(const model::Relation& relation) {
  json j;
  j["type"] = relation.type;
  j["ref"] = relation.ref;
  put_optional(j, "order", relation.order);
  put_list(j, "traits", relation.traits, trait_to_json);
  put_list(j, "fields", relation.fields, field_to_json);
  put_list(j, "extensions", relation.extensions, extension_to_json);
  put_list(j, "extra_attributes", relation.extra_attributes, extra_attribute_to_json);
  return j;
}

json pronunciation_to_json(const model::Pronunciation& pronunciation) {
  json j;
  put_text(j, "form", pronunciation.form);
  put_list(j, "media", pronunciation.media, [](const model::Media& media) {
    json m;
    m["href"] = media.href;
    put_text(m, "label", media.label);
    return m;
  });
  put_list(j, "fields", pronunciation.fields, field_to_json);
  put_list(j, "traits", pronunciation.traits, trait_to_json);
  put_list(j, "extensions", pronunciation.extensions, extension_to_json);
  put_list(j, "extra_attributes", pronunciation.extra_attributes, extra_attribute_to_json);
  return j;
}

json note_to_json(const model::Note& note) {
  json j;
  put_optional(j, "type", note.type);
  put_text(j, "content", note.content);
  return j;
}

json annotation_to_json(const model::Annotation& annotation) {
  json j;
  j["name"] = annotation.name;
  put_optional(j, "value", annotation.value);
  put_optional(j, "who", annotation.who);
  put_optional(j, "when", annotation.when);
  put_text(j, "content", annotation.content);
  return j;
}

json example_to_json(const model::Example& example) {
  json j;
  put_optional(j, "source", example.source);
  put_text(j, "form", example.form);
  put_list(j, "translations", example.translations, [](const model::Translation& translation) {
    json t;
    put_optional(t, "type", translation.type);
    put_text(t, "form", translation.form);
    return t;
  });
  put_list(j, "notes", example.notes, note_to_json);
  put_list(j, "fields", example.fields, field_to_json);
  put_list(j, "traits", example.traits, trait_to_json);
  put_list(j, "extensions", example.extensions, extension_to_json);
  put_list(j, "extra_attributes", example.extra_attributes, extra_attribute_to_json);
  return j;
}

json variant_to_json(const model::Variant& variant) {
  json j;
  put_optional(j, "ref", variant.ref);
  put_text(j, "form", variant.form);
  put_list(j, "traits", variant.traits, trait_to_json);
  put_grammatical_info(j, variant.grammatical_info);
  put_list(j, "pronunciations", variant.pronunciations, pronunciation_to_json);
  put_list(j, "fields", variant.fields, field_to_json);
  put_list(j, "extensions", variant.extensions, extension_to_json);
  put_list(j, "extra_attributes", variant.extra_attributes, extra_attribute_to_json);
  return j;
}

json etymology_to_json(const model::Etymology& etymology) {
  json j;
  j["type"] = etymology.type;
  j["source"] = etymology.source;
  put_text(j, "form", etymology.form);
  put_text(j, "gloss", etymology.gloss);
  put_list(j, "fields", etymology.fields, field_to_json);
  put_list(j, "traits", etymology.traits, trait_to_json);
  put_list(j, "extensions", etymology.extensions, extension_to_json);
  put_list(j, "extra_attributes", etymology.extra_attributes, extra_attribute_to_json);
  return j;
}

json sense_to_json(const model::Sense& sense) {
  json j;
  put_optional(j, "id", sense.id);
  put_optional(j, "order", sense.order);
  put_grammatical_info(j, sense.grammatical_info);
  put_text(j, "gloss", sense.gloss);
  put_text(j, "definition", sense.definition);
  put_list(j, "relations", sense.relations, relation_to_json);
  put_list(j, "examples", sense.examples, example_to_json);
  put_list(j, "notes", sense.notes, note_to_json);
  put_list(j, "fields", sense.fields, field_to_json);
  put_list(j, "traits", sense.traits, trait_to_json);
  put_list(j, "annotations", sense.annotations, annotation_to_json);
  put_list(j, "subsenses", sense.subsenses, sense_to_json);
  put_list(j, "extensions", sense.extensions, extension_to_json);
  put_list(j, "extra_attributes", sense.extra_attributes, extra_attribute_to_json);
  return j;
}

// --- Deserialization helpers ---
// A shape error carries the JSON pointer of the offending value relative to the
// object being read. Each nesting level prefixes its own key or index on the
// way out, and entry_from_json turns the result into a JsonError.

class ShapeError : public std::invalid_argument {
 public:
  ShapeError(std::string pointer, const std::string& message)
      : std::invalid_argument(message), pointer_(std::move(pointer)) {}

  [[nodiscard]] const std::string& pointer() const { return pointer_; }

 private:
  std::string pointer_;
};

// escape_token applies RFC 6901 escaping ("~" -> "~0", "/" -> "~1").
std::string escape_token(std::string_view token) {
  std::string escaped;
  escaped.reserve(token.size());
  for (const char c : token) {
    if (c == '~') {
      escaped += "~0";
    } else if (c == '/') {
      escaped += "~1";
    } else {
      escaped += c;
    }
  }
  return escaped;
}

// within runs read for the member or element named token.
template <typename Fn>
auto within(std::string_view token, Fn read) -> decltype(read()) {
  try {
    return read();
  } catch (const ShapeError& e) {
    throw ShapeError("/" + escape_token(token) + e.pointer(), e.what());
  } catch (const nlohmann::json::exception& e) {
    throw ShapeError("/" + escape_token(token), e.what());
  }
}

const json& expect_object(const json& j, const std::string& what) {
  if (!j.is_object()) {
    throw ShapeError("", what + " must be a JSON object");
  }
  return j;
}

std::string string_at(const json& j, const char* key) {
  return within(key, [&] { return j.at(key).get<std::string>(); });
}

std::string string_or_empty(const json& j, const char* key) {
  return within(key, [&] { return j.value(key, std::string{}); });
}

model::Multitext text_from(const json& j, const char* key) {
  model::Multitext text;
  if (!j.contains(key)) {
    return text;
  }
  within(key, [&] {
    for (const auto& item : expect_object(j.at(key), key).items()) {
      text.set(item.key(), within(item.key(), [&] { return item.value().get<std::string>(); }));
    }
    return 0;
  });
  return text;
}

template <typename T>
std::optional<T> optional_from(const json& j, const char* key) {
  if (!j.contains(key) || j.at(key).is_null()) {
    return std::nullopt;
  }
  return within(key, [&] { return j.at(key).get<T>(); });
}

template <typename Fn>
auto list_from(const json& j, const char* key, Fn from_json)
    -> std::vector<decltype(from_json(j))> {
  std::vector<decltype(from_json(j))> items;
  if (!j.contains(key)) {
    return items;
  }
  within(key, [&] {
    const json& array = j.at(key);
    if (!array.is_array()) {
      throw ShapeError("", std::string{key} + " must be a JSON array");
    }
    for (std::size_t i = 0; i < array.size(); ++i) {
      items.push_back(
          within(std::to_string(i), [&] { return from_json(expect_object(array[i], key)); }));
    }
    return 0;
  });
  return items;
}

model::Trait trait_from(const json& j) {
  return model::Trait{string_at(j, "name"), string_or_empty(j, "value")};
}

model::Field field_from(const json& j) {
  model::Field field;
  field.type = string_at(j, "type");
  field.content = text_from(j, "content");
  field.traits = list_from(j, "traits", trait_from);
  return field;
}

model::PreservedElement extension_from(const json& j) {
  return model::PreservedElement{string_at(j, "name"), string_at(j, "xml")};
}

model::PreservedAttribute extra_attribute_from(const json& j) {
  return model::PreservedAttribute{string_at(j, "name"), string_or_empty(j, "value")};
}

std::optional<model::GrammaticalInfo> grammatical_info_from(const json& j) {
  if (!j.contains("grammatical_info")) {
    return std::nullopt;
  }
  return within("grammatical_info", [&] {
    const json& g = expect_object(j.at("grammatical_info"), "grammatical_info");
    model::GrammaticalInfo info;
    info.value = string_or_empty(g, "value");
    info.traits = list_from(g, "traits", trait_from);
    return info;
  });
}

model::Relation relation_from(const json& j) {
  model::Relation relation;
  relation.type = string_at(j, "type");
  relation.ref = string_at(j, "ref");
  relation.order = optional_from<int>(j, "order");
  relation.traits = list_from(j, "traits", trait_from);
  relation.fields = list_from(j, "fields", field_from);
  relation.extensions = list_from(j, "extensions", extension_from);
  relation.extra_attributes = list_from(j, "extra_attributes", extra_attribute_from);
  return relation;
}

model::Pronunciation pronunciation_from(const json& j) {
  model::Pronunciation pronunciation;
  pronunciation.form = text_from(j, "form");
  pronunciation.media = list_from(j, "media", [](const json& m) {
    return model::Media{string_or_empty(m, "href"), text_from(m, "label")};
  });
  pronunciation.fields = list_from(j, "fields", field_from);
  pronunciation.traits = list_from(j, "traits", trait_from);
  pronunciation.extensions = list_from(j, "extensions", extension_from);
  pronunciation.extra_attributes = list_from(j, "extra_attributes", extra_attribute_from);
  return pronunciation;
}

model::Note note_from(const json& j) {
  return model::Note{optional_from<std::string>(j, "type"), text_from(j, "content")};
}

model::Annotation annotation_from(const json& j) {
  model::Annotation annotation;
  annotation.name = string_or_empty(j, "name");
  annotation.value = optional_from<std::string>(j, "value");
  annotation.who = optional_from<std::string>(j, "who");
  annotation.when = optional_from<std::string>(j, "when");
  annotation.content = text_from(j, "content");
  return annotation;
}

model::Example example_from(const json& j) {
  model::Example example;
  example.source = optional_from<std::string>(j, "source");
  example.form = text_from(j, "form");
  example.translations = list_from(j, "translations", [](const json& t) {
    return model::Translation{optional_from<std::string>(t, "type"), text_from(t, "form")};
  });
  example.notes = list_from(j, "notes", note_from);
  example.fields = list_from(j, "fields", field_from);
  example.traits = list_from(j, "traits", trait_from);
  example.extensions = list_from(j, "extensions", extension_from);
  example.extra_attributes = list_from(j, "extra_attributes", extra_attribute_from);
  return example;
}

model::Variant variant_from(const json& j) {
  model::Variant variant;
  variant.ref = optional_from<std::string>(j, "ref");
  variant.form = text_from(j, "form");
  variant.traits = list_from(j, "traits", trait_from);
  variant.grammatical_info = grammatical_info_from(j);
  variant.pronunciations = list_from(j, "pronunciations", pronunciation_from);
  variant.fields = list_from(j, "fields", field_from);
  variant.extensions = list_from(j, "extensions", extension_from);
  variant.extra_attributes = list_from(j, "extra_attributes", extra_attribute_from);
  return variant;
}

model::Etymology etymology_from(const json& j) {
  model::Etymology etymology;
  etymology.type = string_or_empty(j, "type");
  etymology.source = string_or_empty(j, "source");
  etymology.form = text_from(j, "form");
  etymology.gloss = text_from(j, "gloss");
  etymology.fields = list_from(j, "fields", field_from);
  etymology.traits = list_from(j, "traits", trait_from);
  etymology.extensions = list_from(j, "extensions", extension_from);
  etymology.extra_attributes = list_from(j, "extra_attributes", extra_attribute_from);
  return etymology;
}

model::Sense sense_from(const json& j) {
  model::Sense sense;
  sense.id = optional_from<std::string>(j, "id");
  sense.order = optional_from<int>(j, "order");
  sense.grammatical_info = grammatical_info_from(j);
  sense.gloss = text_from(j, "gloss");
  sense.definition = text_from(j, "definition");
  sense.relations = list_from(j, "relations", relation_from);
  sense.examples = list_from(j, "examples", example_from);
  sense.notes = list_from(j, "notes", note_from);
  sense.fields = list_from(j, "fields", field_from);
  sense.traits = list_from(j, "traits", trait_from);
  sense.annotations = list_from(j, "annotations", annotation_from);
  sense.subsenses = list_from(j, "subsenses", sense_from);
  sense.extensions = list_from(j, "extensions", extension_from);
  sense.extra_attributes = list_from(j, "extra_attributes", extra_attribute_from);
  return sense;
}

}  // namespace

nlohmann::json multitext_to_json(const model::Multitext& text) {
  json j = json::object();
  for (const auto& [lang, value] : text) {
    j[lang] = value;
  }
  return j;
}

nlohmann::json entry_to_json(const model::Entry& entry) {
  json j;
  j["id"] = entry.id;
  put_optional(j, "guid", entry.guid);
  put_optional(j, "order", entry.order);
  put_optional(j, "date_created", entry.date_created);
  put_optional(j, "date_modified", entry.date_modified);
  put_optional(j, "date_deleted", entry.date_deleted);

  put_text(j, "lexical_unit", entry.lexical_unit);
  put_text(j, "citation_form", entry.citation_form);
  put_list(j, "pronunciations", entry.pronunciations, pronunciation_to_json);
  put_grammatical_info(j, entry.grammatical_info);
  put_list(j, "senses", entry.senses, sense_to_json);
  put_list(j, "variants", entry.variants, variant_to_json);
  put_list(j, "relations", entry.relations, relation_to_json);
  put_list(j, "etymologies", entry.etymologies, etymology_to_json);
  put_list(j, "fields", entry.fields, field_to_json);
  put_list(j, "notes", entry.notes, note_to_json);
  put_list(j, "traits", entry.traits, trait_to_json);
  put_list(j, "annotations", entry.annotations, annotation_to_json);
  put_list(j, "extensions", entry.extensions, extension_to_json);
  put_list(j, "extra_attributes", entry.extra_attributes, extra_attribute_to_json);
  return j;
}

EntryJsonResult entry_from_json(const nlohmann::json& j) {
  if (!j.is_object()) {
    return EntryJsonResult::err({"", "entry must be a JSON object"});
  }
  if (!j.contains("id") || !j.at("id").is_string() ||
      core::is_blank(j.at("id").get<std::string>())) {
    return EntryJsonResult::err({"/id", "entry id is required"});
  }

  try {
    model::Entry entry;
    entry.id = j.at("id").get<std::string>();
    entry.guid = optional_from<std::string>(j, "guid");
    entry.order = optional_from<int>(j, "order");
    entry.date_created = optional_from<std::string>(j, "date_created");
    entry.date_modified = optional_from<std::string>(j, "date_modified");
    entry.date_deleted = optional_from<std::string>(j, "date_deleted");

    entry.lexical_unit = text_from(j, "lexical_unit");
    entry.citation_form = text_from(j, "citation_form");
    entry.pronunciations = list_from(j, "pronunciations", pronunciation_from);
    entry.grammatical_info = grammatical_info_from(j);
    entry.senses = list_from(j, "senses", sense_from);
    entry.variants = list_from(j, "variants", variant_from);
    entry.relations = list_from(j, "relations", relation_from);
    entry.etymologies = list_from(j, "etymologies", etymology_from);
    entry.fields = list_from(j, "fields", field_from);
    entry.notes = list_from(j, "notes", note_from);
    entry.traits = list_from(j, "traits", trait_from);
    entry.annotations = list_from(j, "annotations", annotation_from);
    entry.extensions = list_from(j, "extensions", extension_from);
    entry.extra_attributes = list_from(j, "extra_attributes", extra_attribute_from);
    return EntryJsonResult::ok(std::move(entry));
  } catch (const ShapeError& e) {
    return EntryJsonResult::err({e.pointer(), e.what()});
  } catch (const nlohmann::json::exception& e) {
    return EntryJsonResult::err({"", e.what()});
  }
}

nlohmann::json header_to_json(const model::Header& header) {
  json j = json::object();
  put_text(j, "description", header.description);
  put_optional(j, "ranges_href", header.ranges_href);
  put_list(j, "range_refs", header.range_refs, [](const model::RangeRef& ref) {
    return json{{"id", ref.id}, {"href", ref.href}};
  });
  put_list(j, "field_declarations", header.field_declarations,
           [](const model::FieldDeclaration& declaration) {
             json d;
             d["type"] = declaration.type;
             put_text(d, "description", declaration.description);
             put_list(d, "extensions", declaration.extensions, extension_to_json);
             return d;
           });
  put_list(j, "extensions", header.extensions, extension_to_json);
  return j;
}

nlohmann::json document_to_json(const model::Document& document) {
  json j;
  j["header"] = header_to_json(document.header);
  json entries = json::array();
  for (const auto& entry : document.entries) {
    entries.push_back(entry_to_json(entry));
  }
  j["entries"] = std::move(entries);
  return j;
}

}  // namespace liftkit::json
