#include "liftkit/codec/lift_generator.h"

#include "liftkit/codec/header_codec.h"
#include "liftkit/core/normalization.h"
#include "liftkit/xml/multitext_xml.h"
#include "liftkit/xml/node_lookup.h"

#include <pugixml.hpp>

#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace liftkit::codec {

namespace {

using xml::append_element;
using xml::set_attribute;

void set_optional_attribute(pugi::xml_node node, const char* name,
                            const std::optional<std::string>& value) {
  if (value.has_value()) {
    set_attribute(node, name, *value);
  }
}

void set_order_attribute(pugi::xml_node node, const std::optional<int>& order) {
  if (order.has_value()) {
    set_attribute(node, "order", std::to_string(*order));
  }
}

// declare_namespace binds the LIFT namespace on a generated root (document or fragment).
void declare_namespace(pugi::xml_node root, NamespaceStyle style) {
  set_attribute(root, "xmlns", xml::kLiftNamespace);
  if (style == NamespaceStyle::kPrefixed) {
    set_attribute(root, "xmlns:lift", xml::kLiftNamespace);
  }
}

// Attribute names a generated element cannot take from extra_attributes. The
// default and lift namespace bindings belong to the generator; other xmlns:*
// bindings travel with the foreign attributes that use them.
bool is_invalid_extra_name(std::string_view name) {
  return name.empty() || name == "xmlns" || name == "xmlns:lift" ||
         name.find_first_of(" \t\r\n<>&\"'=/") != std::string_view::npos;
}

std::string save(const pugi::xml_document& doc, bool indent) {
  const unsigned int flags =
      (indent ? pugi::format_indent : pugi::format_raw) | pugi::format_no_declaration;
  std::ostringstream out;
  doc.save(out, "  ", flags, pugi::encoding_utf8);
  return out.str();
}

// EntryWriter appends entries below a parent node. Element order per kind is
// fixed here; it must stay readable by the parser in any order.
class EntryWriter {
 public:
  explicit EntryWriter(const xml::ElementNamer& namer) : namer_(namer) {}

  [[nodiscard]] bool failed() const { return error_.has_value(); }
  [[nodiscard]] const GenerateError& error() const { return *error_; }

  pugi::xml_node write_entry(pugi::xml_node parent, const model::Entry& entry,
                             const std::string& path) {
    if (core::is_blank(entry.id)) {
      error_ = GenerateError{GenerateErrorKind::kMissingEntryId, path, "entry has no id"};
      return {};
    }
    path_ = path;

    pugi::xml_node node = append_element(parent, "entry", namer_);
    set_attribute(node, "id", entry.id);
    set_optional_attribute(node, "guid", entry.guid);
    set_order_attribute(node, entry.order);
    set_optional_attribute(node, "dateCreated", entry.date_created);
    set_optional_attribute(node, "dateModified", entry.date_modified);
    set_optional_attribute(node, "dateDeleted", entry.date_deleted);
    write_extra_attributes(node, entry.extra_attributes);

    xml::write_multitext_element(node, "lexical-unit", entry.lexical_unit, namer_);
    xml::write_multitext_element(node, "citation", entry.citation_form, namer_);
    for (const auto& pronunciation : entry.pronunciations) {
      write_pronunciation(node, pronunciation);
    }
    write_grammatical_info(node, entry.grammatical_info);
    for (const auto& sense : entry.senses) {
      write_sense(node, sense, "sense");
    }
    for (const auto& variant : entry.variants) {
      write_variant(node, variant);
    }
    write_relations(node, entry.relations);
    for (const auto& etymology : entry.etymologies) {
      write_etymology(node, etymology);
    }
    write_fields(node, entry.fields);
    write_notes(node, entry.notes);
    write_traits(node, entry.traits);
    write_annotations(node, entry.annotations);
    write_extensions(node, entry.extensions);
    return node;
  }

 private:
  void write_grammatical_info(pugi::xml_node parent,
                              const std::optional<model::GrammaticalInfo>& info) {
    if (!info.has_value()) {
      return;
    }
    pugi::xml_node node = append_element(parent, "grammatical-info", namer_);
    set_attribute(node, "value", info->value);
    write_traits(node, info->traits);
  }

  // LIFT writes one <gloss lang=""> per language, holding <text> directly.
  void write_glosses(pugi::xml_node parent, const model::Multitext& gloss) {
    for (const auto& [lang, text] : gloss) {
      pugi::xml_node node = append_element(parent, "gloss", namer_);
      set_attribute(node, "lang", lang);
      append_element(node, "text", namer_).append_child(pugi::node_pcdata).set_value(text.c_str());
    }
  }

  void write_sense(pugi::xml_node parent, const model::Sense& sense, std::string_view local) {
    pugi::xml_node node = append_element(parent, local, namer_);
    set_optional_attribute(node, "id", sense.id);
    set_order_attribute(node, sense.order);
    write_extra_attributes(node, sense.extra_attributes);

    write_grammatical_info(node, sense.grammatical_info);
    write_glosses(node, sense.gloss);
    xml::write_multitext_element(node, "definition", sense.definition, namer_);
    for (const auto& example : sense.examples) {
      write_example(node, example);
    }
    write_relations(node, sense.relations);
    write_notes(node, sense.notes);
    write_fields(node, sense.fields);
    write_traits(node, sense.traits);
    write_annotations(node, sense.annotations);
    for (const auto& subsense : sense.subsenses) {
      write_sense(node, subsense, "subsense");
    }
    write_extensions(node, sense.extensions);
  }

  void write_relations(pugi::xml_node parent, const std::vector<model::Relation>& relations) {
    for (const auto& relation : relations) {
      pugi::xml_node node = append_element(parent, "relation", namer_);
      set_attribute(node, "type", relation.type);
      set_attribute(node, "ref", relation.ref);
      set_order_attribute(node, relation.order);
      write_extra_attributes(node, relation.extra_attributes);
      write_traits(node, relation.traits);
      write_fields(node, relation.fields);
      write_extensions(node, relation.extensions);
    }
  }

  void write_pronunciation(pugi::xml_node parent, const model::Pronunciation& pronunciation) {
    pugi::xml_node node = append_element(parent, "pronunciation", namer_);
    write_extra_attributes(node, pronunciation.extra_attributes);
    xml::write_multitext(node, pronunciation.form, namer_);
    for (const auto& media : pronunciation.media) {
      pugi::xml_node media_node = append_element(node, "media", namer_);
      set_attribute(media_node, "href", media.href);
      xml::write_multitext_element(media_node, "label", media.label, namer_);
    }
    write_fields(node, pronunciation.fields);
    write_traits(node, pronunciation.traits);
    write_extensions(node, pronunciation.extensions);
  }

  void write_variant(pugi::xml_node parent, const model::Variant& variant) {
    pugi::xml_node node = append_element(parent, "variant", namer_);
    set_optional_attribute(node, "ref", variant.ref);
    write_extra_attributes(node, variant.extra_attributes);
    xml::write_multitext(node, variant.form, namer_);
    for (const auto& pronunciation : variant.pronunciations) {
      write_pronunciation(node, pronunciation);
    }
    write_grammatical_info(node, variant.grammatical_info);
    write_traits(node, variant.traits);
    write_fields(node, variant.fields);
    write_extensions(node, variant.extensions);
  }

  void write_notes(pugi::xml_node parent, const std::vector<model::Note>& notes) {
    for (const auto& note : notes) {
      pugi::xml_node node = append_element(parent, "note", namer_);
      set_optional_attribute(node, "type", note.type);
      xml::write_multitext(node, note.content, namer_);
    }
  }

  void write_annotations(pugi::xml_node parent,
                         const std::vector<model::Annotation>& annotations) {
    for (const auto& annotation : annotations) {
      pugi::xml_node node = append_element(parent, "annotation", namer_);
      set_attribute(node, "name", annotation.name);
      set_optional_attribute(node, "value", annotation.value);
      set_optional_attribute(node, "who", annotation.who);
      set_optional_attribute(node, "when", annotation.when);
      xml::write_multitext(node, annotation.content, namer_);
    }
  }

  void write_example(pugi::xml_node parent, const model::Example& example) {
    pugi::xml_node node = append_element(parent, "example", namer_);
    set_optional_attribute(node, "source", example.source);
    write_extra_attributes(node, example.extra_attributes);
    xml::write_multitext(node, example.form, namer_);
    for (const auto& translation : example.translations) {
      pugi::xml_node translation_node = append_element(node, "translation", namer_);
      set_optional_attribute(translation_node, "type", translation.type);
      xml::write_multitext(translation_node, translation.form, namer_);
    }
    write_notes(node, example.notes);
    write_fields(node, example.fields);
    write_traits(node, example.traits);
    write_extensions(node, example.extensions);
  }

  void write_etymology(pugi::xml_node parent, const model::Etymology& etymology) {
    pugi::xml_node node = append_element(parent, "etymology", namer_);
    if (!etymology.type.empty()) {
      set_attribute(node, "type", etymology.type);
    }
    if (!etymology.source.empty()) {
      set_attribute(node, "source", etymology.source);
    }
    write_extra_attributes(node, etymology.extra_attributes);
    xml::write_multitext(node, etymology.form, namer_);
    write_glosses(node, etymology.gloss);
    write_fields(node, etymology.fields);
    write_traits(node, etymology.traits);
    write_extensions(node, etymology.extensions);
  }

  void fail(GenerateErrorKind kind, std::string message) {
    if (!failed()) {
      error_ = GenerateError{kind, path_, std::move(message)};
    }
  }

  void write_traits(pugi::xml_node parent, const std::vector<model::Trait>& traits) {
    for (const auto& trait : traits) {
      if (trait.name.empty()) {
        fail(GenerateErrorKind::kMissingTraitName,
             "trait under <" + std::string{parent.name()} + "> has no name");
        return;
      }
    }
    xml::write_traits(parent, traits, namer_);
  }

  void write_fields(pugi::xml_node parent, const std::vector<model::Field>& fields) {
    for (const auto& field : fields) {
      if (field.type.empty()) {
        fail(GenerateErrorKind::kMissingFieldType,
             "field under <" + std::string{parent.name()} + "> has no type");
        return;
      }
      pugi::xml_node node = append_element(parent, "field", namer_);
      set_attribute(node, "type", field.type);
      xml::write_multitext(node, field.content, namer_);
      write_traits(node, field.traits);
    }
  }

  // Extra attributes follow the modeled ones and may not shadow them.
  void write_extra_attributes(pugi::xml_node node,
                              const std::vector<model::PreservedAttribute>& attributes) {
    for (const auto& attribute : attributes) {
      if (is_invalid_extra_name(attribute.name) || node.attribute(attribute.name.c_str())) {
        fail(GenerateErrorKind::kInvalidExtraAttribute,
             "attribute '" + attribute.name + "' cannot be written on <" + node.name() + ">");
        return;
      }
      set_attribute(node, attribute.name.c_str(), attribute.value);
    }
  }

  void write_extensions(pugi::xml_node parent,
                        const std::vector<model::PreservedElement>& extensions) {
    for (const auto& element : extensions) {
      if (!xml::append_preserved(parent, element)) {
        fail(GenerateErrorKind::kMalformedPreservedElement,
             "preserved <" + element.name + "> is not well-formed");
        return;
      }
    }
  }

  const xml::ElementNamer& namer_;
  std::string path_;
  std::optional<GenerateError> error_;
};

}  // namespace

LiftGenerator::LiftGenerator(GenerateOptions options) : options_(std::move(options)) {}

GenerateResult LiftGenerator::generate(const model::Document& document) const {
  const xml::ElementNamer namer{options_.ns_style == NamespaceStyle::kPrefixed};

  pugi::xml_document doc;
  pugi::xml_node declaration = doc.append_child(pugi::node_declaration);
  set_attribute(declaration, "version", "1.0");
  set_attribute(declaration, "encoding", "UTF-8");

  pugi::xml_node root = append_element(doc, "lift", namer);
  declare_namespace(root, options_.ns_style);
  set_attribute(root, "version", kLiftVersion);
  if (!options_.producer.empty()) {
    set_attribute(root, "producer", options_.producer);
  }

  if (!write_header(root, document.header, namer)) {
    return GenerateResult::err({GenerateErrorKind::kMalformedPreservedElement, "/lift/header",
                                "preserved header element is not well-formed"});
  }

  EntryWriter writer(namer);
  for (std::size_t i = 0; i < document.entries.size(); ++i) {
    writer.write_entry(root, document.entries[i], "/lift/entry[" + std::to_string(i + 1) + "]");
    if (writer.failed()) {
      return GenerateResult::err(writer.error());
    }
  }

  return GenerateResult::ok(save(doc, options_.indent));
}

GenerateResult LiftGenerator::generate_entry(const model::Entry& entry) const {
  const xml::ElementNamer namer{options_.ns_style == NamespaceStyle::kPrefixed};

  pugi::xml_document doc;
  EntryWriter writer(namer);
  pugi::xml_node node = writer.write_entry(doc, entry, "/entry");
  if (writer.failed()) {
    return GenerateResult::err(writer.error());
  }
  declare_namespace(node, options_.ns_style);
  // Namespace declarations conventionally lead the attribute list.
  for (const char* name : {"xmlns:lift", "xmlns"}) {
    if (pugi::xml_attribute attr = node.attribute(name)) {
      const std::string value = attr.value();
      node.remove_attribute(attr);
      node.prepend_attribute(name).set_value(value.c_str());
    }
  }

  return GenerateResult::ok(save(doc, options_.indent));
}

}  // namespace liftkit::codec
