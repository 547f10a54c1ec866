#include "liftkit/xml/multitext_xml.h"

#include <sstream>
#include <string>
#include <utility>

namespace liftkit::xml {

model::Multitext read_multitext(const pugi::xml_node& node, const NameResolver& names) {
  model::Multitext text;
  for (const pugi::xml_node& form : names.children(node, "form")) {
    const pugi::xml_node text_node = names.child(form, "text");
    if (!text_node) {
      continue;
    }
    text.set(names.attribute(form, "lang").value_or(kUndeterminedLang), collect_text(text_node));
  }
  return text;
}

model::Multitext read_child_multitext(const pugi::xml_node& parent, std::string_view local,
                                      const NameResolver& names) {
  const pugi::xml_node child = names.child(parent, local);
  if (!child) {
    return {};
  }
  return read_multitext(child, names);
}

std::optional<model::Trait> read_trait(const pugi::xml_node& node, const NameResolver& names) {
  auto name = names.attribute(node, "name");
  if (!name.has_value() || name->empty()) {
    return std::nullopt;
  }
  return model::Trait{std::move(*name), names.attribute(node, "value").value_or("")};
}

std::optional<model::Field> read_field(const pugi::xml_node& node, const NameResolver& names) {
  auto type = names.attribute(node, "type");
  if (!type.has_value()) {
    type = names.attribute(node, "tag");
  }
  if (!type.has_value() || type->empty()) {
    return std::nullopt;
  }

  model::Field field;
  field.type = std::move(*type);
  field.content = read_multitext(node, names);
  for (const pugi::xml_node& trait_node : names.children(node, "trait")) {
    if (auto trait = read_trait(trait_node, names)) {
      field.traits.push_back(std::move(*trait));
    }
  }
  return field;
}

pugi::xml_node append_element(pugi::xml_node parent, std::string_view local,
                              const ElementNamer& namer) {
  return parent.append_child(namer(local).c_str());
}

void set_attribute(pugi::xml_node node, const char* name, std::string_view value) {
  node.append_attribute(name).set_value(std::string{value}.c_str());
}

void write_multitext(pugi::xml_node parent, const model::Multitext& text,
                     const ElementNamer& namer) {
  for (const auto& [lang, value] : text) {
    pugi::xml_node form = append_element(parent, "form", namer);
    set_attribute(form, "lang", lang);
    pugi::xml_node text_node = append_element(form, "text", namer);
    text_node.append_child(pugi::node_pcdata).set_value(value.c_str());
  }
}

void write_multitext_element(pugi::xml_node parent, std::string_view local,
                             const model::Multitext& text, const ElementNamer& namer) {
  if (text.empty()) {
    return;
  }
  write_multitext(append_element(parent, local, namer), text, namer);
}

void write_traits(pugi::xml_node parent, const std::vector<model::Trait>& traits,
                  const ElementNamer& namer) {
  for (const auto& trait : traits) {
    pugi::xml_node node = append_element(parent, "trait", namer);
    set_attribute(node, "name", trait.name);
    set_attribute(node, "value", trait.value);
  }
}

void write_fields(pugi::xml_node parent, const std::vector<model::Field>& fields,
                  const ElementNamer& namer) {
  for (const auto& field : fields) {
    pugi::xml_node node = append_element(parent, "field", namer);
    set_attribute(node, "type", field.type);
    write_multitext(node, field.content, namer);
    write_traits(node, field.traits, namer);
  }
}

model::PreservedElement capture_element(const pugi::xml_node& node, const NameResolver& names) {
  pugi::xml_document fragment;
  pugi::xml_node copy = fragment.append_copy(node);
  strip_lift_prefixes(copy, names);
  strip_layout_whitespace(copy);

  const std::string_view prefix = prefix_of(copy.name());
  if (!prefix.empty()) {
    const std::string attr_name = "xmlns:" + std::string{prefix};
    if (!copy.attribute(attr_name.c_str())) {
      if (const pugi::xml_attribute decl = find_namespace_declaration(node, prefix)) {
        copy.append_attribute(attr_name.c_str()).set_value(decl.value());
      }
    }
  }

  std::ostringstream out;
  copy.print(out, "", pugi::format_raw, pugi::encoding_utf8);

  model::PreservedElement element;
  element.name = std::string{names.local_name(node).value_or(node.name())};
  element.xml = out.str();
  return element;
}

bool append_preserved(pugi::xml_node parent, const model::PreservedElement& element) {
  pugi::xml_document fragment;
  const pugi::xml_parse_result parsed = fragment.load_buffer(
      element.xml.data(), element.xml.size(), kLoadFlags, pugi::encoding_utf8);
  if (!parsed || !fragment.document_element()) {
    return false;
  }
  parent.append_copy(fragment.document_element());
  return true;
}

}  // namespace liftkit::xml
