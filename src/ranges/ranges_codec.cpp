#include "liftkit/ranges/ranges_codec.h"

#include "liftkit/core/normalization.h"
#include "liftkit/xml/multitext_xml.h"
#include "liftkit/xml/node_lookup.h"

#include <pugixml.hpp>

#include <sstream>
#include <utility>

namespace liftkit::ranges {

namespace {

model::Multitext read_abbrev(const pugi::xml_node& element, const xml::NameResolver& names) {
  const pugi::xml_node abbrev = names.child(element, "abbrev");
  if (!abbrev) {
    return {};
  }
  model::Multitext text = xml::read_multitext(abbrev, names);
  if (text.empty() && !names.child(abbrev, "form")) {
    // Older files write <abbrev>n</abbrev> without forms.
    const std::string direct = core::trim(xml::collect_text(abbrev));
    if (!direct.empty()) {
      text.set(xml::kUndeterminedLang, direct);
    }
  }
  return text;
}

// read_elements appends node's <range-element> children in pre-order. A nested
// element inherits the enclosing element as parent unless it names its own.
void read_elements(const pugi::xml_node& node, const std::optional<std::string>& enclosing,
                   const xml::NameResolver& names, std::vector<RangeElement>& out) {
  for (const pugi::xml_node& child : names.children(node, "range-element")) {
    auto id = names.attribute(child, "id");
    if (!id.has_value() || core::is_blank(*id)) {
      continue;
    }

    RangeElement element;
    element.id = std::move(*id);
    element.guid = names.attribute(child, "guid");
    element.parent = names.attribute(child, "parent");
    if (!element.parent.has_value() || element.parent->empty()) {
      element.parent = enclosing;
    }
    element.label = xml::read_child_multitext(child, "label", names);
    element.description = xml::read_child_multitext(child, "description", names);
    element.abbrev = read_abbrev(child, names);
    for (const pugi::xml_node& trait_node : names.children(child, "trait")) {
      if (auto trait = xml::read_trait(trait_node, names)) {
        element.traits.push_back(std::move(*trait));
      }
    }
    for (const pugi::xml_node& field_node : names.children(child, "field")) {
      if (auto field = xml::read_field(field_node, names)) {
        element.fields.push_back(std::move(*field));
      }
    }

    const std::optional<std::string> self = element.id;
    out.push_back(std::move(element));
    read_elements(child, self, names, out);
  }
}

Range read_range(const pugi::xml_node& node, std::string id, const xml::NameResolver& names) {
  Range range;
  range.id = std::move(id);
  range.guid = names.attribute(node, "guid");
  range.href = names.attribute(node, "href");
  range.label = xml::read_child_multitext(node, "label", names);
  range.description = xml::read_child_multitext(node, "description", names);
  read_elements(node, std::nullopt, names, range.elements);
  return range;
}

// read_ranges collects <range> children of container. Header range references
// carry no content; with skip_empty they are not turned into empty ranges.
void read_ranges(const pugi::xml_node& container, const xml::NameResolver& names,
                 bool skip_empty, RangeSet& out) {
  for (const pugi::xml_node& node : names.children(container, "range")) {
    auto id = names.attribute(node, "id");
    if (!id.has_value() || core::is_blank(*id)) {
      continue;
    }
    if (skip_empty && !names.child(node, "range-element")) {
      continue;
    }
    out.ranges.push_back(read_range(node, std::move(*id), names));
  }
}

void write_element(pugi::xml_node parent, const RangeElement& element,
                   const xml::ElementNamer& namer) {
  pugi::xml_node node = xml::append_element(parent, "range-element", namer);
  xml::set_attribute(node, "id", element.id);
  if (element.guid.has_value()) {
    xml::set_attribute(node, "guid", *element.guid);
  }
  if (element.parent.has_value()) {
    xml::set_attribute(node, "parent", *element.parent);
  }
  xml::write_multitext_element(node, "label", element.label, namer);
  xml::write_multitext_element(node, "description", element.description, namer);
  xml::write_multitext_element(node, "abbrev", element.abbrev, namer);
  xml::write_traits(node, element.traits, namer);
  xml::write_fields(node, element.fields, namer);
}

}  // namespace

std::string_view to_string(RangesErrorKind kind) {
  switch (kind) {
    case RangesErrorKind::kMalformedXml:
      return "MalformedXml";
    case RangesErrorKind::kSchemaViolation:
      return "SchemaViolation";
  }
  return "Unknown";
}

RangesParseResult parse_ranges(std::string_view xml_text) {
  pugi::xml_document doc;
  const pugi::xml_parse_result parsed =
      doc.load_buffer(xml_text.data(), xml_text.size(), xml::kLoadFlags, pugi::encoding_utf8);
  if (!parsed) {
    return RangesParseResult::err(
        {RangesErrorKind::kMalformedXml, "",
         std::string{parsed.description()} + " at offset " + std::to_string(parsed.offset)});
  }

  const pugi::xml_node root = doc.document_element();
  const auto names = xml::NameResolver::for_document(root);
  RangeSet set;

  if (names.is(root, "lift-ranges")) {
    read_ranges(root, names, false, set);
  } else if (names.is(root, "range")) {
    auto id = names.attribute(root, "id");
    if (id.has_value() && !core::is_blank(*id)) {
      set.ranges.push_back(read_range(root, std::move(*id), names));
    }
  } else if (names.is(root, "lift") || names.is(root, "header")) {
    const pugi::xml_node header = names.is(root, "header") ? root : names.child(root, "header");
    if (const pugi::xml_node ranges = names.child(header, "ranges")) {
      read_ranges(ranges, names, true, set);
    }
  } else {
    return RangesParseResult::err({RangesErrorKind::kSchemaViolation, xml::element_path(root),
                                   "expected <lift-ranges>, <range>, <lift> or <header> root"});
  }

  return RangesParseResult::ok(std::move(set));
}

std::string generate_ranges(const RangeSet& ranges, bool indent) {
  const xml::ElementNamer namer{false};

  pugi::xml_document doc;
  pugi::xml_node declaration = doc.append_child(pugi::node_declaration);
  xml::set_attribute(declaration, "version", "1.0");
  xml::set_attribute(declaration, "encoding", "UTF-8");

  pugi::xml_node root = xml::append_element(doc, "lift-ranges", namer);
  for (const auto& range : ranges.ranges) {
    pugi::xml_node node = xml::append_element(root, "range", namer);
    xml::set_attribute(node, "id", range.id);
    if (range.guid.has_value()) {
      xml::set_attribute(node, "guid", *range.guid);
    }
    if (range.href.has_value()) {
      xml::set_attribute(node, "href", *range.href);
    }
    xml::write_multitext_element(node, "label", range.label, namer);
    xml::write_multitext_element(node, "description", range.description, namer);
    for (const auto& element : range.elements) {
      write_element(node, element, namer);
    }
  }

  const unsigned int flags =
      (indent ? pugi::format_indent : pugi::format_raw) | pugi::format_no_declaration;
  std::ostringstream out;
  doc.save(out, "  ", flags, pugi::encoding_utf8);
  return out.str();
}

}  // namespace liftkit::ranges
