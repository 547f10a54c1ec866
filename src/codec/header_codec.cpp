#include "liftkit/codec/header_codec.h"

#include "liftkit/xml/multitext_xml.h"

#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace liftkit::codec {

namespace {

// HeaderReader reads one <header>. Findings go to report when the caller
// collects them.
class HeaderReader {
 public:
  HeaderReader(const xml::NameResolver& names, ParseReport* report, UnknownElementPolicy policy)
      : names_(names), report_(report), policy_(policy) {}

  model::Header read(const pugi::xml_node& header_node) {
    model::Header header;
    for (const pugi::xml_node& child : header_node.children()) {
      if (child.type() != pugi::node_element) {
        continue;
      }
      const auto local = names_.local_name(child);
      if (local == "description") {
        for (const auto& [lang, text] : xml::read_multitext(child, names_)) {
          header.description.set(lang, text);
        }
      } else if (local == "ranges") {
        read_ranges(child, header);
      } else if (local == "fields") {
        read_fields(child, header);
      } else {
        keep(child, header.extensions);
      }
    }
    return header;
  }

 private:
  void read_ranges(const pugi::xml_node& node, model::Header& header) {
    header.ranges_href = names_.attribute(node, "href");
    for (const pugi::xml_node& child : node.children()) {
      if (child.type() != pugi::node_element) {
        continue;
      }
      if (!names_.is(child, "range")) {
        note(child, "unmodeled element under <ranges> dropped");
        continue;
      }
      model::RangeRef ref;
      ref.id = names_.attribute(child, "id").value_or("");
      ref.href = names_.attribute(child, "href").value_or("");
      header.range_refs.push_back(std::move(ref));

      if (names_.child(child, "range-element")) {
        note(child, "inline range content is not kept on the header");
      }
    }
  }

  void read_fields(const pugi::xml_node& node, model::Header& header) {
    for (const pugi::xml_node& child : node.children()) {
      if (child.type() != pugi::node_element) {
        continue;
      }
      if (!names_.is(child, "field")) {
        note(child, "unmodeled element under <fields> dropped");
        continue;
      }
      model::FieldDeclaration declaration;
      declaration.type =
          names_.attribute(child, "tag").value_or(names_.attribute(child, "type").value_or(""));
      declaration.description = xml::read_multitext(child, names_);
      for (const pugi::xml_node& part : child.children()) {
        if (part.type() == pugi::node_element && !names_.is(part, "form")) {
          keep(part, declaration.extensions);
        }
      }
      header.field_declarations.push_back(std::move(declaration));
    }
  }

  void keep(const pugi::xml_node& node, std::vector<model::PreservedElement>& sink) {
    if (policy_ == UnknownElementPolicy::kKnownSubset) {
      note(node, "unmodeled header element dropped");
      return;
    }
    note(node, "unmodeled header element preserved verbatim");
    sink.push_back(xml::capture_element(node, names_));
  }

  void note(const pugi::xml_node& node, std::string message) {
    if (report_ != nullptr) {
      report_->issues.push_back(
          {ParseIssueKind::kUnknownConstruct, xml::element_path(node), std::move(message)});
    }
  }

  const xml::NameResolver& names_;
  ParseReport* report_;
  UnknownElementPolicy policy_;
};

bool append_all(pugi::xml_node parent, const std::vector<model::PreservedElement>& elements) {
  for (const auto& element : elements) {
    if (!xml::append_preserved(parent, element)) {
      return false;
    }
  }
  return true;
}

}  // namespace

model::Header read_header(const pugi::xml_node& header_node, const xml::NameResolver& names,
                          ParseReport* report, UnknownElementPolicy policy) {
  return HeaderReader(names, report, policy).read(header_node);
}

bool write_header(pugi::xml_node parent, const model::Header& header,
                  const xml::ElementNamer& namer) {
  if (header.empty()) {
    return true;
  }

  pugi::xml_node node = xml::append_element(parent, "header", namer);
  xml::write_multitext_element(node, "description", header.description, namer);

  if (header.ranges_href.has_value() || !header.range_refs.empty()) {
    pugi::xml_node ranges = xml::append_element(node, "ranges", namer);
    if (header.ranges_href.has_value()) {
      xml::set_attribute(ranges, "href", *header.ranges_href);
    }
    for (const auto& ref : header.range_refs) {
      pugi::xml_node range = xml::append_element(ranges, "range", namer);
      xml::set_attribute(range, "id", ref.id);
      xml::set_attribute(range, "href", ref.href);
    }
  }

  if (!header.field_declarations.empty()) {
    pugi::xml_node fields = xml::append_element(node, "fields", namer);
    for (const auto& declaration : header.field_declarations) {
      pugi::xml_node field = xml::append_element(fields, "field", namer);
      xml::set_attribute(field, "tag", declaration.type);
      xml::write_multitext(field, declaration.description, namer);
      if (!append_all(field, declaration.extensions)) {
        return false;
      }
    }
  }

  return append_all(node, header.extensions);
}

HeaderParseResult parse_header(std::string_view xml_text) {
  pugi::xml_document doc;
  const pugi::xml_parse_result parsed =
      doc.load_buffer(xml_text.data(), xml_text.size(), xml::kLoadFlags, pugi::encoding_utf8);
  if (!parsed) {
    return HeaderParseResult::err(
        {ParseErrorKind::kMalformedXml, "",
         std::string{parsed.description()} + " at offset " + std::to_string(parsed.offset)});
  }

  const pugi::xml_node root = doc.document_element();
  const auto names = xml::NameResolver::for_document(root);
  if (names.is(root, "header")) {
    return HeaderParseResult::ok(read_header(root, names));
  }
  if (!names.is(root, "lift")) {
    return HeaderParseResult::err({ParseErrorKind::kSchemaViolation, xml::element_path(root),
                                   "expected <lift> or <header> root element"});
  }
  if (const pugi::xml_node header_node = names.child(root, "header")) {
    return HeaderParseResult::ok(read_header(header_node, names));
  }
  return HeaderParseResult::ok(model::Header{});
}

GenerateResult generate_header(const model::Header& header) {
  pugi::xml_document doc;
  if (!write_header(doc, header, xml::ElementNamer{false})) {
    return GenerateResult::err({GenerateErrorKind::kMalformedPreservedElement, "/header",
                                "a preserved header element is not well-formed"});
  }

  std::ostringstream out;
  doc.save(out, "  ", pugi::format_default | pugi::format_no_declaration, pugi::encoding_utf8);
  return GenerateResult::ok(out.str());
}

}  // namespace liftkit::codec
