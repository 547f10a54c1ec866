#include "liftkit/codec/lift_parser.h"

#include "liftkit/codec/header_codec.h"
#include "liftkit/core/normalization.h"
#include "liftkit/xml/multitext_xml.h"
#include "liftkit/xml/node_lookup.h"

#include <algorithm>
#include <charconv>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace liftkit::codec {

namespace {

std::optional<int> parse_int(std::string_view text) {
  int value = 0;
  const char* first = text.data();
  const char* last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return value;
}

bool is_namespace_declaration(std::string_view name) {
  return name == "xmlns" || name.starts_with("xmlns:");
}

using AttributeNames = std::initializer_list<std::string_view>;

// EntryReader walks one document. It records non-fatal issues in the report and
// the first fatal error (strict mode) in error_.
class EntryReader {
 public:
  EntryReader(const xml::NameResolver& names, const ParseOptions& options, ParseReport& report)
      : names_(names), options_(options), report_(report) {}

  [[nodiscard]] bool failed() const { return error_.has_value(); }
  [[nodiscard]] const ParseError& error() const { return *error_; }

  // read_entry returns nullopt when the entry was skipped or the parse failed.
  std::optional<model::Entry> read_entry(const pugi::xml_node& node) {
    auto id = names_.attribute(node, "id");
    if (!id.has_value() || core::is_blank(*id)) {
      violation(node, "entry without id");
      return std::nullopt;
    }

    model::Entry entry;
    entry.id = std::move(*id);
    entry.guid = names_.attribute(node, "guid");
    entry.date_created = names_.attribute(node, "dateCreated");
    entry.date_modified = names_.attribute(node, "dateModified");
    entry.date_deleted = names_.attribute(node, "dateDeleted");
    entry.order = read_order(node);
    audit_attributes(node, {"id", "guid", "order", "dateCreated", "dateModified", "dateDeleted"},
                     &entry.extra_attributes);

    for (const pugi::xml_node& child : node.children()) {
      const auto local = names_.local_name(child);
      if (!local.has_value()) {
        unknown(child, entry.extensions);
      } else if (*local == "lexical-unit") {
        merge_forms(entry.lexical_unit, text_element(child));
      } else if (*local == "citation") {
        merge_forms(entry.citation_form, text_element(child));
      } else if (*local == "pronunciation") {
        entry.pronunciations.push_back(read_pronunciation(child));
      } else if (*local == "grammatical-info") {
        entry.grammatical_info = read_grammatical_info(child);
      } else if (*local == "sense") {
        if (auto sense = read_sense(child, 0)) {
          entry.senses.push_back(std::move(*sense));
        }
      } else if (*local == "variant") {
        entry.variants.push_back(read_variant(child));
      } else if (*local == "relation") {
        read_relation_into(child, entry.relations);
      } else if (*local == "etymology") {
        entry.etymologies.push_back(read_etymology(child));
      } else if (*local == "field") {
        read_field_into(child, entry.fields);
      } else if (*local == "note") {
        entry.notes.push_back(read_note(child));
      } else if (*local == "trait") {
        read_trait_into(child, entry.traits);
      } else if (*local == "annotation") {
        entry.annotations.push_back(read_annotation(child));
      } else {
        unknown(child, entry.extensions);
      }
    }

    if (failed()) {
      return std::nullopt;
    }
    return entry;
  }

  // unknown_at_root reports a root-level element that has no owner to keep it.
  void unknown_at_root(const pugi::xml_node& node) {
    if (node.type() != pugi::node_element) {
      return;
    }
    report_.issues.push_back({ParseIssueKind::kUnknownConstruct, xml::element_path(node),
                              "unmodeled document-level element dropped"});
  }

 private:
  void violation(const pugi::xml_node& node, std::string message) {
    if (failed()) {
      return;
    }
    if (options_.mode == ParseMode::kStrict) {
      error_ = ParseError{ParseErrorKind::kSchemaViolation, xml::element_path(node),
                          std::move(message)};
      return;
    }
    report_.issues.push_back(
        {ParseIssueKind::kSkippedConstruct, xml::element_path(node), std::move(message)});
  }

  void check_prefix(const pugi::xml_node& node) {
    const std::string_view prefix = xml::prefix_of(node.name());
    if (!prefix.empty() && !names_.is_lift_prefix(prefix) &&
        !xml::find_namespace_declaration(node, prefix)) {
      report_.issues.push_back({ParseIssueKind::kUnresolvedNamespace, xml::element_path(node),
                                "prefix '" + std::string{prefix} + "' is not declared"});
    }
  }

  // unknown handles an unmodeled child of a construct that keeps extensions.
  void unknown(const pugi::xml_node& node, std::vector<model::PreservedElement>& sink) {
    if (node.type() != pugi::node_element) {
      return;
    }
    check_prefix(node);

    if (options_.unknown_elements == UnknownElementPolicy::kKnownSubset) {
      report_.issues.push_back({ParseIssueKind::kUnknownConstruct, xml::element_path(node),
                                "unmodeled element dropped"});
      return;
    }

    report_.issues.push_back({ParseIssueKind::kUnknownConstruct, xml::element_path(node),
                              "unmodeled element preserved verbatim"});
    sink.push_back(xml::capture_element(node, names_));
  }

  // dropped handles an unmodeled child of a construct that has nowhere to keep it.
  void dropped(const pugi::xml_node& node) {
    if (node.type() != pugi::node_element) {
      return;
    }
    check_prefix(node);
    report_.issues.push_back({ParseIssueKind::kUnknownConstruct, xml::element_path(node),
                              "unmodeled element dropped"});
  }

  // audit_attributes reports every attribute of node outside known. Under the
  // lossless policy they are kept in sink when the construct has one.
  void audit_attributes(const pugi::xml_node& node, AttributeNames known,
                        std::vector<model::PreservedAttribute>* sink) {
    for (const pugi::xml_attribute& attr : node.attributes()) {
      std::string_view name = attr.name();
      if (is_namespace_declaration(name)) {
        continue;
      }
      const std::string_view prefix = xml::prefix_of(name);
      if (!prefix.empty() && names_.is_lift_prefix(prefix)) {
        name.remove_prefix(prefix.size() + 1);
      }
      if (std::find(known.begin(), known.end(), name) != known.end()) {
        continue;
      }

      const std::string path = xml::element_path(node) + "/@" + attr.name();
      if (sink == nullptr || options_.unknown_elements == UnknownElementPolicy::kKnownSubset) {
        report_.issues.push_back(
            {ParseIssueKind::kUnknownConstruct, path, "unmodeled attribute dropped"});
        continue;
      }
      report_.issues.push_back(
          {ParseIssueKind::kUnknownConstruct, path, "unmodeled attribute preserved"});
      sink->push_back({std::string{name}, attr.value()});
      if (name == attr.name() && !prefix.empty()) {
        keep_binding(node, prefix, *sink);
      }
    }
  }

  // keep_binding stores the xmlns:prefix declaration a preserved foreign
  // attribute depends on, so the element can be regenerated on its own.
  void keep_binding(const pugi::xml_node& node, std::string_view prefix,
                    std::vector<model::PreservedAttribute>& sink) {
    const std::string binding = "xmlns:" + std::string{prefix};
    const bool kept = std::any_of(sink.begin(), sink.end(),
                                  [&](const auto& attribute) { return attribute.name == binding; });
    if (kept) {
      return;
    }
    if (const pugi::xml_attribute decl = xml::find_namespace_declaration(node, prefix)) {
      sink.push_back({binding, decl.value()});
      return;
    }
    report_.issues.push_back({ParseIssueKind::kUnresolvedNamespace, xml::element_path(node),
                              "prefix '" + std::string{prefix} + "' is not declared"});
  }

  // audit_text reports what a <text> element holds beyond character data.
  // Inline markup such as <span lang=""> is flattened to its text.
  void audit_text(const pugi::xml_node& node) {
    audit_attributes(node, {}, nullptr);
    for (const pugi::xml_node& child : node.children()) {
      if (child.type() == pugi::node_element) {
        report_.issues.push_back({ParseIssueKind::kUnknownConstruct, xml::element_path(child),
                                  "inline markup flattened to its text"});
      }
    }
  }

  // forms reads the <form> children of node; other children are the caller's.
  model::Multitext forms(const pugi::xml_node& node) {
    for (const pugi::xml_node& form : names_.children(node, "form")) {
      audit_attributes(form, {"lang"}, nullptr);
      bool seen_text = false;
      for (const pugi::xml_node& child : form.children()) {
        if (names_.is(child, "text") && !seen_text) {
          audit_text(child);
          seen_text = true;
        } else {
          dropped(child);
        }
      }
    }
    return xml::read_multitext(node, names_);
  }

  // text_element reads an element that holds nothing but forms
  // (<lexical-unit>, <definition>, <label>, ...).
  model::Multitext text_element(const pugi::xml_node& node) {
    return text_element_with(node, {});
  }

  model::Multitext text_element_with(const pugi::xml_node& node, AttributeNames known) {
    audit_attributes(node, known, nullptr);
    for (const pugi::xml_node& child : node.children()) {
      if (!names_.is(child, "form")) {
        dropped(child);
      }
    }
    return forms(node);
  }

  std::optional<int> read_order(const pugi::xml_node& node) {
    const auto text = names_.attribute(node, "order");
    if (!text.has_value()) {
      return std::nullopt;
    }
    auto value = parse_int(*text);
    if (!value.has_value()) {
      violation(node, "order attribute is not an integer: '" + *text + "'");
    }
    return value;
  }

  static void merge_forms(model::Multitext& target, const model::Multitext& source) {
    for (const auto& [lang, text] : source) {
      target.set(lang, text);
    }
  }

  // read_gloss_into handles the LIFT gloss shape: <gloss lang="en"><text>..</text></gloss>.
  void read_gloss_into(const pugi::xml_node& node, model::Multitext& target) {
    audit_attributes(node, {"lang"}, nullptr);
    pugi::xml_node text_node;
    for (const pugi::xml_node& child : node.children()) {
      if (names_.is(child, "text") && !text_node) {
        text_node = child;
        audit_text(child);
      } else {
        dropped(child);
      }
    }
    if (!text_node) {
      return;
    }
    target.set(names_.attribute(node, "lang").value_or(xml::kUndeterminedLang),
               xml::collect_text(text_node));
  }

  void read_trait_into(const pugi::xml_node& node, std::vector<model::Trait>& traits) {
    auto trait = xml::read_trait(node, names_);
    if (!trait.has_value()) {
      violation(node, "trait without name");
      return;
    }
    audit_attributes(node, {"name", "value"}, nullptr);
    for (const pugi::xml_node& child : node.children()) {
      dropped(child);
    }
    traits.push_back(std::move(*trait));
  }

  void read_field_into(const pugi::xml_node& node, std::vector<model::Field>& fields) {
    auto type = names_.attribute(node, "type");
    if (!type.has_value()) {
      type = names_.attribute(node, "tag");
    }
    if (!type.has_value() || type->empty()) {
      violation(node, "field without type");
      return;
    }
    audit_attributes(node, {"type", "tag"}, nullptr);

    model::Field field;
    field.type = std::move(*type);
    for (const pugi::xml_node& child : node.children()) {
      if (names_.is(child, "trait")) {
        read_trait_into(child, field.traits);
      } else if (!names_.is(child, "form")) {
        dropped(child);
      }
    }
    field.content = forms(node);
    fields.push_back(std::move(field));
  }

  void read_relation_into(const pugi::xml_node& node, std::vector<model::Relation>& relations) {
    auto type = names_.attribute(node, "type");
    auto ref = names_.attribute(node, "ref");
    if (!type.has_value()) {
      violation(node, "relation without type");
      return;
    }
    if (!ref.has_value()) {
      violation(node, "relation without ref");
      return;
    }

    model::Relation relation;
    relation.type = std::move(*type);
    relation.ref = std::move(*ref);
    relation.order = read_order(node);
    audit_attributes(node, {"type", "ref", "order"}, &relation.extra_attributes);

    for (const pugi::xml_node& child : node.children()) {
      if (names_.is(child, "trait")) {
        read_trait_into(child, relation.traits);
      } else if (names_.is(child, "field")) {
        read_field_into(child, relation.fields);
      } else {
        unknown(child, relation.extensions);
      }
    }
    relations.push_back(std::move(relation));
  }

  model::GrammaticalInfo read_grammatical_info(const pugi::xml_node& node) {
    model::GrammaticalInfo info;
    info.value = names_.attribute(node, "value").value_or("");
    audit_attributes(node, {"value"}, nullptr);
    for (const pugi::xml_node& child : node.children()) {
      if (names_.is(child, "trait")) {
        read_trait_into(child, info.traits);
      } else {
        dropped(child);
      }
    }
    return info;
  }

  model::Pronunciation read_pronunciation(const pugi::xml_node& node) {
    model::Pronunciation pronunciation;
    audit_attributes(node, {}, &pronunciation.extra_attributes);
    for (const pugi::xml_node& child : node.children()) {
      const auto local = names_.local_name(child);
      if (!local.has_value()) {
        unknown(child, pronunciation.extensions);
      } else if (*local == "form") {
        // Collected below in one pass so duplicate languages stay last-wins.
      } else if (*local == "media") {
        pronunciation.media.push_back(read_media(child));
      } else if (*local == "field") {
        read_field_into(child, pronunciation.fields);
      } else if (*local == "trait") {
        read_trait_into(child, pronunciation.traits);
      } else {
        unknown(child, pronunciation.extensions);
      }
    }
    pronunciation.form = forms(node);
    return pronunciation;
  }

  model::Media read_media(const pugi::xml_node& node) {
    model::Media media;
    media.href = names_.attribute(node, "href").value_or("");
    audit_attributes(node, {"href"}, nullptr);
    for (const pugi::xml_node& child : node.children()) {
      if (names_.is(child, "label")) {
        for (const auto& [lang, text] : text_element(child)) {
          media.label.set(lang, text);
        }
      } else {
        dropped(child);
      }
    }
    return media;
  }

  // Direct <trait> children of <variant> belong to the variant. Traits under its
  // <grammatical-info> belong to the grammatical info.
  model::Variant read_variant(const pugi::xml_node& node) {
    model::Variant variant;
    variant.ref = names_.attribute(node, "ref");
    audit_attributes(node, {"ref"}, &variant.extra_attributes);
    for (const pugi::xml_node& child : node.children()) {
      const auto local = names_.local_name(child);
      if (!local.has_value()) {
        unknown(child, variant.extensions);
      } else if (*local == "form") {
        // Read below.
      } else if (*local == "trait") {
        read_trait_into(child, variant.traits);
      } else if (*local == "grammatical-info") {
        variant.grammatical_info = read_grammatical_info(child);
      } else if (*local == "pronunciation") {
        variant.pronunciations.push_back(read_pronunciation(child));
      } else if (*local == "field") {
        read_field_into(child, variant.fields);
      } else {
        unknown(child, variant.extensions);
      }
    }
    variant.form = forms(node);
    return variant;
  }

  model::Note read_note(const pugi::xml_node& node) {
    model::Note note;
    note.type = names_.attribute(node, "type");
    audit_attributes(node, {"type"}, nullptr);
    for (const pugi::xml_node& child : node.children()) {
      if (!names_.is(child, "form")) {
        dropped(child);
      }
    }
    note.content = forms(node);
    if (note.content.empty() && !names_.child(node, "form")) {
      // Producers sometimes write a bare-text note.
      const std::string text = core::trim(xml::collect_text(node));
      if (!text.empty()) {
        note.content.set(xml::kUndeterminedLang, text);
      }
    }
    return note;
  }

  model::Annotation read_annotation(const pugi::xml_node& node) {
    model::Annotation annotation;
    annotation.name = names_.attribute(node, "name").value_or("");
    annotation.value = names_.attribute(node, "value");
    annotation.who = names_.attribute(node, "who");
    annotation.when = names_.attribute(node, "when");
    annotation.content = text_element_with(node, {"name", "value", "who", "when"});
    return annotation;
  }

  model::Example read_example(const pugi::xml_node& node) {
    model::Example example;
    example.source = names_.attribute(node, "source");
    audit_attributes(node, {"source"}, &example.extra_attributes);
    for (const pugi::xml_node& child : node.children()) {
      const auto local = names_.local_name(child);
      if (!local.has_value()) {
        unknown(child, example.extensions);
      } else if (*local == "form") {
        // Read below.
      } else if (*local == "translation") {
        model::Translation translation;
        translation.type = names_.attribute(child, "type");
        translation.form = text_element_with(child, {"type"});
        example.translations.push_back(std::move(translation));
      } else if (*local == "note") {
        example.notes.push_back(read_note(child));
      } else if (*local == "field") {
        read_field_into(child, example.fields);
      } else if (*local == "trait") {
        read_trait_into(child, example.traits);
      } else {
        unknown(child, example.extensions);
      }
    }
    example.form = forms(node);
    return example;
  }

  model::Etymology read_etymology(const pugi::xml_node& node) {
    model::Etymology etymology;
    etymology.type = names_.attribute(node, "type").value_or("");
    etymology.source = names_.attribute(node, "source").value_or("");
    audit_attributes(node, {"type", "source"}, &etymology.extra_attributes);
    for (const pugi::xml_node& child : node.children()) {
      const auto local = names_.local_name(child);
      if (!local.has_value()) {
        unknown(child, etymology.extensions);
      } else if (*local == "form") {
        // Read below.
      } else if (*local == "gloss") {
        read_gloss_into(child, etymology.gloss);
      } else if (*local == "field") {
        read_field_into(child, etymology.fields);
      } else if (*local == "trait") {
        read_trait_into(child, etymology.traits);
      } else {
        unknown(child, etymology.extensions);
      }
    }
    etymology.form = forms(node);
    return etymology;
  }

  std::optional<model::Sense> read_sense(const pugi::xml_node& node, int depth) {
    if (depth > kMaxSenseDepth) {
      violation(node, "subsense nesting deeper than " + std::to_string(kMaxSenseDepth));
      return std::nullopt;
    }

    model::Sense sense;
    sense.id = names_.attribute(node, "id");
    sense.order = read_order(node);
    audit_attributes(node, {"id", "order"}, &sense.extra_attributes);

    for (const pugi::xml_node& child : node.children()) {
      const auto local = names_.local_name(child);
      if (!local.has_value()) {
        unknown(child, sense.extensions);
      } else if (*local == "grammatical-info") {
        sense.grammatical_info = read_grammatical_info(child);
      } else if (*local == "gloss") {
        read_gloss_into(child, sense.gloss);
      } else if (*local == "definition") {
        merge_forms(sense.definition, text_element(child));
      } else if (*local == "relation") {
        read_relation_into(child, sense.relations);
      } else if (*local == "example") {
        sense.examples.push_back(read_example(child));
      } else if (*local == "note") {
        sense.notes.push_back(read_note(child));
      } else if (*local == "field") {
        read_field_into(child, sense.fields);
      } else if (*local == "trait") {
        read_trait_into(child, sense.traits);
      } else if (*local == "annotation") {
        sense.annotations.push_back(read_annotation(child));
      } else if (*local == "subsense") {
        if (auto subsense = read_sense(child, depth + 1)) {
          sense.subsenses.push_back(std::move(*subsense));
        }
      } else {
        unknown(child, sense.extensions);
      }
    }
    return sense;
  }

  const xml::NameResolver& names_;
  const ParseOptions& options_;
  ParseReport& report_;
  std::optional<ParseError> error_;
};

ParseError malformed(const pugi::xml_parse_result& parsed) {
  return ParseError{ParseErrorKind::kMalformedXml, "",
                    std::string{parsed.description()} + " at offset " +
                        std::to_string(parsed.offset)};
}

}  // namespace

LiftParser::LiftParser(ParseOptions options) : options_(options) {}

ParseResult LiftParser::parse(std::string_view xml_text) const {
  pugi::xml_document doc;
  const pugi::xml_parse_result parsed =
      doc.load_buffer(xml_text.data(), xml_text.size(), xml::kLoadFlags, pugi::encoding_utf8);
  if (!parsed) {
    return ParseResult::err(malformed(parsed));
  }

  const pugi::xml_node root = doc.document_element();
  if (!root) {
    return ParseResult::err({ParseErrorKind::kMalformedXml, "", "no document element"});
  }

  const auto names = xml::NameResolver::for_document(root);
  ParseOutput output;
  EntryReader reader(names, options_, output.report);

  if (names.is(root, "entry")) {
    auto entry = reader.read_entry(root);
    if (reader.failed()) {
      return ParseResult::err(reader.error());
    }
    if (entry.has_value()) {
      output.document.entries.push_back(std::move(*entry));
    }
    return ParseResult::ok(std::move(output));
  }

  if (!names.is(root, "lift")) {
    return ParseResult::err({ParseErrorKind::kSchemaViolation, xml::element_path(root),
                             "expected <lift> root element"});
  }

  if (!names.declares_lift_namespace()) {
    output.report.issues.push_back({ParseIssueKind::kUnresolvedNamespace, xml::element_path(root),
                                    "LIFT namespace not declared; matching unqualified names"});
  }
  output.report.lift_version = names.attribute(root, "version");
  output.report.producer = names.attribute(root, "producer");

  for (const pugi::xml_node& child : root.children()) {
    if (names.is(child, "entry")) {
      auto entry = reader.read_entry(child);
      if (reader.failed()) {
        return ParseResult::err(reader.error());
      }
      if (entry.has_value()) {
        output.document.entries.push_back(std::move(*entry));
      }
    } else if (names.is(child, "header")) {
      output.document.header =
          read_header(child, names, &output.report, options_.unknown_elements);
    } else {
      reader.unknown_at_root(child);
    }
  }

  return ParseResult::ok(std::move(output));
}

EntryParseResult LiftParser::parse_entry(std::string_view xml_text) const {
  auto result = parse(xml_text);
  if (!result.has_value()) {
    return EntryParseResult::err(result.error());
  }
  auto& entries = result.value().document.entries;
  if (entries.empty()) {
    return EntryParseResult::err(
        {ParseErrorKind::kSchemaViolation, "", "no entry could be read from the input"});
  }
  return EntryParseResult::ok(std::move(entries.front()));
}

}  // namespace liftkit::codec
