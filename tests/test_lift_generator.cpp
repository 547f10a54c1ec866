#include "liftkit/codec/lift_generator.h"
#include "liftkit/codec/lift_parser.h"

#include <catch2/catch_test_macros.hpp>

#include <pugixml.hpp>

#include <string>
#include <utility>

using namespace liftkit;
using namespace liftkit::codec;

namespace {

model::Entry scenario_entry() {
  model::Entry entry;
  entry.id = "test_entry";
  entry.lexical_unit.set("en", "test");

  model::Relation relation;
  relation.type = "synonym";
  relation.ref = "test_ref";
  relation.traits.push_back({"variant-type", "informal"});
  entry.relations.push_back(relation);
  return entry;
}

std::string generate_ok(const model::Document& document, GenerateOptions options = {}) {
  LiftGenerator generator(std::move(options));
  auto result = generator.generate(document);
  REQUIRE(result.has_value());
  return result.value();
}

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

}  // namespace

TEST_CASE("Relation with trait generates nested trait element", "[generator][relation]") {
  model::Document document;
  document.entries.push_back(scenario_entry());

  const auto xml = generate_ok(document);
  REQUIRE(contains(xml, R"(<relation type="synonym" ref="test_ref">)"));

  pugi::xml_document parsed;
  REQUIRE(parsed.load_string(xml.c_str()));
  const auto relation = parsed.child("lift").child("entry").child("relation");
  REQUIRE(relation);
  const auto trait = relation.child("trait");
  REQUIRE(std::string{trait.attribute("name").value()} == "variant-type");
  REQUIRE(std::string{trait.attribute("value").value()} == "informal");

  LiftParser parser;
  auto reparsed = parser.parse(xml);
  REQUIRE(reparsed.has_value());
  REQUIRE(reparsed.value().document.entries.front().relations == document.entries.front().relations);
}

TEST_CASE("Document root carries version, namespace and producer", "[generator]") {
  model::Document document;
  document.entries.push_back(scenario_entry());

  SECTION("Default namespace style") {
    const auto xml = generate_ok(document);
    REQUIRE(xml.rfind(R"(<?xml version="1.0" encoding="UTF-8"?>)", 0) == 0);
    REQUIRE(contains(xml, R"(xmlns="http://fieldworks.sil.org/schemas/lift/0.13")"));
    REQUIRE(contains(xml, R"(version="0.13")"));
    REQUIRE(contains(xml, R"(producer="liftkit")"));
  }

  SECTION("Prefixed style qualifies every element") {
    GenerateOptions options;
    options.ns_style = NamespaceStyle::kPrefixed;
    options.producer = "FLEx 9.1";
    const auto xml = generate_ok(document, options);

    REQUIRE(contains(xml, "<lift:lift "));
    REQUIRE(contains(xml, R"(xmlns:lift="http://fieldworks.sil.org/schemas/lift/0.13")"));
    REQUIRE(contains(xml, "<lift:entry "));
    REQUIRE(contains(xml, "<lift:relation "));
    REQUIRE(contains(xml, R"(producer="FLEx 9.1")"));
    REQUIRE_FALSE(contains(xml, "<entry "));
  }

  SECTION("Empty producer omits the attribute") {
    GenerateOptions options;
    options.producer.clear();
    REQUIRE_FALSE(contains(generate_ok(document, options), "producer="));
  }
}

TEST_CASE("Empty collections produce no wrapper elements", "[generator]") {
  model::Document document;
  model::Entry entry;
  entry.id = "bare";
  entry.lexical_unit.set("en", "bare");
  document.entries.push_back(entry);

  const auto xml = generate_ok(document);
  for (const char* absent : {"<variant", "<relation", "<field", "<sense", "<trait", "<citation",
                             "<header", "<note", "<pronunciation", "<etymology"}) {
    INFO(absent);
    REQUIRE_FALSE(contains(xml, absent));
  }
  REQUIRE(contains(xml, "<lexical-unit>"));
}

TEST_CASE("Variant regenerates its form and trait", "[generator][variant]") {
  model::Variant variant;
  variant.form.set("en", "grass roots");
  variant.traits.push_back({"morph-type", "stem"});

  model::Entry entry;
  entry.id = "grass";
  entry.variants.push_back(variant);
  model::Document document;
  document.entries.push_back(entry);

  const auto xml = generate_ok(document);

  pugi::xml_document parsed;
  REQUIRE(parsed.load_string(xml.c_str()));
  const auto variant_node = parsed.child("lift").child("entry").child("variant");
  REQUIRE(std::string{variant_node.child("form").attribute("lang").value()} == "en");
  REQUIRE(std::string{variant_node.child("form").child("text").text().get()} == "grass roots");
  REQUIRE(std::string{variant_node.child("trait").attribute("name").value()} == "morph-type");
  REQUIRE(std::string{variant_node.child("trait").attribute("value").value()} == "stem");

  LiftParser parser;
  auto reparsed = parser.parse(xml);
  REQUIRE(reparsed.has_value());
  REQUIRE(reparsed.value().document.entries.front().variants.front() == variant);
}

TEST_CASE("Senses write one gloss element per language", "[generator][sense]") {
  model::Sense sense;
  sense.id = "s1";
  sense.gloss.set("en", "tea");
  sense.gloss.set("pt", "chá");

  model::Entry entry;
  entry.id = "cha";
  entry.senses.push_back(sense);
  model::Document document;
  document.entries.push_back(entry);

  pugi::xml_document parsed;
  REQUIRE(parsed.load_string(generate_ok(document).c_str()));
  const auto sense_node = parsed.child("lift").child("entry").child("sense");
  REQUIRE(std::string{sense_node.attribute("id").value()} == "s1");

  int glosses = 0;
  for (const auto& gloss : sense_node.children("gloss")) {
    REQUIRE(gloss.child("text"));
    ++glosses;
  }
  REQUIRE(glosses == 2);
}

TEST_CASE("Header is emitted only when populated", "[generator][header]") {
  model::Document document;
  document.entries.push_back(scenario_entry());
  REQUIRE_FALSE(contains(generate_ok(document), "<header"));

  document.header.ranges_href = "test.lift-ranges";
  const auto xml = generate_ok(document);
  REQUIRE(contains(xml, "<header>"));
  REQUIRE(contains(xml, R"(<ranges href="test.lift-ranges")"));
  REQUIRE(xml.find("<header>") < xml.find("<entry "));
}

TEST_CASE("Generation preconditions", "[generator][errors]") {
  LiftGenerator generator;

  SECTION("Entry without id is rejected") {
    model::Document document;
    document.entries.push_back(scenario_entry());
    document.entries.emplace_back();

    auto result = generator.generate(document);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == GenerateErrorKind::kMissingEntryId);
    REQUIRE(result.error().path == "/lift/entry[2]");
  }

  SECTION("Corrupted preserved element is rejected") {
    model::Entry entry = scenario_entry();
    entry.extensions.push_back({"illustration", "<illustration href='x'>"});

    auto result = generator.generate_entry(entry);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == GenerateErrorKind::kMalformedPreservedElement);
    REQUIRE(to_string(result.error().kind) == "MalformedPreservedElement");
  }

  SECTION("Blank entry id is rejected") {
    model::Entry entry = scenario_entry();
    entry.id = "  \t";

    auto result = generator.generate_entry(entry);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == GenerateErrorKind::kMissingEntryId);
    REQUIRE(result.error().path == "/entry");
  }

  SECTION("Trait without name is rejected") {
    model::Entry entry = scenario_entry();
    entry.senses.emplace_back();
    entry.senses.front().traits.push_back({"", "orphan"});

    auto result = generator.generate_entry(entry);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == GenerateErrorKind::kMissingTraitName);
    REQUIRE(to_string(result.error().kind) == "MissingTraitName");
  }

  SECTION("Trait without name inside a field is rejected") {
    model::Entry entry = scenario_entry();
    model::Field field;
    field.type = "comment";
    field.traits.push_back({"", "x"});
    entry.fields.push_back(field);

    auto result = generator.generate_entry(entry);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == GenerateErrorKind::kMissingTraitName);
  }

  SECTION("Field without type is rejected") {
    model::Document document;
    document.entries.push_back(scenario_entry());
    document.entries.front().relations.front().fields.push_back(model::Field{});

    auto result = generator.generate(document);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == GenerateErrorKind::kMissingFieldType);
    REQUIRE(result.error().path == "/lift/entry[1]");
  }

  SECTION("Extra attribute shadowing a modeled one is rejected") {
    model::Entry entry = scenario_entry();
    entry.extra_attributes.push_back({"id", "other"});

    auto result = generator.generate_entry(entry);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == GenerateErrorKind::kInvalidExtraAttribute);
  }

  SECTION("Extra attribute without a name is rejected") {
    model::Entry entry = scenario_entry();
    entry.relations.front().extra_attributes.push_back({"", "v"});

    auto result = generator.generate_entry(entry);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == GenerateErrorKind::kInvalidExtraAttribute);
  }
}

TEST_CASE("Extra attributes follow the modeled ones", "[generator]") {
  GenerateOptions options;
  options.indent = false;
  LiftGenerator generator(options);

  model::Entry entry = scenario_entry();
  entry.relations.front().extra_attributes.push_back({"dateCreated", "2024-05-01T10:00:00Z"});

  auto result = generator.generate_entry(entry);
  REQUIRE(result.has_value());
  REQUIRE(contains(result.value(),
                   R"(<relation type="synonym" ref="test_ref" dateCreated="2024-05-01T10:00:00Z">)"));

  LiftParser parser;
  auto reparsed = parser.parse_entry(result.value());
  REQUIRE(reparsed.has_value());
  REQUIRE(reparsed.value() == entry);
}

TEST_CASE("Single entry generation declares the namespace on the entry", "[generator][fragment]") {
  GenerateOptions options;
  options.indent = false;
  LiftGenerator generator(options);

  auto result = generator.generate_entry(scenario_entry());
  REQUIRE(result.has_value());

  const auto& xml = result.value();
  REQUIRE(xml.rfind(R"(<entry xmlns="http://fieldworks.sil.org/schemas/lift/0.13" id="test_entry">)",
                    0) == 0);
  REQUIRE_FALSE(contains(xml, "<?xml"));

  LiftParser parser;
  auto reparsed = parser.parse_entry(xml);
  REQUIRE(reparsed.has_value());
  REQUIRE(reparsed.value() == scenario_entry());
}
