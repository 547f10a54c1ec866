#include "liftkit/codec/lift_generator.h"
#include "liftkit/codec/lift_parser.h"

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <string>

using namespace liftkit;
using namespace liftkit::codec;

namespace {

model::Field field(const std::string& type, const std::string& lang, const std::string& text) {
  model::Field result;
  result.type = type;
  result.content.set(lang, text);
  return result;
}

model::Pronunciation pronunciation() {
  model::Pronunciation result;
  result.form.set("seh-fonipa", "ku.tʃa");
  model::Media media;
  media.href = "audio/kucha.wav";
  media.label.set("en", "careful speech");
  result.media.push_back(media);
  result.fields.push_back(field("cv-pattern", "en", "CVCV"));
  result.traits.push_back({"tone", "LH"});
  return result;
}

model::Sense rich_sense() {
  model::Sense sense;
  sense.id = "s1";
  sense.order = 1;
  sense.grammatical_info = model::GrammaticalInfo{"Verb", {{"transitivity", "transitive"}}};
  sense.gloss.set("en", "drink");
  sense.gloss.set("pt", "beber");
  sense.definition.set("en", "to take liquid into the mouth and swallow");

  model::Relation antonym;
  antonym.type = "antonym";
  antonym.ref = "spit_s1";
  antonym.order = 3;
  sense.relations.push_back(antonym);

  model::Example example;
  example.source = "field notes 12";
  example.form.set("seh", "ndamwa madzi");
  example.translations.push_back({"free", model::Multitext{{"en", "I drank water"}}});
  example.translations.push_back({std::nullopt, model::Multitext{{"pt", "bebi água"}}});
  example.notes.push_back({"grammar", model::Multitext{{"en", "past tense"}}});
  sense.examples.push_back(example);

  sense.notes.push_back({std::nullopt, model::Multitext{{"en", "common"}}});
  sense.fields.push_back(field("literal-meaning", "en", "take in"));
  sense.traits.push_back({"semantic-domain-ddp4", "5.2 Food"});
  sense.traits.push_back({"semantic-domain-ddp4", "5.2.3 Drink"});

  model::Annotation annotation;
  annotation.name = "checked";
  annotation.value = "true";
  annotation.who = "editor";
  sense.annotations.push_back(annotation);

  model::Sense subsense;
  subsense.gloss.set("en", "absorb");
  sense.subsenses.push_back(subsense);

  sense.extra_attributes.push_back({"dateCreated", "2023-05-01T10:00:00Z"});
  sense.extensions.push_back(
      {"illustration",
       R"(<illustration href="drink.png"><label><form lang="en"><text>drinking</text></form></label></illustration>)"});
  return sense;
}

model::Entry rich_entry() {
  model::Entry entry;
  entry.id = "kumwa_1";
  entry.guid = "a1b2c3d4-0000-0000-0000-000000000001";
  entry.order = 2;
  entry.date_created = "2023-05-01T10:00:00Z";
  entry.date_modified = "2024-02-11T08:30:00Z";

  entry.lexical_unit.set("seh", "kumwa");
  entry.lexical_unit.set("seh-fonipa", "kumwa");
  entry.citation_form.set("seh", "-mwa");
  entry.pronunciations.push_back(pronunciation());
  entry.grammatical_info = model::GrammaticalInfo{"Verb", {}};
  entry.senses.push_back(rich_sense());

  model::Variant variant;
  variant.form.set("seh", "kumwa-mwa");
  variant.traits.push_back({"morph-type", "stem"});
  variant.grammatical_info = model::GrammaticalInfo{"Verb", {}};
  variant.fields.push_back(field("comment", "en", "reduplicated"));
  entry.variants.push_back(variant);

  model::Variant referenced;
  referenced.ref = "kumwa_2";
  referenced.form.set("seh", "kmwa");
  referenced.pronunciations.push_back(pronunciation());
  entry.variants.push_back(referenced);

  model::Relation component;
  component.type = "_component-lexeme";
  component.ref = "mwa_root";
  component.traits.push_back({"variant-type", "Dialectal Variant"});
  component.traits.push_back({"complex-form-type", "Derivative"});
  entry.relations.push_back(component);

  model::Relation synonym;
  synonym.type = "synonym";
  synonym.ref = "kumwetsa";
  synonym.traits.push_back({"register", "formal"});
  synonym.fields.push_back(field("summary", "en", "near synonym"));
  entry.relations.push_back(synonym);

  model::Etymology etymology;
  etymology.type = "proto";
  etymology.source = "Proto-Bantu";
  etymology.form.set("pbt", "*-nyu-");
  etymology.gloss.set("en", "drink");
  etymology.extra_attributes.push_back({"status", "reconstructed"});
  entry.etymologies.push_back(etymology);

  entry.fields.push_back(field("import-residue", "en", "old id 42"));
  entry.notes.push_back({"bibliography", model::Multitext{{"en", "Martins 1991"}}});
  entry.notes.push_back({std::nullopt, model::Multitext{{"und", "bare note"}}});
  entry.traits.push_back({"morph-type", "root"});
  entry.traits.push_back({"do-not-publish-in", "Mobile"});

  model::Annotation annotation;
  annotation.name = "review";
  annotation.content.set("en", "verify tone");
  entry.annotations.push_back(annotation);

  entry.extensions.push_back(
      {"custom-data", R"(<custom-data kind="sync"><stamp>7</stamp></custom-data>)"});
  return entry;
}

model::Document rich_document() {
  model::Document document;
  document.header.description.set("en", "Sena dictionary");
  document.header.ranges_href = "sena.lift-ranges";
  document.header.range_refs.push_back({"grammatical-info", "sena.lift-ranges"});
  document.header.range_refs.push_back({"semantic-domain-ddp4", "sena.lift-ranges"});
  document.header.field_declarations.push_back(
      {"cv-pattern", model::Multitext{{"en", "Consonant-vowel pattern"}}});
  document.header.extensions.push_back(
      {"project", R"(<project code="seh"><owner>SIL</owner></project>)"});

  document.entries.push_back(rich_entry());

  model::Entry minimal;
  minimal.id = "madzi_1";
  minimal.lexical_unit.set("seh", "madzi");
  document.entries.push_back(minimal);
  return document;
}

model::Document regenerate(const model::Document& document, const GenerateOptions& options) {
  LiftGenerator generator(options);
  auto generated = generator.generate(document);
  REQUIRE(generated.has_value());

  LiftParser parser;
  auto reparsed = parser.parse(generated.value());
  REQUIRE(reparsed.has_value());
  return reparsed.value().document;
}

}  // namespace

TEST_CASE("parse(generate(D)) == D for a fully populated document", "[round_trip]") {
  const model::Document original = rich_document();

  SECTION("Default namespace, indented") {
    REQUIRE(regenerate(original, {}) == original);
  }

  SECTION("Default namespace, compact") {
    GenerateOptions options;
    options.indent = false;
    REQUIRE(regenerate(original, options) == original);
  }

  SECTION("Prefixed elements") {
    GenerateOptions options;
    options.ns_style = NamespaceStyle::kPrefixed;
    REQUIRE(regenerate(original, options) == original);
  }
}

TEST_CASE("Generation is a fixed point after one round trip", "[round_trip]") {
  LiftGenerator generator;
  auto first = generator.generate(rich_document());
  REQUIRE(first.has_value());

  LiftParser parser;
  auto reparsed = parser.parse(first.value());
  REQUIRE(reparsed.has_value());

  auto second = generator.generate(reparsed.value().document);
  REQUIRE(second.has_value());
  REQUIRE(second.value() == first.value());
}

TEST_CASE("Unknown elements survive parse-generate-parse", "[round_trip][policy]") {
  const char* input = R"(<?xml version="1.0" encoding="UTF-8"?>
<lift version="0.13" xmlns="http://fieldworks.sil.org/schemas/lift/0.13" xmlns:fw="urn:example:fw">
  <entry id="e1">
    <lexical-unit><form lang="en"><text>tree</text></form></lexical-unit>
    <sense id="s1">
      <gloss lang="en"><text>tree</text></gloss>
      <illustration href="tree.jpg">
        <label><form lang="en"><text>a baobab</text></form></label>
      </illustration>
      <reversal type="en"><form lang="en"><text>tree</text></form></reversal>
    </sense>
    <fw:sync-state revision="9">clean</fw:sync-state>
  </entry>
</lift>)";

  LiftParser parser;
  auto first = parser.parse(input);
  REQUIRE(first.has_value());

  const auto& entry = first.value().document.entries.front();
  REQUIRE(entry.senses.front().extensions.size() == 2);
  REQUIRE(entry.extensions.size() == 1);

  LiftGenerator generator;
  auto generated = generator.generate(first.value().document);
  REQUIRE(generated.has_value());

  auto second = parser.parse(generated.value());
  REQUIRE(second.has_value());
  REQUIRE(second.value().document == first.value().document);
}

TEST_CASE("Concrete relation scenario reparses to the same relation", "[round_trip][relation]") {
  model::Entry entry;
  entry.id = "test_entry";
  entry.lexical_unit.set("en", "test");
  model::Relation relation;
  relation.type = "synonym";
  relation.ref = "test_ref";
  relation.traits.push_back({"variant-type", "informal"});
  entry.relations.push_back(relation);

  model::Document document;
  document.entries.push_back(entry);

  const auto reparsed = regenerate(document, {});
  REQUIRE(reparsed.entries.size() == 1);
  REQUIRE(reparsed.entries.front().relations.size() == 1);
  REQUIRE(reparsed.entries.front().relations.front() == relation);
}
