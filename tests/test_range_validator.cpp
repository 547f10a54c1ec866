#include "liftkit/codec/lift_parser.h"
#include "liftkit/ranges/ranges_codec.h"
#include "liftkit/validation/range_validator.h"

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <string>
#include <utility>

using namespace liftkit;
using namespace liftkit::validation;

namespace {

const char* kRanges = R"(<lift-ranges>
  <range id="grammatical-info">
    <range-element id="Noun"/>
    <range-element id="Verb"/>
  </range>
  <range id="lexical-relation">
    <range-element id="synonym"/>
    <range-element id="antonym"/>
  </range>
  <range id="variant-type">
    <range-element id="Spelling Variant"/>
  </range>
  <range id="morph-type">
    <range-element id="stem"/>
    <range-element id="root"/>
  </range>
</lift-ranges>)";

ranges::RangeRegistry load_registry() {
  auto parsed = ranges::parse_ranges(kRanges);
  REQUIRE(parsed.has_value());
  return ranges::RangeRegistry(std::move(parsed.value()));
}

model::Document load_document(const char* xml) {
  codec::LiftParser parser;
  auto parsed = parser.parse(xml);
  REQUIRE(parsed.has_value());
  return parsed.value().document;
}

}  // namespace

TEST_CASE("Known values produce no warnings", "[validation]") {
  const auto registry = load_registry();
  const RangeValidator validator(registry);

  const auto document = load_document(R"(<lift><entry id="e">
      <grammatical-info value="Noun"/>
      <trait name="morph-type" value="root"/>
      <sense id="s1"><grammatical-info value="Verb"/></sense>
      <variant><form lang="en"><text>grass roots</text></form><trait name="morph-type" value="stem"/></variant>
      <relation type="synonym" ref="x"><trait name="variant-type" value="Spelling Variant"/></relation>
    </entry></lift>)");

  REQUIRE(validator.validate(document).empty());
}

TEST_CASE("Unknown values are reported with their location", "[validation]") {
  const auto registry = load_registry();
  const RangeValidator validator(registry);

  const auto document = load_document(R"(<lift>
    <entry id="e1">
      <sense id="s1">
        <grammatical-info value="Nuon"/>
        <relation type="synonym" ref="a"/>
        <relation type="hypernym" ref="b"/>
      </sense>
      <variant><trait name="morph-type" value="suffix"/></variant>
    </entry>
    <entry id="e2">
      <relation type="_component-lexeme" ref="e1"><trait name="variant-type" value="Typo"/></relation>
    </entry>
  </lift>)");

  const auto warnings = validator.validate(document);
  REQUIRE(warnings.size() == 4);

  REQUIRE(warnings[0].entry_id == "e1");
  REQUIRE(warnings[0].location == "sense[s1]/grammatical-info");
  REQUIRE(warnings[0].range_id == "grammatical-info");
  REQUIRE(warnings[0].value == "Nuon");
  REQUIRE(warnings[0].kind == RangeWarningKind::kRangeReferenceUnresolved);

  REQUIRE(warnings[1].location == "sense[s1]/relation[2]");
  REQUIRE(warnings[1].range_id == "lexical-relation");
  REQUIRE(warnings[1].value == "hypernym");

  REQUIRE(warnings[2].location == "variant[1]");
  REQUIRE(warnings[2].range_id == "morph-type");
  REQUIRE(warnings[2].value == "suffix");

  // Private relation types are not checked; their traits still are.
  REQUIRE(warnings[3].entry_id == "e2");
  REQUIRE(warnings[3].location == "relation[1]");
  REQUIRE(warnings[3].range_id == "variant-type");
  REQUIRE(warnings[3].value == "Typo");
  REQUIRE_FALSE(warnings[3].message.empty());
}

TEST_CASE("Bindings to ranges that are not loaded are skipped", "[validation]") {
  const auto registry = load_registry();
  const RangeValidator validator(registry);

  model::Entry entry;
  entry.id = "e";
  entry.traits.push_back({"usage-type", "anything at all"});
  entry.traits.push_back({"custom-flag", "unbound"});

  REQUIRE(validator.validate_entry(entry).empty());
}

TEST_CASE("Bindings are configurable", "[validation]") {
  const auto registry = load_registry();

  RangeBindings bindings;
  bindings.skip_private_relation_types = false;
  bindings.traits["register"] = "morph-type";
  const RangeValidator validator(registry, bindings);

  model::Entry entry;
  entry.id = "e";
  entry.traits.push_back({"register", "formal"});
  entry.relations.push_back({"_component-lexeme", "x", std::nullopt, {}, {}, {}});

  const auto warnings = validator.validate_entry(entry);
  REQUIRE(warnings.size() == 2);
  REQUIRE(warnings[0].value == "formal");
  REQUIRE(warnings[1].value == "_component-lexeme");
  REQUIRE(to_string(warnings[1].kind) == "RangeReferenceUnresolved");
}

TEST_CASE("Validation leaves the document untouched", "[validation]") {
  const auto registry = load_registry();
  const RangeValidator validator(registry);

  const auto document = load_document(
      R"(<lift><entry id="e"><grammatical-info value="Adverb"/></entry></lift>)");
  const auto copy = document;

  REQUIRE(validator.validate(document).size() == 1);
  REQUIRE(document == copy);
}
