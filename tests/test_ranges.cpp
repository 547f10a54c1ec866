#include "liftkit/ranges/range_registry.h"
#include "liftkit/ranges/ranges_codec.h"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <utility>
#include <vector>

using namespace liftkit;
using namespace liftkit::ranges;

namespace {

const char* kRangesFile = R"(<?xml version="1.0" encoding="UTF-8"?>
<lift-ranges>
  <range id="grammatical-info" guid="b0000000-0000-0000-0000-000000000001">
    <label><form lang="en"><text>Parts of speech</text></form></label>
    <range-element id="Noun">
      <label><form lang="en"><text>Noun</text></form></label>
      <abbrev><form lang="en"><text>n</text></form></abbrev>
      <field type="reverse-abbrev"><form lang="en"><text>n of</text></form></field>
    </range-element>
    <range-element id="Proper Noun" parent="Noun">
      <label><form lang="en"><text>Proper noun</text></form></label>
    </range-element>
    <range-element id="Verb">
      <abbrev>v</abbrev>
      <trait name="catalog-source-id" value="verb"/>
    </range-element>
    <range-element>
      <label><form lang="en"><text>no id</text></form></label>
    </range-element>
  </range>
  <range id="semantic-domain-ddp4">
    <range-element id="1 Universe">
      <range-element id="1.1 Sky">
        <range-element id="1.1.1 Sun"/>
      </range-element>
    </range-element>
    <range-element id="2 Person"/>
  </range>
  <range id="status">
    <range-element id="Noun"/>
  </range>
</lift-ranges>)";

RangeSet parse_ok(const std::string& xml) {
  auto result = parse_ranges(xml);
  REQUIRE(result.has_value());
  return result.value();
}

}  // namespace

TEST_CASE("Ranges file parses ranges and elements", "[ranges]") {
  const RangeSet set = parse_ok(kRangesFile);
  REQUIRE(set.ranges.size() == 3);

  const Range* pos = set.find_range("grammatical-info");
  REQUIRE(pos != nullptr);
  REQUIRE(pos->guid == "b0000000-0000-0000-0000-000000000001");
  REQUIRE(pos->label.text("en") == "Parts of speech");
  REQUIRE(pos->elements.size() == 3);

  const RangeElement* noun = pos->find_element("Noun");
  REQUIRE(noun != nullptr);
  REQUIRE(noun->label.text("en") == "Noun");
  REQUIRE(noun->abbrev.text("en") == "n");
  REQUIRE_FALSE(noun->parent.has_value());
  REQUIRE(model::find_field(noun->fields, kReverseAbbrevField) != nullptr);

  REQUIRE(pos->find_element("Proper Noun")->parent == "Noun");

  const RangeElement* verb = pos->find_element("Verb");
  REQUIRE(verb->abbrev.text("und") == "v");
  REQUIRE(verb->traits.size() == 1);

  REQUIRE(set.find_range("missing") == nullptr);
}

TEST_CASE("Nested range elements flatten with parent links", "[ranges]") {
  const RangeSet set = parse_ok(kRangesFile);
  const Range* domains = set.find_range("semantic-domain-ddp4");
  REQUIRE(domains != nullptr);
  REQUIRE(domains->elements.size() == 4);

  REQUIRE(domains->elements[0].id == "1 Universe");
  REQUIRE_FALSE(domains->elements[0].parent.has_value());
  REQUIRE(domains->elements[1].id == "1.1 Sky");
  REQUIRE(domains->elements[1].parent == "1 Universe");
  REQUIRE(domains->elements[2].id == "1.1.1 Sun");
  REQUIRE(domains->elements[2].parent == "1.1 Sky");
  REQUIRE(domains->elements[3].id == "2 Person");
  REQUIRE_FALSE(domains->elements[3].parent.has_value());
}

TEST_CASE("Ranges accepted from other containers", "[ranges]") {
  SECTION("Single range root") {
    const RangeSet set = parse_ok(R"(<range id="status"><range-element id="draft"/></range>)");
    REQUIRE(set.ranges.size() == 1);
    REQUIRE(set.ranges.front().elements.front().id == "draft");
  }

  SECTION("Inline ranges in a LIFT header; bare references are skipped") {
    const RangeSet set = parse_ok(R"(<lift xmlns="http://fieldworks.sil.org/schemas/lift/0.13">
        <header>
          <ranges>
            <range id="grammatical-info" href="x.lift-ranges"/>
            <range id="status"><range-element id="draft"/></range>
          </ranges>
        </header>
      </lift>)");
    REQUIRE(set.ranges.size() == 1);
    REQUIRE(set.ranges.front().id == "status");
  }

  SECTION("Unknown root is rejected") {
    auto result = parse_ranges("<vocabulary/>");
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == RangesErrorKind::kSchemaViolation);
  }

  SECTION("Malformed XML is rejected") {
    auto result = parse_ranges("<lift-ranges><range id='x'></lift-ranges>");
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == RangesErrorKind::kMalformedXml);
    REQUIRE(to_string(result.error().kind) == "MalformedXml");
  }
}

TEST_CASE("generate_ranges output parses back to the same set", "[ranges]") {
  const RangeSet set = parse_ok(kRangesFile);
  const std::string xml = generate_ranges(set);

  REQUIRE(xml.find("<lift-ranges>") != std::string::npos);
  REQUIRE(xml.find(R"(parent="1 Universe")") != std::string::npos);
  REQUIRE(parse_ok(xml) == set);
}

TEST_CASE("RangeRegistry lookups", "[ranges][registry]") {
  const RangeRegistry registry(parse_ok(kRangesFile));

  REQUIRE(registry.has_range("grammatical-info"));
  REQUIRE_FALSE(registry.has_range("usage-type"));
  REQUIRE(registry.contains("grammatical-info", "Verb"));
  REQUIRE_FALSE(registry.contains("grammatical-info", "Adverb"));
  REQUIRE_FALSE(registry.contains("usage-type", "Verb"));

  const RangeElement* sun = registry.find_element("semantic-domain-ddp4", "1.1.1 Sun");
  REQUIRE(sun != nullptr);
  REQUIRE(sun->parent == "1.1 Sky");

  REQUIRE(registry.range_ids() ==
          std::vector<std::string>{"grammatical-info", "semantic-domain-ddp4", "status"});

  SECTION("find_element_anywhere lists every range holding the id") {
    const auto locations = registry.find_element_anywhere("Noun");
    REQUIRE(locations.size() == 2);
    REQUIRE(locations[0].range->id == "grammatical-info");
    REQUIRE(locations[1].range->id == "status");
    REQUIRE(locations[0].element->label.text("en") == "Noun");
  }

  SECTION("Hierarchy navigation") {
    const auto children = registry.children("semantic-domain-ddp4", "1 Universe");
    REQUIRE(children.size() == 1);
    REQUIRE(children.front()->id == "1.1 Sky");

    const auto roots = registry.roots("semantic-domain-ddp4");
    REQUIRE(roots.size() == 2);
    REQUIRE(roots[0]->id == "1 Universe");
    REQUIRE(roots[1]->id == "2 Person");

    const auto ancestors = registry.ancestors("semantic-domain-ddp4", "1.1.1 Sun");
    REQUIRE(ancestors.size() == 2);
    REQUIRE(ancestors[0]->id == "1.1 Sky");
    REQUIRE(ancestors[1]->id == "1 Universe");
  }
}

TEST_CASE("RangeRegistry tolerates cycles and duplicates", "[ranges][registry]") {
  RangeSet set;
  Range range;
  range.id = "loop";
  range.elements.push_back({"a", std::nullopt, "b", {}, {}, {}, {}, {}});
  range.elements.push_back({"b", std::nullopt, "a", {}, {}, {}, {}, {}});
  RangeElement duplicate;
  duplicate.id = "a";
  duplicate.label.set("en", "second");
  range.elements.push_back(duplicate);
  set.ranges.push_back(range);

  Range shadowed;
  shadowed.id = "loop";
  set.ranges.push_back(shadowed);

  const RangeRegistry registry(std::move(set));

  REQUIRE(registry.find_element("loop", "a")->label.empty());
  REQUIRE(registry.ancestors("loop", "a").size() == 1);
  REQUIRE(registry.find_range("loop")->elements.size() == 3);
  REQUIRE(registry.range_ids().size() == 1);
}
