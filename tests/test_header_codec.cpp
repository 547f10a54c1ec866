#include "liftkit/codec/header_codec.h"
#include "liftkit/codec/lift_generator.h"
#include "liftkit/codec/lift_parser.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace liftkit;
using namespace liftkit::codec;

namespace {

model::Header populated_header() {
  model::Header header;
  header.description.set("en", "Sena-English dictionary");
  header.description.set("pt", "Dicionário Sena-Português");
  header.ranges_href = "sena.lift-ranges";
  header.range_refs.push_back({"grammatical-info", "sena.lift-ranges"});
  header.field_declarations.push_back(
      {"cv-pattern", model::Multitext{{"en", "Consonant-vowel pattern"}}});
  header.field_declarations.push_back({"tone", model::Multitext{{"en", "Tone melody"}}});
  return header;
}

}  // namespace

TEST_CASE("Header generate/parse preserves every part", "[header]") {
  const model::Header header = populated_header();

  const auto generated = generate_header(header);
  REQUIRE(generated.has_value());
  const std::string& xml = generated.value();
  REQUIRE(xml.rfind("<header>", 0) == 0);
  REQUIRE(xml.find(R"(<field tag="cv-pattern">)") != std::string::npos);

  auto parsed = parse_header(xml);
  REQUIRE(parsed.has_value());
  REQUIRE(parsed.value() == header);
}

TEST_CASE("Empty header renders nothing", "[header]") {
  const auto generated = generate_header(model::Header{});
  REQUIRE(generated.has_value());
  REQUIRE(generated.value().empty());
}

TEST_CASE("parse_header accepts whole LIFT documents", "[header]") {
  SECTION("Document with a header") {
    auto parsed = parse_header(R"(<lift:lift xmlns:lift="http://fieldworks.sil.org/schemas/lift/0.13">
        <lift:header>
          <lift:ranges href="x.lift-ranges"/>
        </lift:header>
      </lift:lift>)");
    REQUIRE(parsed.has_value());
    REQUIRE(parsed.value().ranges_href == "x.lift-ranges");
  }

  SECTION("Document without a header yields an empty Header") {
    auto parsed = parse_header("<lift version='0.13'><entry id='a'/></lift>");
    REQUIRE(parsed.has_value());
    REQUIRE(parsed.value().empty());
  }

  SECTION("Other roots are rejected") {
    auto parsed = parse_header("<lift-ranges/>");
    REQUIRE_FALSE(parsed.has_value());
    REQUIRE(parsed.error().kind == ParseErrorKind::kSchemaViolation);
  }

  SECTION("Malformed input") {
    auto parsed = parse_header("<header><description></header>");
    REQUIRE_FALSE(parsed.has_value());
    REQUIRE(parsed.error().kind == ParseErrorKind::kMalformedXml);
  }
}

TEST_CASE("Legacy field declarations use the type attribute", "[header]") {
  auto parsed = parse_header(R"(<header><fields><field type="literal-meaning">)"
                             R"(<form lang="en"><text>Literal meaning</text></form>)"
                             R"(</field></fields></header>)");
  REQUIRE(parsed.has_value());
  REQUIRE(parsed.value().field_declarations.size() == 1);
  REQUIRE(parsed.value().field_declarations.front().type == "literal-meaning");
}

TEST_CASE("Inline range content under the header is reported", "[header]") {
  LiftParser parser;
  auto result = parser.parse(R"(<lift xmlns="http://fieldworks.sil.org/schemas/lift/0.13">
      <header>
        <ranges>
          <range id="status"><range-element id="draft"/></range>
        </ranges>
      </header>
    </lift>)");
  REQUIRE(result.has_value());

  const auto& output = result.value();
  REQUIRE(output.document.header.range_refs.size() == 1);
  REQUIRE(output.document.header.range_refs.front().id == "status");
  REQUIRE(output.document.header.range_refs.front().href.empty());
  REQUIRE(output.report.count(ParseIssueKind::kUnknownConstruct) == 1);
}

TEST_CASE("Header edits do not disturb entries", "[header]") {
  LiftParser parser;
  auto first = parser.parse(R"(<lift><header><description><form lang="en"><text>old</text></form>)"
                            R"(</description></header><entry id="a"/></lift>)");
  REQUIRE(first.has_value());

  auto document = first.value().document;
  document.header.description.set("en", "new");
  document.header.ranges_href = "new.lift-ranges";

  REQUIRE(document.entries == first.value().document.entries);
  REQUIRE(document.header != first.value().document.header);
}

TEST_CASE("Unmodeled header children survive a round trip", "[header]") {
  constexpr const char* kDocument = R"(<lift xmlns="http://fieldworks.sil.org/schemas/lift/0.13"
      xmlns:fw="urn:fieldworks">
  <header>
    <description><form lang="en"><text>Sena</text></form></description>
    <fw:project-settings>
      <fw:writing-system id="seh"/>
    </fw:project-settings>
    <fields>
      <field tag="tone">
        <form lang="en"><text>Tone melody</text></form>
        <fw:display order="3"/>
      </field>
    </fields>
  </header>
</lift>)";

  SECTION("Lossless policy keeps them") {
    LiftParser parser;
    auto first = parser.parse(kDocument);
    REQUIRE(first.has_value());

    const auto& header = first.value().document.header;
    REQUIRE(header.extensions.size() == 1);
    REQUIRE(header.extensions.front().name == "fw:project-settings");
    REQUIRE(header.extensions.front().xml.find(R"(xmlns:fw="urn:fieldworks")") !=
            std::string::npos);
    REQUIRE(header.field_declarations.size() == 1);
    REQUIRE(header.field_declarations.front().extensions.size() == 1);
    REQUIRE(first.value().report.count(ParseIssueKind::kUnknownConstruct) == 2);

    LiftGenerator generator;
    auto xml = generator.generate(first.value().document);
    REQUIRE(xml.has_value());
    REQUIRE(xml.value().find("fw:writing-system") != std::string::npos);

    auto second = parser.parse(xml.value());
    REQUIRE(second.has_value());
    REQUIRE(second.value().document.header == header);
  }

  SECTION("Known-subset policy drops and reports them") {
    LiftParser parser(ParseOptions{ParseMode::kLenient, UnknownElementPolicy::kKnownSubset});
    auto result = parser.parse(kDocument);
    REQUIRE(result.has_value());

    const auto& header = result.value().document.header;
    REQUIRE(header.extensions.empty());
    REQUIRE(header.field_declarations.front().extensions.empty());
    REQUIRE(header.field_declarations.front().description.text("en") == "Tone melody");
    REQUIRE(result.value().report.count(ParseIssueKind::kUnknownConstruct) == 2);
  }
}

TEST_CASE("A malformed preserved header element fails generation", "[header]") {
  model::Header header;
  header.extensions.push_back({"broken", "<broken>"});

  const auto generated = generate_header(header);
  REQUIRE_FALSE(generated.has_value());
  REQUIRE(generated.error().kind == GenerateErrorKind::kMalformedPreservedElement);

  model::Document document;
  document.header = header;
  const auto xml = LiftGenerator{}.generate(document);
  REQUIRE_FALSE(xml.has_value());
  REQUIRE(xml.error().path == "/lift/header");
}
