#include "cli_io.h"
#include "inspect_logic.h"
#include "normalize_logic.h"
#include "ranges_logic.h"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

const char* kLift = R"(<lift:lift xmlns:lift="http://fieldworks.sil.org/schemas/lift/0.13" version="0.13">
  <lift:entry id="a">
    <lift:lexical-unit><lift:form lang="en"><lift:text>apple</lift:text></lift:form></lift:lexical-unit>
    <lift:sense id="a_s1"><lift:grammatical-info value="Nonu"/></lift:sense>
    <lift:relation type="synonym" ref="nowhere"/>
    <lift:illustration href="apple.png"/>
  </lift:entry>
</lift:lift>)";

const char* kRanges = R"(<lift-ranges>
  <range id="grammatical-info"><range-element id="Noun"/></range>
  <range id="status"><range-element id="draft"/></range>
</lift-ranges>)";

}  // namespace

TEST_CASE("normalize regenerates canonical LIFT", "[cli]") {
  std::ostringstream diagnostics;
  NormalizeRequest request;
  request.generate.producer = "cli-test";

  auto result = execute_normalize(kLift, request, diagnostics);
  REQUIRE(result.has_value());

  const auto& xml = result.value();
  REQUIRE(xml.find("<lift xmlns=") != std::string::npos);
  REQUIRE(xml.find(R"(producer="cli-test")") != std::string::npos);
  REQUIRE(xml.find("<illustration href=\"apple.png\"") != std::string::npos);
  REQUIRE(diagnostics.str().find("[UnknownConstruct]") != std::string::npos);

  SECTION("Known-subset drops the unknown element") {
    NormalizeRequest subset;
    subset.parse.unknown_elements = liftkit::codec::UnknownElementPolicy::kKnownSubset;
    auto dropped = execute_normalize(kLift, subset, diagnostics);
    REQUIRE(dropped.has_value());
    REQUIRE(dropped.value().find("illustration") == std::string::npos);
  }

  SECTION("Malformed input becomes an error message") {
    auto failed = execute_normalize("<lift><entry>", request, diagnostics);
    REQUIRE_FALSE(failed.has_value());
    REQUIRE(failed.error().rfind("MalformedXml", 0) == 0);
  }
}

TEST_CASE("to-json renders documents and single entries", "[cli]") {
  std::ostringstream diagnostics;
  const liftkit::codec::ParseOptions options;

  auto document = execute_to_json(kLift, options, std::nullopt, diagnostics);
  REQUIRE(document.has_value());
  REQUIRE(document.value().at("entries").size() == 1);

  auto entry = execute_to_json(kLift, options, std::string{"a"}, diagnostics);
  REQUIRE(entry.has_value());
  REQUIRE(entry.value().at("lexical_unit").at("en") == "apple");

  auto missing = execute_to_json(kLift, options, std::string{"zzz"}, diagnostics);
  REQUIRE_FALSE(missing.has_value());
  REQUIRE(missing.error() == "no entry with id 'zzz'");
}

TEST_CASE("languages summarizes vocabularies", "[cli]") {
  std::ostringstream diagnostics;
  auto result = execute_languages(kLift, {}, diagnostics);
  REQUIRE(result.has_value());

  const auto& out = result.value();
  REQUIRE(out.at("languages") == nlohmann::json::array({"en"}));
  REQUIRE(out.at("relation_types") == nlohmann::json::array({"synonym"}));
  REQUIRE(out.at("variant_types").empty());
}

TEST_CASE("ranges command selects a range", "[cli]") {
  auto all = execute_ranges(kRanges, std::nullopt);
  REQUIRE(all.has_value());
  REQUIRE(all.value().size() == 2);

  auto one = execute_ranges(kRanges, std::string{"status"});
  REQUIRE(one.has_value());
  REQUIRE(one.value().at("elements")[0].at("id") == "draft");

  auto unknown = execute_ranges(kRanges, std::string{"nope"});
  REQUIRE_FALSE(unknown.has_value());

  auto malformed = execute_ranges("<lift-ranges>", std::nullopt);
  REQUIRE_FALSE(malformed.has_value());
}

TEST_CASE("check reports range warnings and dangling relations", "[cli]") {
  std::ostringstream diagnostics;
  auto result = execute_check(kLift, kRanges, {}, {}, diagnostics);
  REQUIRE(result.has_value());

  const auto& out = result.value();
  REQUIRE(out.at("entries") == 1);
  REQUIRE(out.at("ranges") == nlohmann::json::array({"grammatical-info", "status"}));

  REQUIRE(out.at("warnings").size() == 1);
  REQUIRE(out.at("warnings")[0].at("value") == "Nonu");
  REQUIRE(out.at("warnings")[0].at("location") == "sense[a_s1]/grammatical-info");

  REQUIRE(out.at("dangling_relations").size() == 1);
  REQUIRE(out.at("dangling_relations")[0].at("ref") == "nowhere");

  REQUIRE(diagnostics.str().find("[RangeReferenceUnresolved] entry a") != std::string::npos);
}

TEST_CASE("read_input and write_output use files", "[cli]") {
  const auto path = std::filesystem::temp_directory_path() / "liftkit_cli_logic_test.lift";

  auto written = write_output(path.string(), "<lift/>");
  REQUIRE(written.has_value());

  auto read = read_input(path.string());
  REQUIRE(read.has_value());
  REQUIRE(read.value() == "<lift/>");

  std::filesystem::remove(path);

  auto missing = read_input(path.string());
  REQUIRE_FALSE(missing.has_value());
}

TEST_CASE("print_report writes one line per issue", "[cli]") {
  liftkit::codec::ParseReport report;
  report.issues.push_back(
      {liftkit::codec::ParseIssueKind::kSkippedConstruct, "/lift/entry[2]", "entry without id"});

  std::ostringstream out;
  print_report(report, out);
  REQUIRE(out.str() == "[SkippedConstruct] /lift/entry[2]: entry without id\n");
}
