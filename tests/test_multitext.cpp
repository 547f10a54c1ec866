#include "liftkit/model/multitext.h"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using liftkit::model::Multitext;

TEST_CASE("Multitext maps languages to text", "[multitext]") {
  SECTION("default-constructed multitext is empty") {
    const Multitext text;
    REQUIRE(text.empty());
    REQUIRE(text.size() == 0);
    REQUIRE(text.find("en") == nullptr);
    REQUIRE(text.text("en").empty());
  }

  SECTION("set on an existing language overwrites in place") {
    Multitext text;
    text.set("en", "first");
    text.set("fr", "premier");
    text.set("en", "second");

    REQUIRE(text.size() == 2);
    REQUIRE(text.text("en") == "second");
    REQUIRE(text.languages() == std::vector<std::string>{"en", "fr"});
  }

  SECTION("erase removes a single language") {
    Multitext text{{"en", "test"}, {"seh", "teste"}};
    REQUIRE(text.erase("en"));
    REQUIRE_FALSE(text.erase("en"));
    REQUIRE(text.size() == 1);
    REQUIRE(text.contains("seh"));
  }

  SECTION("initializer list applies last-wins") {
    const Multitext text{{"en", "a"}, {"en", "b"}};
    REQUIRE(text.size() == 1);
    REQUIRE(text.text("en") == "b");
  }
}

TEST_CASE("Multitext equality ignores insertion order", "[multitext]") {
  const Multitext a{{"en", "test"}, {"fr", "essai"}};
  const Multitext b{{"fr", "essai"}, {"en", "test"}};
  const Multitext c{{"en", "test"}, {"fr", "autre"}};
  const Multitext d{{"en", "test"}};

  REQUIRE(a == b);
  REQUIRE_FALSE(a == c);
  REQUIRE_FALSE(a == d);
  REQUIRE_FALSE(d == a);
}
