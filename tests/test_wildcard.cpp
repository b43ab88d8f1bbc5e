#include "util/wildcard.hpp"
#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

using namespace adoi;

TEST_CASE("test wildcard match") {
  REQUIRE(wildcard_match("anything", "*"));
  REQUIRE(wildcard_match("", "*"));
  REQUIRE(wildcard_match("FooBar", "Foo*"));
  REQUIRE(wildcard_match("Foo", "Foo*"));
  REQUIRE_FALSE(wildcard_match("BarFoo", "Foo*"));
  REQUIRE(wildcard_match("web-api", "*-api"));
  REQUIRE(wildcard_match("svc1", "svc?"));
  REQUIRE_FALSE(wildcard_match("svc10", "svc?"));
  REQUIRE(wildcard_match("a-b-c", "a*b*c"));
  REQUIRE_FALSE(wildcard_match("a-b-d", "a*b*c"));
  REQUIRE(wildcard_match("exact", "exact"));
  REQUIRE_FALSE(wildcard_match("exact", "exac"));
}

TEST_CASE("test wildcard match ignores case") {
  REQUIRE(wildcard_match("FooBar", "foo*"));
  REQUIRE(wildcard_match("platform", "PLAT*"));
  REQUIRE(wildcard_match("Infra", "iNfRa"));
}

TEST_CASE("test matches any") {
  std::vector<std::string> none;
  REQUIRE(matches_any("whatever", none));

  std::vector<std::string> patterns{"Foo*", "*-infra"};
  REQUIRE(matches_any("FooBar", patterns));
  REQUIRE(matches_any("team-infra", patterns));
  REQUIRE_FALSE(matches_any("Other", patterns));
}

TEST_CASE("test filter by patterns") {
  std::vector<std::string> names{"Alpha", "Beta", "alpine", "Gamma"};
  auto identity = [](const std::string &s) { return s; };

  auto kept = filter_by_patterns(names, {"al*"}, identity);
  REQUIRE(kept == std::vector<std::string>{"Alpha", "alpine"});

  auto all = filter_by_patterns(names, {}, identity);
  REQUIRE(all.size() == 4);

  auto nothing = filter_by_patterns(names, {"zeta"}, identity);
  REQUIRE(nothing.empty());
}
