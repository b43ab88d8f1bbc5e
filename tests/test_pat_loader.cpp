#include "pat_loader.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace adoi;

namespace {

void write(const char *path, const std::string &content) {
  std::ofstream f(path);
  f << content;
}

} // namespace

TEST_CASE("test pat from plain text file") {
  write("adoi_pat.txt", "\n   \n  abc123  \nignored\n");
  REQUIRE(load_pat_from_file("adoi_pat.txt") == "abc123");
  write("adoi_pat", "noext\n");
  REQUIRE(load_pat_from_file("adoi_pat") == "noext");
  std::remove("adoi_pat.txt");
  std::remove("adoi_pat");
}

TEST_CASE("test pat from structured files") {
  write("adoi_pat.json", R"({"pat":"from-json"})");
  REQUIRE(load_pat_from_file("adoi_pat.json") == "from-json");
  write("adoi_pat.json", R"("bare-json")");
  REQUIRE(load_pat_from_file("adoi_pat.json") == "bare-json");

  write("adoi_pat.yaml", "token: from-yaml\n");
  REQUIRE(load_pat_from_file("adoi_pat.yaml") == "from-yaml");

  write("adoi_pat.toml", "pat = \"from-toml\"\n");
  REQUIRE(load_pat_from_file("adoi_pat.toml") == "from-toml");

  std::remove("adoi_pat.json");
  std::remove("adoi_pat.yaml");
  std::remove("adoi_pat.toml");
}

TEST_CASE("test pat file without token") {
  write("adoi_empty.txt", "\n  \n");
  REQUIRE_THROWS_AS(load_pat_from_file("adoi_empty.txt"), std::runtime_error);
  write("adoi_empty.json", R"({"other":"x"})");
  REQUIRE_THROWS_AS(load_pat_from_file("adoi_empty.json"), std::runtime_error);
  REQUIRE_THROWS_AS(load_pat_from_file("adoi_missing_file.txt"),
                    std::runtime_error);
  std::remove("adoi_empty.txt");
  std::remove("adoi_empty.json");
}

TEST_CASE("test pat from environment") {
  unsetenv("PAT");
  unsetenv("ADO_PAT");
  REQUIRE_FALSE(pat_from_environment().has_value());

  setenv("ADO_PAT", "fallback", 1);
  REQUIRE(pat_from_environment() == std::string("fallback"));

  setenv("PAT", "primary", 1);
  REQUIRE(pat_from_environment() == std::string("primary"));

  setenv("PAT", "   ", 1);
  REQUIRE(pat_from_environment() == std::string("fallback"));

  unsetenv("PAT");
  unsetenv("ADO_PAT");
}
