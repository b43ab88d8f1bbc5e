#include "log.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

TEST_CASE("test log file and categories") {
  const char *path = "adoi_test.log";
  std::remove(path);
  adoi::init_logger(spdlog::level::info, "", path);
  spdlog::debug("root debug line");
  spdlog::info("info message");

  auto exporter = adoi::category_logger("export");
  REQUIRE(exporter->name() == "adoi.export");
  REQUIRE(adoi::category_logger("export") == exporter);
  exporter->debug("hidden category message");

  adoi::configure_log_categories({{"export", spdlog::level::debug}});
  REQUIRE(exporter->level() == spdlog::level::debug);
  exporter->debug("category debug message");
  adoi::category_logger("http")->debug("other category debug");

  spdlog::shutdown();
  std::ifstream f(path);
  REQUIRE(f.good());
  std::string content((std::istreambuf_iterator<char>(f)),
                      std::istreambuf_iterator<char>());
  REQUIRE(content.find("info message") != std::string::npos);
  REQUIRE(content.find("root debug line") == std::string::npos);
  REQUIRE(content.find("hidden category message") == std::string::npos);
  REQUIRE(content.find("category debug message") != std::string::npos);
  REQUIRE(content.find("other category debug") == std::string::npos);
  f.close();
  std::remove(path);
}
