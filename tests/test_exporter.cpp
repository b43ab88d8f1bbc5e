#include "exporter.hpp"
#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>

using namespace adoi;

namespace {

std::vector<Row> sample_rows() {
  Row first;
  first["project"] = "Alpha";
  first["repository"] = "web";
  first["pullRequestId"] = 42;
  first["title"] = "Fix, then \"ship\"";
  first["isDraft"] = false;
  Row second;
  second["project"] = "Beta";
  second["repository"] = "api";
  second["pullRequestId"] = 7;
  second["title"] = "Plain";
  second["isDraft"] = true;
  second["reviewers"] = Row::array({"Lee (Approved)", "Sam (No vote)"});
  return {first, second};
}

std::string read_file(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

std::size_t count_lines(const std::string &text) {
  std::size_t n = 0;
  for (char c : text) {
    if (c == '\n') {
      ++n;
    }
  }
  return n;
}

} // namespace

TEST_CASE("test export format from extension") {
  REQUIRE(export_format_for("out.csv") == ExportFormat::Csv);
  REQUIRE(export_format_for("dir/out.CSV") == ExportFormat::Csv);
  REQUIRE(export_format_for("out.json") == ExportFormat::Json);
  REQUIRE(export_format_for("out.Xml") == ExportFormat::Xml);
  REQUIRE_THROWS_AS(export_format_for("out.txt"), ExportError);
  REQUIRE_THROWS_AS(export_format_for("out"), ExportError);
}

TEST_CASE("test csv escaping") {
  REQUIRE(escape_csv_field("plain") == "plain");
  REQUIRE(escape_csv_field("a,b") == "\"a,b\"");
  REQUIRE(escape_csv_field("say \"hi\"") == "\"say \"\"hi\"\"\"");
  REQUIRE(escape_csv_field("two\nlines") == "\"two\nlines\"");
}

TEST_CASE("test csv render") {
  std::string csv = render_csv(sample_rows());
  std::istringstream in(csv);
  std::string header;
  std::string line1;
  std::string line2;
  std::getline(in, header);
  std::getline(in, line1);
  std::getline(in, line2);
  REQUIRE(header == "project,repository,pullRequestId,title,isDraft,reviewers");
  REQUIRE(line1 == "Alpha,web,42,\"Fix, then \"\"ship\"\"\",false,");
  REQUIRE(line2 == "Beta,api,7,Plain,true,Lee (Approved); Sam (No vote)");
  REQUIRE(count_lines(csv) == 3);
}

TEST_CASE("test csv render of no rows") {
  REQUIRE(render_csv({}).empty());
}

TEST_CASE("test json render") {
  auto rows = sample_rows();
  std::string pretty = render_json(rows, true);
  std::string compact = render_json(rows, false);
  REQUIRE(pretty.find("\n  {") != std::string::npos);
  REQUIRE(count_lines(compact) == 1);

  auto parsed = nlohmann::json::parse(compact);
  REQUIRE(parsed.is_array());
  REQUIRE(parsed.size() == 2);
  REQUIRE(parsed[0]["title"] == "Fix, then \"ship\"");
  REQUIRE(parsed[1]["reviewers"].size() == 2);
  REQUIRE(nlohmann::json::parse(pretty) == parsed);

  REQUIRE(render_json({}, false) == "[]\n");
}

TEST_CASE("test xml render") {
  std::string xml = render_xml(sample_rows());
  REQUIRE(xml.find("<?xml") == 0);
  REQUIRE(xml.find("<Records>") != std::string::npos);
  REQUIRE(xml.find("<Record>") != std::string::npos);
  REQUIRE(xml.find("<project>Alpha</project>") != std::string::npos);
  REQUIRE(xml.find("<pullRequestId>42</pullRequestId>") != std::string::npos);
  REQUIRE(xml.find("<Item>Lee (Approved)</Item>") != std::string::npos);
  REQUIRE(xml.find("<isDraft>true</isDraft>") != std::string::npos);
}

TEST_CASE("test export writes file and is repeatable") {
  auto dir = std::filesystem::temp_directory_path() / "adoi_export_test";
  std::filesystem::create_directories(dir);
  auto path = (dir / "records.csv").string();

  export_rows(sample_rows(), path);
  std::string first = read_file(path);
  export_rows(sample_rows(), path);
  std::string second = read_file(path);
  REQUIRE(first == second);
  REQUIRE(count_lines(first) == 3);

  auto json_path = (dir / "records.JSON").string();
  ExportOptions options;
  options.pretty_json = false;
  export_rows(sample_rows(), json_path, options);
  REQUIRE(count_lines(read_file(json_path)) == 1);

  std::filesystem::remove_all(dir);
}

TEST_CASE("test export to unwritable location") {
  auto path = (std::filesystem::temp_directory_path() / "adoi_missing_dir" /
               "nested" / "out.csv")
                  .string();
  REQUIRE_THROWS_AS(export_rows(sample_rows(), path), ExportError);
  REQUIRE_THROWS_AS(export_rows(sample_rows(), "out.txt"), ExportError);
}
