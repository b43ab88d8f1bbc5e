#include "pat_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace adoi {

namespace {

std::string trim(const std::string &s) {
  auto first = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
                return std::isspace(c) != 0;
              }).base();
  return first < last ? std::string(first, last) : std::string();
}

std::string read_plain_text(const std::string &path) {
  std::ifstream f(path);
  if (!f) {
    throw std::runtime_error("Failed to open token file " + path);
  }
  std::string line;
  while (std::getline(f, line)) {
    std::string value = trim(line);
    if (!value.empty()) {
      return value;
    }
  }
  return {};
}

} // namespace

/**
 * Load a personal access token from a supported file.
 *
 * @param path Filesystem path to the token file.
 * @return Token found in the file.
 * @throws std::runtime_error When the file cannot be parsed or is empty.
 */
std::string load_pat_from_file(const std::string &path) {
  std::string ext;
  auto pos = path.find_last_of('.');
  auto slash = path.find_last_of("/\\");
  if (pos != std::string::npos && (slash == std::string::npos || pos > slash)) {
    ext = path.substr(pos + 1);
  }
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  std::string token;
  if (ext == "yaml" || ext == "yml") {
    YAML::Node node = YAML::LoadFile(path);
    if (node.IsScalar()) {
      token = node.as<std::string>();
    } else if (node.IsMap()) {
      if (node["pat"]) {
        token = node["pat"].as<std::string>();
      } else if (node["token"]) {
        token = node["token"].as<std::string>();
      }
    }
  } else if (ext == "json") {
    std::ifstream f(path);
    if (!f) {
      throw std::runtime_error("Failed to open token file " + path);
    }
    nlohmann::json j;
    f >> j;
    if (j.is_string()) {
      token = j.get<std::string>();
    } else if (j.is_object()) {
      if (j.contains("pat")) {
        token = j["pat"].get<std::string>();
      } else if (j.contains("token")) {
        token = j["token"].get<std::string>();
      }
    }
  } else if (ext == "toml" || ext == "tml") {
    toml::table tbl = toml::parse_file(path);
    if (auto pat = tbl["pat"].value<std::string>()) {
      token = *pat;
    } else if (auto single = tbl["token"].value<std::string>()) {
      token = *single;
    }
  } else {
    token = read_plain_text(path);
  }
  token = trim(token);
  if (token.empty()) {
    throw std::runtime_error("No personal access token found in " + path);
  }
  return token;
}

std::optional<std::string> pat_from_environment() {
  for (const char *name : {"PAT", "ADO_PAT"}) {
    const char *value = std::getenv(name);
    if (value != nullptr) {
      std::string token = trim(value);
      if (!token.empty()) {
        return token;
      }
    }
  }
  return std::nullopt;
}

} // namespace adoi
