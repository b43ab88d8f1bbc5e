#include "config.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace adoi {

namespace {

std::shared_ptr<spdlog::logger> config_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("config");
  }();
  return logger;
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

/**
 * Convert a YAML node into a structurally equivalent JSON object.
 *
 * Plain scalars that read fully as booleans, integers or floating point
 * numbers keep that type; everything else stays a string.
 *
 * @param node YAML node to transform.
 * @return JSON value mirroring the YAML content.
 */
nlohmann::json yaml_to_json(const YAML::Node &node) {
  using nlohmann::json;
  switch (node.Type()) {
  case YAML::NodeType::Null:
    return nullptr;
  case YAML::NodeType::Scalar: {
    const std::string s = node.Scalar();
    if (node.Tag() == "!") {
      return s; // quoted scalar
    }
    if (s == "true" || s == "True" || s == "TRUE")
      return true;
    if (s == "false" || s == "False" || s == "FALSE")
      return false;
    if (!s.empty()) {
      char *end = nullptr;
      errno = 0;
      long long i = std::strtoll(s.c_str(), &end, 0);
      if (errno == 0 && end == s.c_str() + s.size())
        return i;
      errno = 0;
      double d = std::strtod(s.c_str(), &end);
      if (errno == 0 && end == s.c_str() + s.size())
        return d;
    }
    return s;
  }
  case YAML::NodeType::Sequence: {
    json arr = json::array();
    auto &array = arr.get_ref<json::array_t &>();
    array.reserve(node.size());
    std::transform(node.begin(), node.end(), std::back_inserter(array),
                   [](const YAML::Node &item) { return yaml_to_json(item); });
    return arr;
  }
  case YAML::NodeType::Map: {
    json obj = json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  default:
    return nullptr;
  }
}

/**
 * Translate a TOML node to a JSON representation.
 *
 * @param node TOML node read from a parsed document.
 * @return JSON value containing the equivalent data.
 */
nlohmann::json toml_to_json(const toml::node &node) {
  using nlohmann::json;
  if (const auto *table = node.as_table()) {
    json obj = json::object();
    for (const auto &kv : *table) {
      obj[std::string(kv.first.str())] = toml_to_json(kv.second);
    }
    return obj;
  }

  if (const auto *array = node.as_array()) {
    json arr = json::array();
    arr.get_ref<json::array_t &>().reserve(array->size());
    for (const auto &item : *array) {
      arr.push_back(toml_to_json(item));
    }
    return arr;
  }

  if (const auto *value = node.as_boolean())
    return value->get();
  if (const auto *value = node.as_integer())
    return value->get();
  if (const auto *value = node.as_floating_point())
    return value->get();
  if (const auto *value = node.as_string())
    return value->get();

  return nullptr;
}

/**
 * Merge the grouped sections into the root object so nested and flat
 * configuration files expose the same keys.
 */
nlohmann::json normalize_config_sections(const nlohmann::json &source) {
  nlohmann::json normalized = source;
  auto merge_section = [&normalized](std::string_view name) {
    auto it = normalized.find(std::string{name});
    if (it == normalized.end() || !it->is_object()) {
      return;
    }
    const nlohmann::json section = *it;
    for (auto kv = section.begin(); kv != section.end(); ++kv) {
      normalized[kv.key()] = kv.value();
    }
  };

  for (std::string_view section :
       {"azure_devops", "inventory", "logging", "network"}) {
    merge_section(section);
  }

  return normalized;
}

/// Read a scalar as text; numbers are accepted for name-like keys.
std::string text_value(const nlohmann::json &value, const char *key) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_number()) {
    return value.dump();
  }
  throw std::runtime_error(std::string("Config key '") + key +
                           "' must be a string");
}

/// Read a string or a list of strings.
std::vector<std::string> string_list(const nlohmann::json &value,
                                     const char *key) {
  std::vector<std::string> out;
  if (value.is_null()) {
    return out;
  }
  if (value.is_array()) {
    for (const auto &item : value) {
      out.push_back(text_value(item, key));
    }
    return out;
  }
  out.push_back(text_value(value, key));
  return out;
}

void assign_category(std::unordered_map<std::string, std::string> &categories,
                     const std::string &raw) {
  auto pos = raw.find('=');
  std::string name = pos == std::string::npos ? raw : raw.substr(0, pos);
  std::string level =
      pos == std::string::npos ? std::string{"debug"} : raw.substr(pos + 1);
  if (name.empty()) {
    return;
  }
  categories[name] = level.empty() ? "debug" : level;
}

} // namespace

void Config::load_json(const nlohmann::json &j) {
  nlohmann::json cfg = normalize_config_sections(j);

  if (cfg.contains("organization")) {
    set_organization(text_value(cfg["organization"], "organization"));
  }
  if (cfg.contains("pat")) {
    set_pat(text_value(cfg["pat"], "pat"));
  }
  if (cfg.contains("pat_file")) {
    set_pat_file(cfg["pat_file"].get<std::string>());
  }
  if (cfg.contains("project_filter")) {
    set_project_filters(string_list(cfg["project_filter"], "project_filter"));
  }
  if (cfg.contains("throttle_limit")) {
    set_throttle_limit(cfg["throttle_limit"].get<int>());
  }
  if (cfg.contains("timeout_minutes")) {
    set_timeout_minutes(cfg["timeout_minutes"].get<int>());
  }
  if (cfg.contains("output_file")) {
    set_output_file(cfg["output_file"].get<std::string>());
  }
  if (cfg.contains("include_details")) {
    set_include_details(cfg["include_details"].get<bool>());
  }
  if (cfg.contains("pretty_json")) {
    set_pretty_json(cfg["pretty_json"].get<bool>());
  }
  if (cfg.contains("compact_json")) {
    set_pretty_json(!cfg["compact_json"].get<bool>());
  }
  if (cfg.contains("pull_request_status")) {
    set_pull_request_status(
        to_lower_copy(cfg["pull_request_status"].get<std::string>()));
  }
  if (cfg.contains("repository_filter")) {
    set_repository_filters(
        string_list(cfg["repository_filter"], "repository_filter"));
  }
  if (cfg.contains("variable_group_filter")) {
    set_variable_group_filters(
        string_list(cfg["variable_group_filter"], "variable_group_filter"));
  }
  if (cfg.contains("api_base")) {
    set_api_base(cfg["api_base"].get<std::string>());
  }
  if (cfg.contains("api_version")) {
    set_api_version(text_value(cfg["api_version"], "api_version"));
  }
  if (cfg.contains("http_timeout")) {
    set_http_timeout(cfg["http_timeout"].get<int>());
  }
  if (cfg.contains("http_retries")) {
    set_http_retries(cfg["http_retries"].get<int>());
  }
  if (cfg.contains("http_proxy")) {
    set_http_proxy(cfg["http_proxy"].get<std::string>());
  }
  if (cfg.contains("https_proxy")) {
    set_https_proxy(cfg["https_proxy"].get<std::string>());
  }
  if (cfg.contains("log_level")) {
    set_log_level(cfg["log_level"].get<std::string>());
  }
  if (cfg.contains("log_pattern")) {
    set_log_pattern(cfg["log_pattern"].get<std::string>());
  }
  if (cfg.contains("log_file")) {
    set_log_file(cfg["log_file"].get<std::string>());
  }
  if (cfg.contains("log_rotate")) {
    set_log_rotate(cfg["log_rotate"].get<int>());
  }
  if (cfg.contains("log_compress")) {
    set_log_compress(cfg["log_compress"].get<bool>());
  }
  if (cfg.contains("log_categories")) {
    std::unordered_map<std::string, std::string> categories;
    const auto &value = cfg["log_categories"];
    if (value.is_object()) {
      for (auto it = value.begin(); it != value.end(); ++it) {
        if (it.value().is_string()) {
          assign_category(categories,
                          it.key() + "=" + it.value().get<std::string>());
        } else if (it.value().is_null()) {
          assign_category(categories, it.key());
        } else {
          config_log()->warn("Unsupported value for log category '{}'; "
                             "expected string or null",
                             it.key());
        }
      }
    } else if (value.is_array()) {
      for (const auto &item : value) {
        if (item.is_string()) {
          assign_category(categories, item.get<std::string>());
        }
      }
    } else if (value.is_string()) {
      assign_category(categories, value.get<std::string>());
    }
    set_log_categories(std::move(categories));
  }
}

/**
 * Construct a configuration object from a JSON representation.
 *
 * @param j JSON document with configuration values.
 * @return Populated configuration instance.
 * @throws nlohmann::json::exception When value conversions fail.
 */
Config Config::from_json(const nlohmann::json &j) {
  Config cfg;
  cfg.load_json(j);
  return cfg;
}

/**
 * Load configuration from a file on disk.
 *
 * The file type is inferred from the extension and may be YAML, JSON, or
 * TOML. Errors during parsing are logged and rethrown.
 */
Config Config::from_file(const std::string &path) {
  config_log()->debug("Loading config from {}", path);
  auto pos = path.find_last_of('.');
  if (pos == std::string::npos) {
    config_log()->error("Unknown config file extension for {}", path);
    throw std::runtime_error("Unknown config file extension");
  }
  std::string ext = path.substr(pos + 1);
  std::string ext_lower = to_lower_copy(ext);
  nlohmann::json j;
  try {
    if (ext_lower == "yaml" || ext_lower == "yml") {
      YAML::Node node = YAML::LoadFile(path);
      j = yaml_to_json(node);
    } else if (ext_lower == "json") {
      std::ifstream f(path);
      if (!f) {
        throw std::runtime_error("Failed to open config file " + path);
      }
      f >> j;
    } else if (ext_lower == "toml" || ext_lower == "tml") {
      toml::table tbl = toml::parse_file(path);
      j = toml_to_json(tbl);
    } else {
      throw std::runtime_error("Unsupported config format: " + ext);
    }
  } catch (const std::exception &e) {
    config_log()->error("Failed to load config {}: {}", path, e.what());
    throw;
  }
  Config cfg;
  cfg.load_json(j);
  config_log()->info("Config loaded successfully from {}", path);
  return cfg;
}

} // namespace adoi
