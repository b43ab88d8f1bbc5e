#ifndef ADOINVENTORY_CONFIG_HPP
#define ADOINVENTORY_CONFIG_HPP

#include <nlohmann/json_fwd.hpp>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace adoi {

/// Application configuration loaded from a YAML, TOML, or JSON file.
class Config {
public:
  /// Azure DevOps organization name.
  const std::string &organization() const { return organization_; }

  /// Set Azure DevOps organization name.
  void set_organization(const std::string &org) { organization_ = org; }

  /// Personal access token given inline.
  const std::string &pat() const { return pat_; }

  /// Set inline personal access token.
  void set_pat(const std::string &pat) { pat_ = pat; }

  /// File holding the personal access token.
  const std::string &pat_file() const { return pat_file_; }

  /// Set file holding the personal access token.
  void set_pat_file(const std::string &path) { pat_file_ = path; }

  /// Wildcard patterns selecting projects.
  const std::vector<std::string> &project_filters() const {
    return project_filters_;
  }

  /// Set project wildcard patterns.
  void set_project_filters(const std::vector<std::string> &filters) {
    project_filters_ = filters;
  }

  /// Maximum number of concurrent child tasks.
  int throttle_limit() const { return throttle_limit_; }

  /// Set maximum number of concurrent child tasks.
  void set_throttle_limit(int limit) { throttle_limit_ = limit; }

  /// Overall dispatch timeout in minutes.
  int timeout_minutes() const { return timeout_minutes_; }

  /// Set overall dispatch timeout in minutes.
  void set_timeout_minutes(int minutes) { timeout_minutes_ = minutes; }

  /// Export destination; the extension picks the format.
  const std::string &output_file() const { return output_file_; }

  /// Set export destination.
  void set_output_file(const std::string &path) { output_file_ = path; }

  /// Whether detail columns are fetched and exported.
  bool include_details() const { return include_details_; }

  /// Enable or disable detail columns.
  void set_include_details(bool include) { include_details_ = include; }

  /// Indent JSON exports.
  bool pretty_json() const { return pretty_json_; }

  /// Enable or disable indented JSON exports.
  void set_pretty_json(bool pretty) { pretty_json_ = pretty; }

  /// Pull request status filter (`active`, `completed`, `abandoned`, `all`).
  const std::string &pull_request_status() const {
    return pull_request_status_;
  }

  /// Set pull request status filter.
  void set_pull_request_status(const std::string &status) {
    pull_request_status_ = status;
  }

  /// Wildcard patterns selecting repositories.
  const std::vector<std::string> &repository_filters() const {
    return repository_filters_;
  }

  /// Set repository wildcard patterns.
  void set_repository_filters(const std::vector<std::string> &filters) {
    repository_filters_ = filters;
  }

  /// Wildcard patterns selecting variable groups.
  const std::vector<std::string> &variable_group_filters() const {
    return variable_group_filters_;
  }

  /// Set variable group wildcard patterns.
  void set_variable_group_filters(const std::vector<std::string> &filters) {
    variable_group_filters_ = filters;
  }

  /// Base URL of the Azure DevOps service.
  const std::string &api_base() const { return api_base_; }

  /// Set base URL of the Azure DevOps service.
  void set_api_base(const std::string &base) { api_base_ = base; }

  /// REST `api-version` sent with every request.
  const std::string &api_version() const { return api_version_; }

  /// Set REST `api-version`.
  void set_api_version(const std::string &version) { api_version_ = version; }

  /// HTTP request timeout in seconds.
  int http_timeout() const { return http_timeout_; }

  /// Set HTTP request timeout.
  void set_http_timeout(int t) { http_timeout_ = t; }

  /// Number of HTTP retry attempts.
  int http_retries() const { return http_retries_; }

  /// Set number of HTTP retry attempts, clamped to 0-10.
  void set_http_retries(int r) {
    http_retries_ = r < 0 ? 0 : (r > 10 ? 10 : r);
  }

  /// Proxy URL for HTTP requests.
  const std::string &http_proxy() const { return http_proxy_; }

  /// Set proxy URL for HTTP requests.
  void set_http_proxy(const std::string &proxy) { http_proxy_ = proxy; }

  /// Proxy URL for HTTPS requests.
  const std::string &https_proxy() const { return https_proxy_; }

  /// Set proxy URL for HTTPS requests.
  void set_https_proxy(const std::string &proxy) { https_proxy_ = proxy; }

  /// Get logging verbosity level.
  const std::string &log_level() const { return log_level_; }

  /// Set logging verbosity level.
  void set_log_level(const std::string &level) { log_level_ = level; }

  /// Get logging pattern.
  const std::string &log_pattern() const { return log_pattern_; }

  /// Set logging pattern.
  void set_log_pattern(const std::string &pattern) { log_pattern_ = pattern; }

  /// Path to rotating log file.
  const std::string &log_file() const { return log_file_; }

  /// Set path for rotating log file.
  void set_log_file(const std::string &file) { log_file_ = file; }

  /// Number of rotated log files to retain (0 disables rotation).
  int log_rotate() const { return log_rotate_; }

  /// Set number of rotated log files to retain.
  void set_log_rotate(int count) { log_rotate_ = count < 0 ? 0 : count; }

  /// Whether rotated log files are compressed.
  bool log_compress() const { return log_compress_; }

  /// Enable or disable compression of rotated log files.
  void set_log_compress(bool enable) { log_compress_ = enable; }

  /// Retrieve configured log category overrides.
  const std::unordered_map<std::string, std::string> &log_categories() const {
    return log_categories_;
  }

  /// Replace configured log category overrides.
  void set_log_categories(std::unordered_map<std::string, std::string> values) {
    log_categories_ = std::move(values);
  }

  /// Set or update a single log category override.
  void set_log_category(const std::string &name, const std::string &level) {
    log_categories_[name] = level;
  }

  /**
   * Load configuration from a file.
   *
   * @param path Path to a YAML (`.yaml`/`.yml`), TOML (`.toml`/`.tml`) or
   *        JSON file.
   * @throws std::runtime_error When the file is unreadable or its extension
   *         unsupported.
   */
  static Config from_file(const std::string &path);

  /// Build a configuration from an already parsed JSON document.
  static Config from_json(const nlohmann::json &j);

  /**
   * Apply the keys present in `j` on top of the current values.
   *
   * Keys grouped under `azure_devops`, `inventory`, `logging` or `network`
   * are treated as if they appeared at the top level.
   */
  void load_json(const nlohmann::json &j);

private:
  std::string organization_;
  std::string pat_;
  std::string pat_file_;
  std::vector<std::string> project_filters_;
  int throttle_limit_ = 10;
  int timeout_minutes_ = 10;
  std::string output_file_;
  bool include_details_ = false;
  bool pretty_json_ = true;
  std::string pull_request_status_ = "active";
  std::vector<std::string> repository_filters_;
  std::vector<std::string> variable_group_filters_;
  std::string api_base_ = "https://dev.azure.com";
  std::string api_version_ = "7.1";
  int http_timeout_ = 30;
  int http_retries_ = 3;
  std::string http_proxy_;
  std::string https_proxy_;
  std::string log_level_ = "info";
  std::string log_pattern_;
  std::string log_file_;
  int log_rotate_ = 3;
  bool log_compress_ = false;
  std::unordered_map<std::string, std::string> log_categories_;
};

} // namespace adoi

#endif // ADOINVENTORY_CONFIG_HPP
