#include "app.hpp"
#include "exporter.hpp"
#include "log.hpp"
#include "pat_loader.hpp"
#include "progress.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace adoi {

namespace {

std::shared_ptr<spdlog::logger> app_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("app");
  }();
  return logger;
}

bool valid_pull_request_status(const std::string &status) {
  return status == "active" || status == "completed" ||
         status == "abandoned" || status == "all";
}

/// Run an inventory and print its records as a JSON array, possibly empty,
/// when no output file is set.
template <typename Inventory>
int run_inventory(Inventory &inventory, const ScanSettings &settings,
                  std::ostream &out) {
  auto result = inventory.run();
  if (settings.output_file.empty()) {
    out << render_json(to_rows(result.records), settings.pretty_json);
  }
  return exit_code_for(result.summary);
}

} // namespace

App::App()
    : stop_(std::make_shared<CancellationToken>()),
      abandon_(std::make_shared<CancellationToken>()) {}

/**
 * Execute the setup flow.
 *
 * This routine orchestrates CLI parsing, configuration loading, logger
 * initialization and token resolution.
 *
 * @param argc Argument count passed from @c main().
 * @param argv Argument vector passed from @c main().
 * @return Zero on success, non-zero if execution should terminate with an
 *         error code.
 */
int App::run(int argc, char **argv) {
  should_exit_ = false;
  try {
    options_ = parse_cli(argc, argv);
  } catch (const CliParseExit &exit) {
    should_exit_ = true;
    return exit.exit_code();
  }
  try {
    if (!options_.config_file.empty()) {
      config_ = Config::from_file(options_.config_file);
    }
  } catch (const std::exception &e) {
    app_log()->error("Failed to load configuration: {}", e.what());
    should_exit_ = true;
    return 1;
  }
  merge_config();
  setup_logging();

  if (settings_.organization.empty()) {
    app_log()->error("Organization is required (--organization or "
                     "'organization' in the config file)");
    should_exit_ = true;
    return 1;
  }
  if (!valid_pull_request_status(settings_.pull_request_status)) {
    app_log()->error("Unsupported pull request status '{}'",
                     settings_.pull_request_status);
    should_exit_ = true;
    return 1;
  }
  try {
    validate_settings(settings_);
    resolve_pat();
  } catch (const std::exception &e) {
    app_log()->error("{}", e.what());
    should_exit_ = true;
    return 1;
  }
  app_log()->debug("Organization {}, throttle {}, timeout {} min",
                   settings_.organization, settings_.throttle_limit,
                   settings_.timeout.count());
  return 0;
}

/// Apply CLI values over configuration values.
void App::merge_config() {
  if (!options_.organization.empty()) {
    config_.set_organization(options_.organization);
  }
  if (!options_.project_filters.empty()) {
    config_.set_project_filters(options_.project_filters);
  }
  if (!options_.pat.empty()) {
    config_.set_pat(options_.pat);
  }
  if (!options_.pat_file.empty()) {
    config_.set_pat_file(options_.pat_file);
    if (options_.pat.empty()) {
      config_.set_pat("");
    }
  }
  if (options_.throttle_limit_explicit) {
    config_.set_throttle_limit(options_.throttle_limit);
  }
  if (options_.timeout_minutes_explicit) {
    config_.set_timeout_minutes(options_.timeout_minutes);
  }
  if (!options_.output_file.empty()) {
    config_.set_output_file(options_.output_file);
  }
  if (options_.include_details) {
    config_.set_include_details(true);
  }
  if (options_.compact_json) {
    config_.set_pretty_json(false);
  }
  if (options_.pull_request_status_explicit) {
    config_.set_pull_request_status(options_.pull_request_status);
  }
  if (!options_.repository_filters.empty()) {
    config_.set_repository_filters(options_.repository_filters);
  }
  if (!options_.variable_group_filters.empty()) {
    config_.set_variable_group_filters(options_.variable_group_filters);
  }
  if (!options_.api_base.empty()) {
    config_.set_api_base(options_.api_base);
  }
  if (!options_.api_version.empty()) {
    config_.set_api_version(options_.api_version);
  }
  if (options_.http_timeout_explicit) {
    config_.set_http_timeout(options_.http_timeout);
  }
  if (options_.http_retries_explicit) {
    config_.set_http_retries(options_.http_retries);
  }
  if (!options_.http_proxy.empty()) {
    config_.set_http_proxy(options_.http_proxy);
  }
  if (!options_.https_proxy.empty()) {
    config_.set_https_proxy(options_.https_proxy);
  }
  if (options_.log_level_explicit) {
    config_.set_log_level(options_.log_level);
  }
  if (!options_.log_pattern.empty()) {
    config_.set_log_pattern(options_.log_pattern);
  }
  if (!options_.log_file.empty()) {
    config_.set_log_file(options_.log_file);
  }
  if (options_.log_rotate_explicit) {
    config_.set_log_rotate(options_.log_rotate);
  }
  if (options_.log_compress) {
    config_.set_log_compress(true);
  }
  for (const auto &[category, level] : options_.log_categories) {
    config_.set_log_category(category, level);
  }
  quiet_ = options_.quiet;

  settings_.organization = config_.organization();
  settings_.project_filters = config_.project_filters();
  settings_.throttle_limit = config_.throttle_limit();
  settings_.timeout = std::chrono::minutes(config_.timeout_minutes());
  settings_.output_file = config_.output_file();
  settings_.include_details = config_.include_details();
  settings_.pretty_json = config_.pretty_json();
  settings_.pull_request_status = config_.pull_request_status();
  settings_.repository_filters = config_.repository_filters();
  settings_.variable_group_filters = config_.variable_group_filters();

  client_options_.api_base = config_.api_base();
  client_options_.api_version = config_.api_version();
  client_options_.timeout_ms = config_.http_timeout() * 1000;
  client_options_.max_retries = config_.http_retries();
  client_options_.http_proxy = config_.http_proxy();
  client_options_.https_proxy = config_.https_proxy();
  client_options_.cancel = abandon_;
}

void App::setup_logging() {
  spdlog::level::level_enum lvl = spdlog::level::from_str(config_.log_level());
  if (lvl == spdlog::level::off && config_.log_level() != "off") {
    lvl = spdlog::level::info;
  }
  init_logger(lvl, config_.log_pattern(), config_.log_file(),
              static_cast<std::size_t>(config_.log_rotate()),
              config_.log_compress());
  std::unordered_map<std::string, spdlog::level::level_enum> category_levels;
  for (const auto &[category, level_str] : config_.log_categories()) {
    auto level = spdlog::level::from_str(level_str);
    if (level == spdlog::level::off && level_str != "off") {
      app_log()->warn("Ignoring invalid log level '{}' for category '{}'",
                      level_str, category);
      continue;
    }
    category_levels[category] = level;
  }
  configure_log_categories(category_levels);
}

/**
 * Pick the personal access token: inline value, then token file, then the
 * `PAT` and `ADO_PAT` environment variables.
 *
 * @throws std::runtime_error When no token is available.
 */
void App::resolve_pat() {
  if (!config_.pat().empty()) {
    pat_ = config_.pat();
    return;
  }
  if (!config_.pat_file().empty()) {
    pat_ = load_pat_from_file(config_.pat_file());
    app_log()->debug("Loaded personal access token from {}",
                     config_.pat_file());
    return;
  }
  if (auto env = pat_from_environment()) {
    pat_ = *env;
    return;
  }
  throw std::runtime_error("No personal access token: use --pat, --pat-file, "
                           "or set PAT or ADO_PAT");
}

int App::execute(std::unique_ptr<HttpClient> http) {
  return execute(std::move(http), std::cout);
}

int App::execute(std::unique_ptr<HttpClient> http, std::ostream &out) {
  try {
    auto client = std::make_shared<AdoClient>(settings_.organization, pat_,
                                              std::move(http), client_options_);
    switch (options_.command) {
    case Command::Projects: {
      std::vector<Project> projects =
          select_projects(*client, settings_.project_filters);
      if (!settings_.output_file.empty()) {
        if (export_records(to_rows(projects), settings_)) {
          app_log()->warn("Project list was not exported");
        }
      } else {
        for (const auto &p : projects) {
          out << p.name << '\n';
        }
      }
      return 0;
    }
    case Command::PullRequests: {
      PullRequestInventory inventory(client, settings_, stop_, abandon_);
      inventory.set_reporter(ProgressReporter(quiet_));
      return run_inventory(inventory, settings_, out);
    }
    case Command::VariableGroups: {
      VariableGroupInventory inventory(client, settings_, stop_, abandon_);
      inventory.set_reporter(ProgressReporter(quiet_));
      return run_inventory(inventory, settings_, out);
    }
    case Command::None:
      break;
    }
    app_log()->error("No command selected");
    return 2;
  } catch (const std::exception &e) {
    app_log()->error("{}", e.what());
    return 1;
  }
}

} // namespace adoi
