#include "cli.hpp"
#include "log.hpp"
#include "version.hpp"

#include <CLI/CLI.hpp>
#include <array>
#include <iostream>
#include <sstream>
#include <string_view>

namespace adoi {

namespace {

std::shared_ptr<spdlog::logger> cli_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("cli");
  }();
  return logger;
}

std::string log_category_help_text() {
  static const std::array<std::string_view, 10> categories = {
      "app",      "ado.client", "cli",     "config",   "dispatch",
      "export",   "http",       "inventory", "logging", "progress"};
  std::ostringstream oss;
  oss << "Logging categories: ";
  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (i != 0) {
      oss << ", ";
    }
    oss << categories[i];
  }
  oss << "\nUse --log-category NAME=LEVEL to override (e.g., "
         "ado.client=debug).";
  oss << " Configuration files accept the same mapping under 'log_categories'.";
  return oss.str();
}

} // namespace

/**
 * Parse command line arguments into CliOptions.
 *
 * Global options may appear before or after the subcommand.
 */
CliOptions parse_cli(int argc, char **argv) {
  CLI::App app{"Azure DevOps bulk inventory"};
  app.footer(log_category_help_text());
  app.require_subcommand(1);
  CliOptions options;

  app.add_option("-C,--config", options.config_file,
                 "Path to configuration file")
      ->type_name("FILE")
      ->check(CLI::ExistingFile)
      ->group("General");
  app.add_flag_function(
         "--version",
         [](std::int64_t) {
           std::cout << "adoinventory " << kVersionString << std::endl;
           throw CliParseExit(0);
         },
         "Show version information and exit")
      ->group("General");
  app.add_flag("-q,--quiet", options.quiet, "Suppress per-task progress lines")
      ->group("General");

  app.add_option("-o,--organization", options.organization,
                 "Azure DevOps organization name")
      ->type_name("ORG")
      ->group("Scope");
  app.add_option("-p,--project", options.project_filters,
                 "Project name wildcard pattern (repeatable, default *)")
      ->type_name("PATTERN")
      ->group("Scope");

  app.add_option("--pat", options.pat,
                 "Personal access token (default: $PAT, then $ADO_PAT)")
      ->type_name("TOKEN")
      ->group("Authentication");
  app.add_option("--pat-file", options.pat_file,
                 "Read the personal access token from a file")
      ->type_name("FILE")
      ->check(CLI::ExistingFile)
      ->group("Authentication");

  auto *throttle_opt =
      app.add_option("-t,--throttle-limit", options.throttle_limit,
                     "Maximum concurrent requests (1-20)")
          ->type_name("N")
          ->check(CLI::Range(1, 20))
          ->group("Execution");
  auto *timeout_opt =
      app.add_option("--timeout-minutes", options.timeout_minutes,
                     "Overall time budget for the fan-out (1-60)")
          ->type_name("MIN")
          ->check(CLI::Range(1, 60))
          ->group("Execution");

  app.add_option("-O,--output", options.output_file,
                 "Export file; .csv, .json or .xml")
      ->type_name("FILE")
      ->group("Output");
  app.add_flag("-d,--include-details", options.include_details,
               "Fetch and export detail columns")
      ->group("Output");
  app.add_flag("--compact-json", options.compact_json,
               "Write JSON exports without indentation")
      ->group("Output");

  auto *log_level_opt =
      app.add_option(
             "-G,--log-level", options.log_level,
             "Set logging level (trace, debug, info, warn, error, critical, "
             "off)")
          ->type_name("LEVEL")
          ->default_val("info")
          ->group("Logging");
  app.add_option("--log-pattern", options.log_pattern, "spdlog pattern")
      ->type_name("PATTERN")
      ->group("Logging");
  app.add_option("-F,--log-file", options.log_file, "Path to rotating log file")
      ->type_name("FILE")
      ->group("Logging");
  app.add_option_function<int>(
         "--log-rotate",
         [&options](int value) {
           if (value < 0) {
             throw CLI::ValidationError("--log-rotate",
                                        "rotation count must be non-negative");
           }
           options.log_rotate = value;
           options.log_rotate_explicit = true;
         },
         "Number of rotated log files to retain (0 disables rotation)")
      ->type_name("N")
      ->group("Logging");
  app.add_flag("--log-compress", options.log_compress,
               "Gzip rotated log files")
      ->group("Logging");
  std::vector<std::string> log_category_values;
  app.add_option("--log-category", log_category_values,
                 "Enable a logging category (NAME or NAME=LEVEL, repeatable). "
                 "See help footer for available categories.")
      ->type_name("NAME[=LEVEL]")
      ->group("Logging");

  app.add_option("--api-base", options.api_base,
                 "Service root URL (default https://dev.azure.com)")
      ->type_name("URL")
      ->group("Network");
  app.add_option("--api-version", options.api_version,
                 "REST api-version (default 7.1)")
      ->type_name("VERSION")
      ->group("Network");
  auto *http_timeout_opt =
      app.add_option("--http-timeout", options.http_timeout,
                     "Per-request timeout in seconds")
          ->type_name("SEC")
          ->check(CLI::PositiveNumber)
          ->group("Network");
  auto *http_retries_opt =
      app.add_option("--http-retries", options.http_retries,
                     "Retries for failed GET requests (0-10)")
          ->type_name("N")
          ->check(CLI::Range(0, 10))
          ->group("Network");
  app.add_option("--http-proxy", options.http_proxy, "Proxy for HTTP requests")
      ->type_name("URL")
      ->group("Network");
  app.add_option("--https-proxy", options.https_proxy,
                 "Proxy for HTTPS requests")
      ->type_name("URL")
      ->group("Network");

  CLI::App *prs = app.add_subcommand(
      "pull-requests", "Inventory pull requests of every matching repository");
  prs->alias("prs");
  prs->fallthrough();
  auto *status_opt =
      prs->add_option("--status", options.pull_request_status,
                      "Pull request status: active, completed, abandoned, all")
          ->type_name("STATUS")
          ->check(CLI::IsMember({"active", "completed", "abandoned", "all"},
                                CLI::ignore_case));
  prs->add_option("-r,--repository", options.repository_filters,
                  "Repository name wildcard pattern (repeatable)")
      ->type_name("PATTERN");

  CLI::App *vgs = app.add_subcommand(
      "variable-groups", "Inventory variables of every matching variable group");
  vgs->alias("vgs");
  vgs->fallthrough();
  vgs->add_option("-g,--group", options.variable_group_filters,
                  "Variable group name wildcard pattern (repeatable)")
      ->type_name("PATTERN");

  CLI::App *projects = app.add_subcommand(
      "projects", "List the projects matching the project filters");
  projects->fallthrough();

  try {
    app.parse(argc, argv);
    for (const auto &value : log_category_values) {
      auto pos = value.find('=');
      std::string name =
          pos == std::string::npos ? value : value.substr(0, pos);
      std::string level = pos == std::string::npos ? std::string{"debug"}
                                                   : value.substr(pos + 1);
      if (name.empty()) {
        throw CLI::ValidationError("--log-category",
                                   "category name must not be empty");
      }
      options.log_categories[name] = level.empty() ? "debug" : level;
    }
  } catch (const CLI::ParseError &e) {
    int exit_code = app.exit(e);
    throw CliParseExit(exit_code == 0 ? 0 : 2);
  }

  if (prs->parsed()) {
    options.command = Command::PullRequests;
  } else if (vgs->parsed()) {
    options.command = Command::VariableGroups;
  } else if (projects->parsed()) {
    options.command = Command::Projects;
  }
  options.throttle_limit_explicit = throttle_opt->count() > 0U;
  options.timeout_minutes_explicit = timeout_opt->count() > 0U;
  options.log_level_explicit = log_level_opt->count() > 0U;
  options.http_timeout_explicit = http_timeout_opt->count() > 0U;
  options.http_retries_explicit = http_retries_opt->count() > 0U;
  options.pull_request_status_explicit = status_opt->count() > 0U;
  cli_log()->debug("Parsed command line with {} argument(s)", argc - 1);
  return options;
}

} // namespace adoi
