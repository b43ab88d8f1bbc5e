/**
 * @file cli.hpp
 * @brief Command line interface parsing and options for adoinventory.
 *
 * Declares CLI parsing helpers, option structures, and related exceptions for
 * the tool.
 */

#ifndef ADOINVENTORY_CLI_HPP
#define ADOINVENTORY_CLI_HPP

#include <exception>
#include <string>
#include <unordered_map>
#include <vector>

namespace adoi {

/**
 * Signals that CLI parsing requested an immediate exit (help, errors, etc.).
 * Used to bubble exit codes from parsing back to the main entry point without
 * treating them as fatal errors.
 */
class CliParseExit : public std::exception {
public:
  /**
   * Construct an exit signal with the desired exit code.
   *
   * @param exit_code Process exit code that should be returned to the caller.
   */
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  /// Numeric process exit code.
  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/// Inventory selected on the command line.
enum class Command { None, PullRequests, VariableGroups, Projects };

/**
 * Parsed command line options supplied via the CLI.
 *
 * Empty strings and unset `*_explicit` markers mean the value was not given
 * and the configuration file or default applies.
 */
struct CliOptions {
  Command command{Command::None};
  std::string config_file; ///< Optional path to configuration file

  std::string organization;
  std::vector<std::string> project_filters;
  std::string pat;
  std::string pat_file;
  int throttle_limit{10};
  bool throttle_limit_explicit{false};
  int timeout_minutes{10};
  bool timeout_minutes_explicit{false};
  std::string output_file;
  bool include_details{false};
  bool compact_json{false};
  bool quiet{false}; ///< Suppress per-task progress lines

  // pull-requests
  std::string pull_request_status{"active"};
  bool pull_request_status_explicit{false};
  std::vector<std::string> repository_filters;

  // variable-groups
  std::vector<std::string> variable_group_filters;

  std::string log_level = "info"; ///< Logging verbosity level
  bool log_level_explicit{false};
  std::string log_pattern;
  std::string log_file; ///< Optional path to rotating log file
  int log_rotate{3};    ///< Number of rotated log files to keep (0 disables)
  bool log_rotate_explicit{false};
  bool log_compress{false}; ///< Compress rotated log files
  std::unordered_map<std::string, std::string>
      log_categories; ///< Category -> level overrides requested via CLI

  std::string api_base;
  std::string api_version;
  int http_timeout{30}; ///< Seconds
  bool http_timeout_explicit{false};
  int http_retries{3};
  bool http_retries_explicit{false};
  std::string http_proxy;
  std::string https_proxy;
};

/**
 * Parse command line arguments and return the normalized options structure.
 *
 * @param argc Number of elements supplied in @p argv.
 * @param argv Null-terminated array of raw CLI argument strings.
 * @return Populated options structure describing the requested behaviour.
 * @throws CliParseExit For `--help` and `--version` (exit code 0) and for
 *         usage errors (exit code 2).
 */
CliOptions parse_cli(int argc, char **argv);

} // namespace adoi

#endif // ADOINVENTORY_CLI_HPP
