/**
 * @file app.hpp
 * @brief Application orchestrator for adoinventory.
 *
 * Declares the App class, which resolves CLI options against the
 * configuration file, sets up logging, and runs the selected inventory.
 */

#ifndef ADOINVENTORY_APP_HPP
#define ADOINVENTORY_APP_HPP

#include "ado_client.hpp"
#include "cancellation.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "http_client.hpp"
#include "inventory.hpp"

#include <iosfwd>
#include <memory>
#include <string>

namespace adoi {

/**
 * Main application entry point responsible for orchestrating high level
 * application flow, configuration loading, and CLI parsing.
 */
class App {
public:
  App();

  /**
   * Parse arguments, load configuration and prepare the run.
   *
   * @param argc Number of CLI arguments supplied to the executable.
   * @param argv Null-terminated array containing the raw CLI arguments.
   * @return Zero on success, non-zero when execution should terminate.
   */
  int run(int argc, char **argv);

  /**
   * Execute the selected command.
   *
   * @param http Optional transport replacing the libcurl client.
   * @param out Stream receiving records when no output file is set.
   * @return Process exit code.
   */
  int execute(std::unique_ptr<HttpClient> http = nullptr);
  int execute(std::unique_ptr<HttpClient> http, std::ostream &out);

  /// Parsed command line options.
  const CliOptions &options() const { return options_; }

  /// Loaded configuration with CLI overrides applied.
  const Config &config() const { return config_; }

  /// Settings handed to the inventory run.
  const ScanSettings &settings() const { return settings_; }

  /// Connection settings handed to the client.
  const AdoClientOptions &client_options() const { return client_options_; }

  /// Resolved personal access token.
  const std::string &pat() const { return pat_; }

  /// Token that stops dispatching new tasks, e.g. from a signal handler.
  const CancellationTokenPtr &stop_token() const { return stop_; }

  /// Whether the application should exit right after `run()`.
  bool should_exit() const { return should_exit_; }

private:
  void merge_config();
  void setup_logging();
  void resolve_pat();

  CliOptions options_;
  Config config_;
  ScanSettings settings_;
  AdoClientOptions client_options_;
  std::string pat_;
  CancellationTokenPtr stop_;
  CancellationTokenPtr abandon_;
  bool quiet_{false};
  bool should_exit_{false};
};

} // namespace adoi

#endif // ADOINVENTORY_APP_HPP
