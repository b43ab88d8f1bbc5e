/**
 * @file inventory.hpp
 * @brief Inventory runs: enumerate projects and their children, fan the
 * per-child work out, aggregate and optionally export.
 *
 * A run moves one way through
 * Idle, EnumeratingProjects, EnumeratingChildren, Dispatching, Aggregating,
 * Exporting (only with an output file) and Done. Fatal enumeration failures
 * end it in Failed.
 */
#ifndef ADOINVENTORY_INVENTORY_HPP
#define ADOINVENTORY_INVENTORY_HPP

#include "ado_client.hpp"
#include "aggregator.hpp"
#include "cancellation.hpp"
#include "dispatcher.hpp"
#include "exporter.hpp"
#include "models.hpp"
#include "progress.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace adoi {

/// Raised when a run cannot continue.
class InventoryError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Parameters of one inventory run.
struct ScanSettings {
  std::string organization;
  std::vector<std::string> project_filters; ///< Empty keeps all projects
  int throttle_limit{10};                   ///< 1 to 20
  std::chrono::minutes timeout{10};         ///< 1 to 60
  std::string output_file;                  ///< Empty skips the export
  bool include_details{false};
  bool pretty_json{true};
  std::string pull_request_status{"active"};
  std::vector<std::string> repository_filters;
  std::vector<std::string> variable_group_filters;
};

/**
 * Check value ranges of a settings block.
 *
 * @throws InventoryError When the organization is empty or the throttle or
 *         timeout is out of range.
 */
void validate_settings(const ScanSettings &settings);

/// States of an inventory run.
enum class RunState {
  Idle,
  EnumeratingProjects,
  EnumeratingChildren,
  Dispatching,
  Aggregating,
  Exporting,
  Done,
  Failed
};

/// Display name of a run state.
std::string run_state_name(RunState state);

/// One-way state tracker with a history of visited states.
class RunStateMachine {
public:
  RunState state() const { return state_; }
  const std::vector<RunState> &history() const { return history_; }

  /**
   * Move forward to `next`.
   *
   * @throws std::logic_error When `next` is not later than the current state
   *         or the run has already finished.
   */
  void advance(RunState next);

  /**
   * Enter Failed and raise.
   *
   * @throws InventoryError Always, carrying `message`.
   */
  void fail(const std::string &message);

private:
  RunState state_{RunState::Idle};
  std::vector<RunState> history_{RunState::Idle};
};

/**
 * List the organization's projects and keep those matching the filters.
 *
 * @throws InventoryError When the project listing fails.
 */
std::vector<Project> select_projects(AdoClient &client,
                                     const std::vector<std::string> &filters);

/**
 * Write rows to the configured output file.
 *
 * @return Error message when the export failed, logged as a warning.
 */
std::optional<std::string> export_records(const std::vector<Row> &rows,
                                          const ScanSettings &settings);

/// Log each failed task: permission problems at warn, everything else at error.
void log_task_failures(const RunSummary &summary);

/**
 * Process exit code for a finished run: 1 when children were dispatched and
 * none succeeded, otherwise 0.
 */
int exit_code_for(const RunSummary &summary);

/// Result of a finished run.
template <typename Record> struct InventoryResult {
  std::vector<Project> projects;
  std::vector<Record> records;
  RunSummary summary;
  bool exported{false};
  std::optional<std::string> export_error;
};

/**
 * Skeleton shared by the concrete inventories.
 *
 * Subclasses decide what the children of a project are and what work runs
 * for each child.
 */
template <typename Record> class InventoryRun {
public:
  /// Per-child work; must be safe to call concurrently.
  using Work = std::function<std::vector<Record>(const ChildResource &)>;

  /**
   * @param client Shared client; also kept alive by abandoned workers.
   * @param settings Run parameters.
   * @param stop Optional caller token that stops dispatching new tasks.
   * @param abandon Token fired when the deadline expires. Pass the token the
   *        client's transport watches so in-flight requests abort.
   */
  InventoryRun(std::shared_ptr<AdoClient> client, ScanSettings settings,
               CancellationTokenPtr stop = nullptr,
               CancellationTokenPtr abandon = nullptr)
      : client_(std::move(client)), settings_(std::move(settings)),
        stop_(std::move(stop)), abandon_(std::move(abandon)) {
    if (!client_) {
      throw std::invalid_argument("Inventory run requires a client");
    }
    if (!abandon_) {
      abandon_ = std::make_shared<CancellationToken>();
    }
  }

  virtual ~InventoryRun() = default;

  /// Replace the progress reporter.
  void set_reporter(ProgressReporter reporter) { reporter_ = reporter; }

  RunState state() const { return machine_.state(); }
  const std::vector<RunState> &history() const { return machine_.history(); }

  /**
   * Execute the run. A run object can only be executed once.
   *
   * @throws InventoryError On fatal setup or enumeration failures.
   */
  InventoryResult<Record> run() {
    if (machine_.state() != RunState::Idle) {
      throw std::logic_error("Inventory run already executed");
    }
    InventoryResult<Record> result;
    try {
      validate_settings(settings_);
      machine_.advance(RunState::EnumeratingProjects);
      result.projects = select_projects(*client_, settings_.project_filters);

      machine_.advance(RunState::EnumeratingChildren);
      std::size_t skipped = 0;
      std::vector<ChildResource> children =
          enumerate_children(result.projects, skipped);

      machine_.advance(RunState::Dispatching);
      DispatchOptions options;
      options.throttle = settings_.throttle_limit;
      options.timeout = settings_.timeout;
      options.stop = stop_;
      options.abandon = abandon_;
      std::string what = label();
      ProgressReporter reporter = reporter_;
      options.progress = [reporter, what](std::size_t done, std::size_t total) {
        reporter.report(done, total, what);
      };
      auto results = dispatch<Record>(children, options, make_work());

      machine_.advance(RunState::Aggregating);
      Aggregate<Record> merged = aggregate(std::move(results));
      merged.summary.skipped_projects = skipped;
      log_task_failures(merged.summary);
      result.records = std::move(merged.records);
      result.summary = std::move(merged.summary);

      if (!settings_.output_file.empty()) {
        machine_.advance(RunState::Exporting);
        result.export_error = export_records(to_rows(result.records), settings_);
        result.exported = !result.export_error.has_value();
      }
      machine_.advance(RunState::Done);
    } catch (const std::exception &e) {
      machine_.fail(e.what());
    }
    reporter_.summarize(result.summary);
    return result;
  }

protected:
  /// Label used on progress lines.
  virtual std::string label() const = 0;

  /**
   * Expand projects into dispatcher children.
   *
   * @param projects Projects selected for this run.
   * @param skipped Incremented for each project whose children could not be
   *        listed.
   */
  virtual std::vector<ChildResource>
  enumerate_children(const std::vector<Project> &projects,
                     std::size_t &skipped) = 0;

  /// Build the per-child work. It must not capture `this`.
  virtual Work make_work() const = 0;

  std::shared_ptr<AdoClient> client_;
  ScanSettings settings_;
  CancellationTokenPtr stop_;
  CancellationTokenPtr abandon_;

private:
  RunStateMachine machine_;
  ProgressReporter reporter_;
};

/// Pull requests of every matching repository of every matching project.
class PullRequestInventory : public InventoryRun<PullRequestRecord> {
public:
  using InventoryRun::InventoryRun;

protected:
  std::string label() const override { return "Pull requests"; }
  std::vector<ChildResource>
  enumerate_children(const std::vector<Project> &projects,
                     std::size_t &skipped) override;
  Work make_work() const override;
};

/// Variables of every matching variable group of every matching project.
class VariableGroupInventory : public InventoryRun<VariableRecord> {
public:
  using InventoryRun::InventoryRun;

protected:
  std::string label() const override { return "Variable groups"; }
  std::vector<ChildResource>
  enumerate_children(const std::vector<Project> &projects,
                     std::size_t &skipped) override;
  Work make_work() const override;
};

} // namespace adoi

#endif // ADOINVENTORY_INVENTORY_HPP
