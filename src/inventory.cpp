/**
 * @file inventory.cpp
 * @brief Run state tracking and the concrete pull request and variable group
 * inventories.
 */

#include "inventory.hpp"
#include "log.hpp"
#include "util/wildcard.hpp"

namespace adoi {

namespace {

std::shared_ptr<spdlog::logger> inventory_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("inventory");
  }();
  return logger;
}

int state_rank(RunState state) { return static_cast<int>(state); }

std::string describe(const ChildResource &resource) {
  if (resource.parent_name.empty() || resource.parent_name == resource.name) {
    return resource.name;
  }
  return resource.parent_name + "/" + resource.name;
}

} // namespace

void validate_settings(const ScanSettings &settings) {
  if (settings.organization.empty()) {
    throw InventoryError("Azure DevOps organization is required");
  }
  if (settings.throttle_limit < 1 || settings.throttle_limit > 20) {
    throw InventoryError("Throttle limit must be between 1 and 20, got " +
                         std::to_string(settings.throttle_limit));
  }
  if (settings.timeout.count() < 1 || settings.timeout.count() > 60) {
    throw InventoryError("Timeout must be between 1 and 60 minutes, got " +
                         std::to_string(settings.timeout.count()));
  }
}

std::string run_state_name(RunState state) {
  switch (state) {
  case RunState::Idle:
    return "Idle";
  case RunState::EnumeratingProjects:
    return "EnumeratingProjects";
  case RunState::EnumeratingChildren:
    return "EnumeratingChildren";
  case RunState::Dispatching:
    return "Dispatching";
  case RunState::Aggregating:
    return "Aggregating";
  case RunState::Exporting:
    return "Exporting";
  case RunState::Done:
    return "Done";
  case RunState::Failed:
    break;
  }
  return "Failed";
}

void RunStateMachine::advance(RunState next) {
  if (state_ == RunState::Done || state_ == RunState::Failed ||
      next == RunState::Failed || state_rank(next) <= state_rank(state_)) {
    throw std::logic_error("Invalid run state transition " +
                           run_state_name(state_) + " -> " +
                           run_state_name(next));
  }
  inventory_log()->debug("State {} -> {}", run_state_name(state_),
                         run_state_name(next));
  state_ = next;
  history_.push_back(next);
}

void RunStateMachine::fail(const std::string &message) {
  if (state_ != RunState::Failed) {
    inventory_log()->error("Run failed while {}: {}", run_state_name(state_),
                           message);
    state_ = RunState::Failed;
    history_.push_back(RunState::Failed);
  }
  throw InventoryError(message);
}

std::vector<Project> select_projects(AdoClient &client,
                                     const std::vector<std::string> &filters) {
  std::vector<Project> projects;
  try {
    projects = client.list_projects();
  } catch (const std::exception &e) {
    throw InventoryError("Failed to list projects of organization '" +
                         client.organization() + "': " + e.what());
  }
  std::size_t listed = projects.size();
  projects = filter_by_patterns(std::move(projects), filters,
                                [](const Project &p) { return p.name; });
  if (projects.empty()) {
    inventory_log()->warn("No projects matched in organization {}",
                          client.organization());
  } else {
    inventory_log()->info("Selected {} of {} project(s)", projects.size(),
                          listed);
  }
  return projects;
}

std::optional<std::string> export_records(const std::vector<Row> &rows,
                                          const ScanSettings &settings) {
  ExportOptions options;
  options.pretty_json = settings.pretty_json;
  try {
    export_rows(rows, settings.output_file, options);
  } catch (const std::exception &e) {
    inventory_log()->warn("Export to {} failed: {}", settings.output_file,
                          e.what());
    return std::string(e.what());
  }
  return std::nullopt;
}

void log_task_failures(const RunSummary &summary) {
  for (const auto &f : summary.failures) {
    if (f.failure == FailureKind::PermissionDenied) {
      inventory_log()->warn("Permission denied for {}: {}",
                            describe(f.resource), f.error);
    } else {
      inventory_log()->error("Failed to process {} ({}): {}",
                             describe(f.resource),
                             failure_kind_name(f.failure), f.error);
    }
  }
}

int exit_code_for(const RunSummary &summary) {
  return summary.total_child_resources > 0 && summary.succeeded == 0 ? 1 : 0;
}

std::vector<ChildResource>
PullRequestInventory::enumerate_children(const std::vector<Project> &projects,
                                         std::size_t &skipped) {
  std::vector<ChildResource> children;
  for (const auto &project : projects) {
    if (is_cancelled(stop_)) {
      inventory_log()->info("Stop requested; not enumerating further projects");
      break;
    }
    std::vector<Repository> repos;
    try {
      repos = client_->list_repositories(project);
    } catch (const std::exception &e) {
      inventory_log()->warn("Skipping project {}: failed to list "
                            "repositories: {}",
                            project.name, e.what());
      ++skipped;
      continue;
    }
    repos = filter_by_patterns(std::move(repos), settings_.repository_filters,
                               [](const Repository &r) { return r.name; });
    for (const auto &repo : repos) {
      children.push_back(
          {repo.id, repo.name, project.id, project.name});
    }
  }
  inventory_log()->info("Found {} repositor{} across {} project(s)",
                        children.size(), children.size() == 1 ? "y" : "ies",
                        projects.size());
  return children;
}

PullRequestInventory::Work PullRequestInventory::make_work() const {
  auto client = client_;
  std::string status = settings_.pull_request_status;
  bool details = settings_.include_details;
  return [client, status, details](const ChildResource &repository) {
    return client->list_pull_requests(repository, status, details);
  };
}

std::vector<ChildResource>
VariableGroupInventory::enumerate_children(const std::vector<Project> &projects,
                                           std::size_t &skipped) {
  (void)skipped;
  std::vector<ChildResource> children;
  children.reserve(projects.size());
  for (const auto &project : projects) {
    children.push_back({project.id, project.name, project.id, project.name});
  }
  return children;
}

VariableGroupInventory::Work VariableGroupInventory::make_work() const {
  auto client = client_;
  std::vector<std::string> filters = settings_.variable_group_filters;
  bool details = settings_.include_details;
  return [client, filters, details](const ChildResource &project) {
    return client->list_variable_groups(project, filters, details);
  };
}

} // namespace adoi
