/**
 * @file models.hpp
 * @brief Typed representations of the Azure DevOps resources and the flat
 * inventory records produced from them.
 */
#ifndef ADOINVENTORY_MODELS_HPP
#define ADOINVENTORY_MODELS_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace adoi {

/// Flat, insertion-ordered row used by the exporters.
using Row = nlohmann::ordered_json;

/// Azure DevOps project (the parent resource of a scan).
struct Project {
  std::string id;
  std::string name;
  std::string state; ///< `wellFormed`, `createPending`, `deleting`, ...
};

/// Git repository inside a project.
struct Repository {
  std::string id;
  std::string name;
  std::string project_id;
  std::string project_name;
  bool disabled{false};
};

/**
 * Unit of work handed to the dispatcher.
 *
 * For pull request scans this is a repository; for variable group scans the
 * project itself plays the child role.
 */
struct ChildResource {
  std::string id;
  std::string name;
  std::string parent_id;
  std::string parent_name;
};

/// Reviewer of a pull request together with their vote.
struct Reviewer {
  std::string display_name;
  int vote{0}; ///< 10 approved, 5 approved with suggestions, -5 waiting, -10 rejected
};

/// One pull request flattened with its provenance.
struct PullRequestRecord {
  std::string organization;
  std::string project;
  std::string repository;
  int pull_request_id{0};
  std::string title;
  std::string status;
  std::string created_by;
  std::string creation_date;
  std::string source_branch;
  std::string target_branch;
  bool is_draft{false};
  std::string merge_status;

  bool has_details{false};
  std::string description;
  std::string closed_date;
  std::vector<Reviewer> reviewers;
  std::string url;
};

/// One variable of a variable group flattened with its provenance.
struct VariableRecord {
  std::string organization;
  std::string project;
  int variable_group_id{0};
  std::string variable_group_name;
  std::string variable_name;
  std::string value;
  bool is_secret{false};

  bool has_details{false};
  std::string description;
  std::string group_type;
  std::string modified_by;
  std::string modified_on;
};

/// Human readable label for a reviewer vote value.
std::string vote_label(int vote);

/// Strip a leading `refs/heads/` from a Git ref name.
std::string short_branch_name(const std::string &ref);

/**
 * Map a pull request record onto an export row.
 *
 * Detail columns are only emitted when the record carries details.
 */
Row to_row(const PullRequestRecord &record);

/// Map a variable record onto an export row.
Row to_row(const VariableRecord &record);

/// Map a project onto an export row (`id`, `name`, `state`).
Row to_row(const Project &project);

/// Convert a batch of typed records into export rows.
template <typename Record>
std::vector<Row> to_rows(const std::vector<Record> &records) {
  std::vector<Row> rows;
  rows.reserve(records.size());
  for (const auto &record : records) {
    rows.push_back(to_row(record));
  }
  return rows;
}

} // namespace adoi

#endif // ADOINVENTORY_MODELS_HPP
