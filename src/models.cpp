#include "models.hpp"

namespace adoi {

std::string vote_label(int vote) {
  switch (vote) {
  case 10:
    return "Approved";
  case 5:
    return "Approved with suggestions";
  case -5:
    return "Waiting for author";
  case -10:
    return "Rejected";
  default:
    return "No vote";
  }
}

std::string short_branch_name(const std::string &ref) {
  static const std::string prefix = "refs/heads/";
  if (ref.rfind(prefix, 0) == 0) {
    return ref.substr(prefix.size());
  }
  return ref;
}

Row to_row(const PullRequestRecord &record) {
  Row row;
  row["organization"] = record.organization;
  row["project"] = record.project;
  row["repository"] = record.repository;
  row["pullRequestId"] = record.pull_request_id;
  row["title"] = record.title;
  row["status"] = record.status;
  row["createdBy"] = record.created_by;
  row["creationDate"] = record.creation_date;
  row["sourceBranch"] = record.source_branch;
  row["targetBranch"] = record.target_branch;
  row["isDraft"] = record.is_draft;
  row["mergeStatus"] = record.merge_status;
  if (record.has_details) {
    row["description"] = record.description;
    row["closedDate"] = record.closed_date;
    Row reviewers = Row::array();
    for (const auto &reviewer : record.reviewers) {
      reviewers.push_back(reviewer.display_name + " (" +
                          vote_label(reviewer.vote) + ")");
    }
    row["reviewers"] = std::move(reviewers);
    row["url"] = record.url;
  }
  return row;
}

Row to_row(const VariableRecord &record) {
  Row row;
  row["organization"] = record.organization;
  row["project"] = record.project;
  row["variableGroupId"] = record.variable_group_id;
  row["variableGroupName"] = record.variable_group_name;
  row["variableName"] = record.variable_name;
  row["value"] = record.value;
  row["isSecret"] = record.is_secret;
  if (record.has_details) {
    row["description"] = record.description;
    row["type"] = record.group_type;
    row["modifiedBy"] = record.modified_by;
    row["modifiedOn"] = record.modified_on;
  }
  return row;
}

Row to_row(const Project &project) {
  Row row;
  row["id"] = project.id;
  row["name"] = project.name;
  row["state"] = project.state;
  return row;
}

} // namespace adoi
