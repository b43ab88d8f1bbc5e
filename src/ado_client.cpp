#include "ado_client.hpp"
#include "log.hpp"
#include "util/base64.hpp"
#include "util/wildcard.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace adoi {

namespace {

std::shared_ptr<spdlog::logger> ado_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("ado.client");
  }();
  return logger;
}

std::string string_field(const nlohmann::json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

bool bool_field(const nlohmann::json &j, const char *key) {
  auto it = j.find(key);
  return it != j.end() && it->is_boolean() && it->get<bool>();
}

int int_field(const nlohmann::json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number_integer()) {
    return 0;
  }
  return it->get<int>();
}

/// `displayName` of an identity reference such as `createdBy`.
std::string identity_name(const nlohmann::json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_object()) {
    return {};
  }
  return string_field(*it, "displayName");
}

bool is_blank(const std::string &s) {
  return std::all_of(s.begin(), s.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
}

std::string trim_trailing_slash(std::string s) {
  while (!s.empty() && s.back() == '/') {
    s.pop_back();
  }
  return s;
}

} // namespace

std::string url_escape(const std::string &segment) {
  if (segment.empty()) {
    return segment;
  }
  char *escaped = curl_easy_escape(nullptr, segment.c_str(),
                                   static_cast<int>(segment.size()));
  if (escaped == nullptr) {
    ado_log()->warn("Failed to percent-encode {}; using raw value", segment);
    return segment;
  }
  std::string encoded(escaped);
  curl_free(escaped);
  return encoded;
}

AdoClient::AdoClient(std::string organization, const std::string &pat,
                     std::unique_ptr<HttpClient> http,
                     AdoClientOptions options)
    : organization_(std::move(organization)), options_(std::move(options)) {
  if (is_blank(organization_)) {
    throw std::invalid_argument("Azure DevOps organization is required");
  }
  if (pat.empty()) {
    throw std::invalid_argument("Personal access token is required");
  }
  options_.api_base = trim_trailing_slash(options_.api_base);
  if (options_.api_base.empty()) {
    options_.api_base = "https://dev.azure.com";
  }
  if (options_.api_version.empty()) {
    options_.api_version = "7.1";
  }
  if (!http) {
    http = std::make_unique<CurlHttpClient>(
        options_.timeout_ms, options_.http_proxy, options_.https_proxy,
        options_.cancel);
  }
  http_ = std::make_unique<RetryHttpClient>(std::move(http),
                                            options_.max_retries,
                                            options_.retry_backoff_ms,
                                            options_.cancel);
  headers_ = {basic_auth_header(pat), "Accept: application/json"};
}

std::string AdoClient::org_url(const std::string &path,
                               const std::string &query) const {
  std::string url = options_.api_base + "/" + url_escape(organization_) + "/" +
                    path + "?";
  if (!query.empty()) {
    url += query + "&";
  }
  return url + "api-version=" + options_.api_version;
}

std::string AdoClient::project_url(const std::string &project,
                                   const std::string &path,
                                   const std::string &query) const {
  return org_url(url_escape(project) + "/" + path, query);
}

nlohmann::json AdoClient::send(HttpMethod method, const std::string &url,
                               const nlohmann::json *body) {
  std::string payload = body != nullptr ? body->dump() : std::string();
  std::vector<std::string> headers = headers_;
  if (body != nullptr) {
    headers.push_back("Content-Type: application/json");
  }
  std::string resp;
  switch (method) {
  case HttpMethod::Get:
    resp = http_->get(url, headers);
    break;
  case HttpMethod::Post:
    resp = http_->post(url, payload, headers);
    break;
  case HttpMethod::Put:
    resp = http_->put(url, payload, headers);
    break;
  case HttpMethod::Patch:
    resp = http_->patch(url, payload, headers);
    break;
  case HttpMethod::Delete:
    resp = http_->del(url, headers);
    break;
  }
  if (resp.empty()) {
    return nullptr;
  }
  try {
    return nlohmann::json::parse(resp);
  } catch (const nlohmann::json::parse_error &e) {
    throw std::runtime_error("Invalid JSON from " + url + ": " + e.what());
  }
}

std::vector<nlohmann::json> AdoClient::get_values(const std::string &url) {
  nlohmann::json j = send(HttpMethod::Get, url);
  std::vector<nlohmann::json> values;
  if (j.is_object() && j.contains("value") && j["value"].is_array()) {
    for (auto &item : j["value"]) {
      if (item.is_object()) {
        values.push_back(std::move(item));
      }
    }
  } else if (!j.is_null()) {
    ado_log()->debug("Response from {} has no value array", url);
  }
  return values;
}

std::vector<Project> AdoClient::list_projects() {
  std::vector<Project> projects;
  for (const auto &item : get_values(org_url("_apis/projects"))) {
    Project p{string_field(item, "id"), string_field(item, "name"),
              string_field(item, "state")};
    if (is_blank(p.name)) {
      ado_log()->debug("Skipping project {} without a name", p.id);
      continue;
    }
    if (p.state != "wellFormed") {
      ado_log()->debug("Skipping project {} in state '{}'", p.name, p.state);
      continue;
    }
    projects.push_back(std::move(p));
  }
  ado_log()->debug("Organization {} has {} usable project(s)", organization_,
                   projects.size());
  return projects;
}

std::vector<Repository> AdoClient::list_repositories(const Project &project) {
  std::vector<Repository> repos;
  std::string key = project.id.empty() ? project.name : project.id;
  for (const auto &item :
       get_values(project_url(key, "_apis/git/repositories"))) {
    Repository r;
    r.id = string_field(item, "id");
    r.name = string_field(item, "name");
    r.project_id = project.id;
    r.project_name = project.name;
    r.disabled = bool_field(item, "isDisabled");
    if (r.disabled) {
      ado_log()->debug("Skipping disabled repository {}/{}", project.name,
                       r.name);
      continue;
    }
    repos.push_back(std::move(r));
  }
  return repos;
}

std::vector<PullRequestRecord>
AdoClient::list_pull_requests(const ChildResource &repository,
                              const std::string &status,
                              bool include_details) {
  std::string project = repository.parent_id.empty() ? repository.parent_name
                                                     : repository.parent_id;
  std::string repo = repository.id.empty() ? repository.name : repository.id;
  std::string url = project_url(
      project, "_apis/git/repositories/" + url_escape(repo) + "/pullrequests",
      "searchCriteria.status=" + url_escape(status.empty() ? "active" : status));

  std::vector<PullRequestRecord> records;
  for (const auto &item : get_values(url)) {
    PullRequestRecord pr;
    pr.organization = organization_;
    pr.project = repository.parent_name;
    pr.repository = repository.name;
    pr.pull_request_id = int_field(item, "pullRequestId");
    pr.title = string_field(item, "title");
    pr.status = string_field(item, "status");
    pr.created_by = identity_name(item, "createdBy");
    pr.creation_date = string_field(item, "creationDate");
    pr.source_branch = short_branch_name(string_field(item, "sourceRefName"));
    pr.target_branch = short_branch_name(string_field(item, "targetRefName"));
    pr.is_draft = bool_field(item, "isDraft");
    pr.merge_status = string_field(item, "mergeStatus");
    if (include_details) {
      pr.has_details = true;
      pr.description = string_field(item, "description");
      pr.closed_date = string_field(item, "closedDate");
      auto reviewers = item.find("reviewers");
      if (reviewers != item.end() && reviewers->is_array()) {
        for (const auto &rv : *reviewers) {
          pr.reviewers.push_back(
              {string_field(rv, "displayName"), int_field(rv, "vote")});
        }
      }
      pr.url = options_.api_base + "/" + url_escape(organization_) + "/" +
               url_escape(repository.parent_name) + "/_git/" +
               url_escape(repository.name) + "/pullrequest/" +
               std::to_string(pr.pull_request_id);
    }
    records.push_back(std::move(pr));
  }
  return records;
}

std::vector<VariableRecord>
AdoClient::list_variable_groups(const ChildResource &project,
                                const std::vector<std::string> &group_filters,
                                bool include_details) {
  std::string key = project.id.empty() ? project.name : project.id;
  std::vector<VariableRecord> records;
  for (const auto &group :
       get_values(project_url(key, "_apis/distributedtask/variablegroups"))) {
    VariableRecord base;
    base.organization = organization_;
    base.project = project.name;
    base.variable_group_id = int_field(group, "id");
    base.variable_group_name = string_field(group, "name");
    if (!matches_any(base.variable_group_name, group_filters)) {
      continue;
    }
    if (include_details) {
      base.has_details = true;
      base.description = string_field(group, "description");
      base.group_type = string_field(group, "type");
      base.modified_by = identity_name(group, "modifiedBy");
      base.modified_on = string_field(group, "modifiedOn");
    }
    auto vars = group.find("variables");
    if (vars == group.end() || !vars->is_object() || vars->empty()) {
      records.push_back(base);
      continue;
    }
    for (auto it = vars->begin(); it != vars->end(); ++it) {
      const auto &var = it.value();
      VariableRecord rec = base;
      rec.variable_name = it.key();
      if (var.is_object()) {
        rec.value = string_field(var, "value");
        rec.is_secret = bool_field(var, "isSecret");
      }
      records.push_back(std::move(rec));
    }
  }
  return records;
}

} // namespace adoi
