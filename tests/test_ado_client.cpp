#include "ado_client.hpp"
#include "fake_http_client.hpp"
#include <algorithm>
#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace adoi;

namespace {

const char *kProjects = R"({"count":4,"value":[
  {"id":"p1","name":"Alpha","state":"wellFormed"},
  {"id":"p2","name":"Beta","state":"wellFormed"},
  {"id":"p3","name":"  ","state":"wellFormed"},
  {"id":"p4","name":"Pending","state":"createPending"}]})";

const char *kRepos = R"({"value":[
  {"id":"r1","name":"web"},
  {"id":"r2","name":"legacy","isDisabled":true},
  {"id":"r3","name":"api","isDisabled":false}]})";

const char *kPullRequests = R"({"value":[{
  "pullRequestId":42,
  "title":"Add login",
  "status":"active",
  "createdBy":{"displayName":"Dana"},
  "creationDate":"2024-03-01T10:00:00Z",
  "sourceRefName":"refs/heads/feature/login",
  "targetRefName":"refs/heads/main",
  "isDraft":true,
  "mergeStatus":"succeeded",
  "description":"Adds the login form",
  "reviewers":[{"displayName":"Lee","vote":10},{"displayName":"Sam","vote":-5}]
}]})";

const char *kGroups = R"({"value":[
  {"id":7,"name":"shared-settings","type":"Vsts","description":"Common",
   "modifiedBy":{"displayName":"Ops"},"modifiedOn":"2024-01-02T00:00:00Z",
   "variables":{"region":{"value":"westeurope"},
                "password":{"value":null,"isSecret":true}}},
  {"id":8,"name":"empty-group","variables":{}},
  {"id":9,"name":"other","variables":{"x":{"value":"1"}}}]})";

struct ClientFixture {
  FakeHttpClient *http;
  std::unique_ptr<AdoClient> client;

  ClientFixture() {
    auto fake = std::make_unique<FakeHttpClient>();
    http = fake.get();
    AdoClientOptions options;
    options.retry_backoff_ms = 1;
    client = std::make_unique<AdoClient>("contoso", "secret", std::move(fake),
                                         options);
  }
};

} // namespace

TEST_CASE("test ado client rejects missing credentials") {
  REQUIRE_THROWS_AS(AdoClient("", "pat", std::make_unique<FakeHttpClient>()),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(AdoClient("   ", "pat", std::make_unique<FakeHttpClient>()),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(AdoClient("contoso", "", std::make_unique<FakeHttpClient>()),
                    std::invalid_argument);
}

TEST_CASE("test ado client sends basic auth and api version") {
  ClientFixture f;
  f.http->on("/_apis/projects?", kProjects);
  f.client->list_projects();

  auto urls = f.http->urls();
  REQUIRE(urls.size() == 1);
  REQUIRE(urls[0] ==
          "https://dev.azure.com/contoso/_apis/projects?api-version=7.1");
  auto headers = f.http->last_headers();
  REQUIRE(std::find(headers.begin(), headers.end(),
                    "Authorization: Basic OnNlY3JldA==") != headers.end());
  REQUIRE(std::find(headers.begin(), headers.end(),
                    "Accept: application/json") != headers.end());
}

TEST_CASE("test ado client url building") {
  auto fake = std::make_unique<FakeHttpClient>();
  AdoClientOptions options;
  options.api_base = "https://ado.example.com/tfs/";
  options.api_version = "6.0";
  AdoClient client("My Org", "pat", std::move(fake), options);
  REQUIRE(client.api_base() == "https://ado.example.com/tfs");
  REQUIRE(client.org_url("_apis/projects") ==
          "https://ado.example.com/tfs/My%20Org/_apis/projects?api-version=6.0");
  REQUIRE(client.project_url("Team A", "_apis/git/repositories", "top=5") ==
          "https://ado.example.com/tfs/My%20Org/Team%20A/"
          "_apis/git/repositories?top=5&api-version=6.0");
}

TEST_CASE("test ado client keeps only named well formed projects") {
  ClientFixture f;
  f.http->on("/_apis/projects?", kProjects);
  auto projects = f.client->list_projects();
  REQUIRE(projects.size() == 2);
  REQUIRE(projects[0].id == "p1");
  REQUIRE(projects[0].name == "Alpha");
  REQUIRE(projects[1].name == "Beta");
}

TEST_CASE("test ado client skips disabled repositories") {
  ClientFixture f;
  f.http->on("/p1/_apis/git/repositories?", kRepos);
  auto repos = f.client->list_repositories({"p1", "Alpha", "wellFormed"});
  REQUIRE(repos.size() == 2);
  REQUIRE(repos[0].name == "web");
  REQUIRE(repos[0].project_id == "p1");
  REQUIRE(repos[0].project_name == "Alpha");
  REQUIRE(repos[1].name == "api");
}

TEST_CASE("test ado client parses pull requests") {
  ClientFixture f;
  f.http->on("/repositories/r1/pullrequests", kPullRequests);
  ChildResource repo{"r1", "web", "p1", "Alpha"};

  auto prs = f.client->list_pull_requests(repo, "active", false);
  REQUIRE(prs.size() == 1);
  const auto &pr = prs[0];
  REQUIRE(pr.organization == "contoso");
  REQUIRE(pr.project == "Alpha");
  REQUIRE(pr.repository == "web");
  REQUIRE(pr.pull_request_id == 42);
  REQUIRE(pr.title == "Add login");
  REQUIRE(pr.created_by == "Dana");
  REQUIRE(pr.source_branch == "feature/login");
  REQUIRE(pr.target_branch == "main");
  REQUIRE(pr.is_draft);
  REQUIRE(pr.merge_status == "succeeded");
  REQUIRE_FALSE(pr.has_details);
  REQUIRE(pr.reviewers.empty());

  auto urls = f.http->urls();
  REQUIRE(urls.back() == "https://dev.azure.com/contoso/p1/_apis/git/"
                         "repositories/r1/pullrequests?"
                         "searchCriteria.status=active&api-version=7.1");
}

TEST_CASE("test ado client pull request details") {
  ClientFixture f;
  f.http->on("/repositories/r1/pullrequests", kPullRequests);
  ChildResource repo{"r1", "web", "p1", "Alpha"};

  auto prs = f.client->list_pull_requests(repo, "all", true);
  REQUIRE(prs.size() == 1);
  const auto &pr = prs[0];
  REQUIRE(pr.has_details);
  REQUIRE(pr.description == "Adds the login form");
  REQUIRE(pr.closed_date.empty());
  REQUIRE(pr.reviewers.size() == 2);
  REQUIRE(pr.reviewers[0].display_name == "Lee");
  REQUIRE(pr.reviewers[0].vote == 10);
  REQUIRE(pr.reviewers[1].vote == -5);
  REQUIRE(pr.url ==
          "https://dev.azure.com/contoso/Alpha/_git/web/pullrequest/42");
  REQUIRE(f.http->urls().back().find("searchCriteria.status=all") !=
          std::string::npos);
}

TEST_CASE("test ado client flattens variable groups") {
  ClientFixture f;
  f.http->on("/p1/_apis/distributedtask/variablegroups", kGroups);
  ChildResource project{"p1", "Alpha", "p1", "Alpha"};

  auto vars = f.client->list_variable_groups(project, {}, false);
  REQUIRE(vars.size() == 4);
  REQUIRE(vars[0].variable_group_id == 7);
  REQUIRE(vars[0].variable_group_name == "shared-settings");
  REQUIRE(vars[0].variable_name == "password");
  REQUIRE(vars[0].value.empty());
  REQUIRE(vars[0].is_secret);
  REQUIRE(vars[1].variable_name == "region");
  REQUIRE(vars[1].value == "westeurope");
  REQUIRE_FALSE(vars[1].is_secret);
  REQUIRE(vars[2].variable_group_name == "empty-group");
  REQUIRE(vars[2].variable_name.empty());
  REQUIRE(vars[3].variable_group_name == "other");
  for (const auto &v : vars) {
    REQUIRE(v.organization == "contoso");
    REQUIRE(v.project == "Alpha");
    REQUIRE_FALSE(v.has_details);
  }
}

TEST_CASE("test ado client variable group filter and details") {
  ClientFixture f;
  f.http->on("/p1/_apis/distributedtask/variablegroups", kGroups);
  ChildResource project{"p1", "Alpha", "p1", "Alpha"};

  auto vars = f.client->list_variable_groups(project, {"SHARED-*"}, true);
  REQUIRE(vars.size() == 2);
  REQUIRE(vars[0].has_details);
  REQUIRE(vars[0].description == "Common");
  REQUIRE(vars[0].group_type == "Vsts");
  REQUIRE(vars[0].modified_by == "Ops");
  REQUIRE(vars[0].modified_on == "2024-01-02T00:00:00Z");
}

TEST_CASE("test ado client reports invalid json") {
  ClientFixture f;
  f.http->on("/_apis/projects?", "<html>sign in</html>");
  REQUIRE_THROWS_AS(f.client->list_projects(), std::runtime_error);
}

TEST_CASE("test ado client propagates status errors") {
  ClientFixture f;
  f.http->fail("/p1/_apis/git/repositories?", 403);
  try {
    f.client->list_repositories({"p1", "Alpha", "wellFormed"});
    FAIL("expected HttpStatusError");
  } catch (const HttpStatusError &e) {
    REQUIRE(e.status == 403);
  }
  REQUIRE(f.http->urls().size() == 1);
}

TEST_CASE("test ado client empty response") {
  ClientFixture f;
  f.http->on("/_apis/projects?", "");
  REQUIRE(f.client->list_projects().empty());
  REQUIRE(f.client->send(HttpMethod::Get, f.client->org_url("_apis/projects"))
              .is_null());
}

TEST_CASE("test ado client write methods send json body") {
  ClientFixture f;
  f.http->on("/_apis/wit/workitems", R"({"id":5,"rev":2})");
  std::string url = f.client->project_url("Alpha", "_apis/wit/workitems/5");
  nlohmann::json payload = {{"op", "add"}, {"value", "Ready"}};

  auto post = f.client->send(HttpMethod::Post, url, &payload);
  REQUIRE(post["id"] == 5);
  f.client->send(HttpMethod::Put, url, &payload);
  f.client->send(HttpMethod::Patch, url, &payload);

  auto requests = f.http->requests();
  REQUIRE(requests.size() == 3);
  const char *methods[] = {"POST", "PUT", "PATCH"};
  for (std::size_t i = 0; i < requests.size(); ++i) {
    const auto &req = requests[i];
    REQUIRE(req.method == methods[i]);
    REQUIRE(req.url == url);
    REQUIRE(nlohmann::json::parse(req.body) == payload);
    REQUIRE(std::find(req.headers.begin(), req.headers.end(),
                      "Content-Type: application/json") != req.headers.end());
    REQUIRE(std::find(req.headers.begin(), req.headers.end(),
                      "Authorization: Basic OnNlY3JldA==") !=
            req.headers.end());
  }
}

TEST_CASE("test ado client delete sends no body") {
  ClientFixture f;
  f.http->on("/_apis/wit/workitems/5", "");
  std::string url = f.client->project_url("Alpha", "_apis/wit/workitems/5");
  REQUIRE(f.client->send(HttpMethod::Delete, url).is_null());

  auto requests = f.http->requests();
  REQUIRE(requests.size() == 1);
  REQUIRE(requests[0].method == "DELETE");
  REQUIRE(requests[0].body.empty());
  REQUIRE(std::find(requests[0].headers.begin(), requests[0].headers.end(),
                    "Content-Type: application/json") ==
          requests[0].headers.end());
  REQUIRE(std::find(requests[0].headers.begin(), requests[0].headers.end(),
                    "Authorization: Basic OnNlY3JldA==") !=
          requests[0].headers.end());
}

TEST_CASE("test ado client write failures are not retried") {
  ClientFixture f;
  f.http->fail("/_apis/wit/workitems", 503);
  std::string url = f.client->project_url("Alpha", "_apis/wit/workitems/5");
  nlohmann::json payload = {{"op", "add"}};
  REQUIRE_THROWS_AS(f.client->send(HttpMethod::Patch, url, &payload),
                    HttpStatusError);
  REQUIRE(f.http->requests().size() == 1);
}

TEST_CASE("test url escape from many threads") {
  std::vector<std::thread> threads;
  std::atomic<int> mismatches{0};
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&mismatches] {
      for (int i = 0; i < 200; ++i) {
        if (url_escape("My Project/#1") != "My%20Project%2F%231") {
          ++mismatches;
        }
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }
  REQUIRE(mismatches == 0);
  REQUIRE(url_escape("").empty());
}
