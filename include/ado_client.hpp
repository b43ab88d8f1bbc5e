/**
 * @file ado_client.hpp
 * @brief Azure DevOps REST API client used by the inventory scanners.
 */
#ifndef ADOINVENTORY_ADO_CLIENT_HPP
#define ADOINVENTORY_ADO_CLIENT_HPP

#include "cancellation.hpp"
#include "http_client.hpp"
#include "models.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace adoi {

/// HTTP methods understood by AdoClient::send().
enum class HttpMethod { Get, Post, Put, Patch, Delete };

/// Connection settings for AdoClient.
struct AdoClientOptions {
  std::string api_base{"https://dev.azure.com"}; ///< Service root URL
  std::string api_version{"7.1"}; ///< Value of the `api-version` parameter
  int timeout_ms{30000};          ///< Per-request timeout
  int max_retries{3};             ///< GET retries on transient failures
  int retry_backoff_ms{100};      ///< Base delay between retries
  std::string http_proxy;         ///< Proxy for http:// URLs
  std::string https_proxy;        ///< Proxy for https:// URLs
  CancellationTokenPtr cancel;    ///< Aborts in-flight transfers when fired
};

/**
 * Thin Azure DevOps REST client.
 *
 * Authenticates with a personal access token through a Basic header computed
 * once at construction. All methods are safe to call concurrently as long as
 * the supplied HttpClient is.
 */
class AdoClient {
public:
  /**
   * Construct a client for one organization.
   *
   * @param organization Organization name, e.g. `contoso`.
   * @param pat Personal access token.
   * @param http Optional transport. A CurlHttpClient is created when null.
   *        Whatever is supplied gets wrapped in a RetryHttpClient.
   * @param options Connection settings.
   * @throws std::invalid_argument When the organization or PAT is empty.
   */
  AdoClient(std::string organization, const std::string &pat,
            std::unique_ptr<HttpClient> http = nullptr,
            AdoClientOptions options = {});

  /// Organization this client talks to.
  const std::string &organization() const { return organization_; }

  /// Service root URL without trailing slash.
  const std::string &api_base() const { return options_.api_base; }

  /**
   * List projects of the organization.
   *
   * Projects with a blank name or a state other than `wellFormed` are
   * dropped.
   *
   * @throws HttpStatusError, TransientNetworkError On request failure.
   */
  std::vector<Project> list_projects();

  /**
   * List enabled Git repositories of a project.
   *
   * @throws HttpStatusError, TransientNetworkError On request failure.
   */
  std::vector<Repository> list_repositories(const Project &project);

  /**
   * List pull requests of one repository.
   *
   * @param repository Repository as a dispatcher child (`parent_*` fields name
   *        the project).
   * @param status `active`, `completed`, `abandoned` or `all`.
   * @param include_details Populate description, reviewers and URL.
   */
  std::vector<PullRequestRecord>
  list_pull_requests(const ChildResource &repository,
                     const std::string &status = "active",
                     bool include_details = false);

  /**
   * List variable groups of a project, flattened to one record per variable.
   *
   * Groups without variables yield a single record with an empty variable
   * name so they still show up in the inventory.
   *
   * @param project Project as a dispatcher child.
   * @param group_filters Wildcard patterns on the group name; empty keeps all.
   * @param include_details Populate description, type and modification info.
   */
  std::vector<VariableRecord>
  list_variable_groups(const ChildResource &project,
                       const std::vector<std::string> &group_filters = {},
                       bool include_details = false);

  /**
   * Issue an authenticated request and decode the JSON response.
   *
   * @param method HTTP method.
   * @param url Absolute URL; `api-version` must already be present.
   * @param body Optional JSON payload for write methods.
   * @return Decoded body, or null for an empty response.
   * @throws std::runtime_error When the response is not valid JSON.
   */
  nlohmann::json send(HttpMethod method, const std::string &url,
                      const nlohmann::json *body = nullptr);

  /// Build `{base}/{organization}/{path}?api-version=...`.
  std::string org_url(const std::string &path,
                      const std::string &query = "") const;

  /// Build `{base}/{organization}/{project}/{path}?api-version=...`.
  std::string project_url(const std::string &project,
                          const std::string &path,
                          const std::string &query = "") const;

private:
  std::vector<nlohmann::json> get_values(const std::string &url);

  std::string organization_;
  std::vector<std::string> headers_;
  std::unique_ptr<HttpClient> http_;
  AdoClientOptions options_;
};

/// Percent-encode a URL path segment.
std::string url_escape(const std::string &segment);

} // namespace adoi

#endif // ADOINVENTORY_ADO_CLIENT_HPP
