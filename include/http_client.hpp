/**
 * @file http_client.hpp
 * @brief HTTP transport abstraction, libcurl implementation, and retry
 * decorator.
 */
#ifndef ADOINVENTORY_HTTP_CLIENT_HPP
#define ADOINVENTORY_HTTP_CLIENT_HPP

#include "cancellation.hpp"

#include <chrono>
#include <curl/curl.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace adoi {

/// Raised when the server answers with a non-2xx status.
class HttpStatusError : public std::runtime_error {
public:
  HttpStatusError(int status, const std::string &message, std::string body = {})
      : std::runtime_error(message), status(status), body(std::move(body)) {}

  int status;       ///< HTTP status code
  std::string body; ///< Response body returned with the error
};

/// Raised on transport-level failures (DNS, connect, TLS, timeouts).
class TransientNetworkError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Raised when a transfer was aborted because its cancellation token fired.
class RequestCancelledError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/** Interface for performing HTTP requests. */
class HttpClient {
public:
  virtual ~HttpClient() = default;

  /**
   * Perform a HTTP GET request.
   *
   * @param url Absolute request URL.
   * @param headers Additional request headers expressed as `Header: value`
   *        strings.
   * @return Response body content as a UTF-8 string.
   * @throws HttpStatusError On non-2xx responses.
   * @throws TransientNetworkError On transport failures.
   */
  virtual std::string get(const std::string &url,
                          const std::vector<std::string> &headers) = 0;

  /// Perform a HTTP POST request. Unsupported unless overridden.
  virtual std::string post(const std::string &url, const std::string &data,
                           const std::vector<std::string> &headers) {
    (void)url;
    (void)data;
    (void)headers;
    throw std::runtime_error("POST not implemented");
  }

  /// Perform a HTTP PUT request. Unsupported unless overridden.
  virtual std::string put(const std::string &url, const std::string &data,
                          const std::vector<std::string> &headers) {
    (void)url;
    (void)data;
    (void)headers;
    throw std::runtime_error("PUT not implemented");
  }

  /// Perform a HTTP PATCH request. Unsupported unless overridden.
  virtual std::string patch(const std::string &url, const std::string &data,
                            const std::vector<std::string> &headers) {
    (void)url;
    (void)data;
    (void)headers;
    throw std::runtime_error("PATCH not implemented");
  }

  /// Perform a HTTP DELETE request. Unsupported unless overridden.
  virtual std::string del(const std::string &url,
                          const std::vector<std::string> &headers) {
    (void)url;
    (void)headers;
    throw std::runtime_error("DELETE not implemented");
  }
};

/**
 * RAII wrapper for a CURL easy handle ensuring global CURL initialization.
 */
class CurlHandle {
public:
  CurlHandle();
  ~CurlHandle();
  CurlHandle(const CurlHandle &) = delete;
  CurlHandle &operator=(const CurlHandle &) = delete;

  /// Borrowed pointer to the managed easy handle.
  CURL *get() const { return handle_; }

private:
  CURL *handle_;
};

/**
 * CURL-based HTTP client implementation.
 *
 * Each request uses its own easy handle, so one instance can be shared by
 * all dispatcher workers.
 */
class CurlHttpClient : public HttpClient {
public:
  /**
   * Construct a CURL based HTTP client.
   *
   * @param timeout_ms Request timeout in milliseconds for individual
   *        operations.
   * @param http_proxy Proxy URL for HTTP requests.
   * @param https_proxy Proxy URL for HTTPS requests.
   * @param cancel Optional token; when it fires, in-flight transfers abort
   *        with RequestCancelledError.
   */
  explicit CurlHttpClient(long timeout_ms = 30000, std::string http_proxy = {},
                          std::string https_proxy = {},
                          CancellationTokenPtr cancel = nullptr);

  /// @copydoc HttpClient::get()
  std::string get(const std::string &url,
                  const std::vector<std::string> &headers) override;

  /// @copydoc HttpClient::post()
  std::string post(const std::string &url, const std::string &data,
                   const std::vector<std::string> &headers) override;

  /// @copydoc HttpClient::put()
  std::string put(const std::string &url, const std::string &data,
                  const std::vector<std::string> &headers) override;

  /// @copydoc HttpClient::patch()
  std::string patch(const std::string &url, const std::string &data,
                    const std::vector<std::string> &headers) override;

  /// @copydoc HttpClient::del()
  std::string del(const std::string &url,
                  const std::vector<std::string> &headers) override;

private:
  std::string perform(const char *verb, const std::string &url,
                       const std::string *data,
                       const std::vector<std::string> &headers);
  void apply_proxy(CURL *curl, const std::string &url) const;

  long timeout_ms_;
  std::string http_proxy_;
  std::string https_proxy_;
  CancellationTokenPtr cancel_;
};

/**
 * HTTP client decorator that retries idempotent GET requests with exponential
 * backoff when the failure looks transient.
 *
 * Transport errors, HTTP 5xx and HTTP 429 are retried. Writes are passed
 * through untouched.
 */
class RetryHttpClient : public HttpClient {
public:
  /**
   * @param inner Underlying client performing real requests.
   * @param max_retries Maximum retries after the first attempt, clamped to
   *        `kMaxRetries`.
   * @param backoff_ms Base delay; attempt `n` waits `backoff_ms * 2^n`,
   *        capped at `kMaxBackoffMs`.
   * @param cancel Optional token; retries stop once it fires.
   */
  RetryHttpClient(std::unique_ptr<HttpClient> inner, int max_retries,
                  int backoff_ms, CancellationTokenPtr cancel = nullptr);

  std::string get(const std::string &url,
                  const std::vector<std::string> &headers) override;
  std::string post(const std::string &url, const std::string &data,
                   const std::vector<std::string> &headers) override;
  std::string put(const std::string &url, const std::string &data,
                  const std::vector<std::string> &headers) override;
  std::string patch(const std::string &url, const std::string &data,
                    const std::vector<std::string> &headers) override;
  std::string del(const std::string &url,
                  const std::vector<std::string> &headers) override;

  static constexpr int kMaxRetries = 10;
  static constexpr long long kMaxBackoffMs = 60000;

  /// Delay before retry number `attempt` (zero based).
  static std::chrono::milliseconds backoff_delay(int backoff_ms, int attempt);

  /// Whether an exception from the inner client is worth another attempt.
  static bool is_transient(const std::exception &e);

private:
  template <typename F> auto with_retries(const std::string &url, F f)
      -> decltype(f());

  std::unique_ptr<HttpClient> inner_;
  int max_retries_;
  int backoff_ms_;
  CancellationTokenPtr cancel_;
};

} // namespace adoi

#endif // ADOINVENTORY_HTTP_CLIENT_HPP
