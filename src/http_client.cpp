/**
 * @file http_client.cpp
 * @brief libcurl transport and retry decorator.
 */

#include "http_client.hpp"
#include "log.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <mutex>
#include <sstream>
#include <thread>

namespace adoi {

namespace {

std::shared_ptr<spdlog::logger> http_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("http");
  }();
  return logger;
}

/**
 * Create a human readable error message for a CURL request.
 *
 * @param verb HTTP verb attempted.
 * @param url Request URL.
 * @param code CURL error code.
 * @param errbuf Optional buffer with extended error text.
 * @return Combined error description.
 */
std::string format_curl_error(const char *verb, const std::string &url,
                              CURLcode code, const char *errbuf) {
  std::ostringstream oss;
  oss << "curl " << verb;
  if (!url.empty()) {
    oss << ' ' << url;
  }
  oss << " failed: " << curl_easy_strerror(code);
  if (errbuf != nullptr && errbuf[0] != '\0') {
    oss << " - " << errbuf;
  }
  return oss.str();
}

/**
 * RAII wrapper managing a CURL linked list of headers.
 */
struct CurlSlist {
  curl_slist *list{nullptr};
  CurlSlist() = default;
  ~CurlSlist() { curl_slist_free_all(list); }
  void append(const std::string &s) {
    list = curl_slist_append(list, s.c_str());
  }
  curl_slist *get() const { return list; }
  CurlSlist(const CurlSlist &) = delete;
  CurlSlist &operator=(const CurlSlist &) = delete;
};

size_t write_callback(void *contents, size_t size, size_t nmemb, void *userp) {
  size_t total = size * nmemb;
  auto *s = static_cast<std::string *>(userp);
  s->append(static_cast<char *>(contents), total);
  return total;
}

/// Transfer-progress hook; a non-zero return aborts the transfer.
int progress_callback(void *clientp, curl_off_t, curl_off_t, curl_off_t,
                      curl_off_t) {
  const auto *token = static_cast<const CancellationToken *>(clientp);
  return token != nullptr && token->cancelled() ? 1 : 0;
}

} // namespace

CurlHandle::CurlHandle() {
  static std::once_flag flag;
  std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
  handle_ = curl_easy_init();
  if (!handle_) {
    throw TransientNetworkError("Failed to init curl");
  }
}

CurlHandle::~CurlHandle() { curl_easy_cleanup(handle_); }

CurlHttpClient::CurlHttpClient(long timeout_ms, std::string http_proxy,
                               std::string https_proxy,
                               CancellationTokenPtr cancel)
    : timeout_ms_(timeout_ms), http_proxy_(std::move(http_proxy)),
      https_proxy_(std::move(https_proxy)), cancel_(std::move(cancel)) {}

/**
 * Configure proxy settings on the CURL handle based on the request URL.
 */
void CurlHttpClient::apply_proxy(CURL *curl, const std::string &url) const {
  const std::string *proxy = nullptr;
  if (url.rfind("https://", 0) == 0) {
    proxy = !https_proxy_.empty() ? &https_proxy_
                                  : (!http_proxy_.empty() ? &http_proxy_
                                                          : nullptr);
    if (proxy) {
      curl_easy_setopt(curl, CURLOPT_HTTPPROXYTUNNEL, 1L);
    }
  } else if (url.rfind("http://", 0) == 0 && !http_proxy_.empty()) {
    proxy = &http_proxy_;
  }
  if (proxy) {
    curl_easy_setopt(curl, CURLOPT_PROXY, proxy->c_str());
  }
}

/**
 * Execute one request on a fresh easy handle.
 *
 * @param verb HTTP method name.
 * @param url Absolute URL.
 * @param data Request body, or null for body-less methods.
 * @param headers Extra request headers.
 * @return Body of a 2xx response.
 * @throws HttpStatusError When the status is outside 2xx.
 * @throws TransientNetworkError When libcurl reports a transport failure.
 * @throws RequestCancelledError When the cancellation token aborted the
 *         transfer.
 */
std::string CurlHttpClient::perform(const char *verb, const std::string &url,
                                    const std::string *data,
                                    const std::vector<std::string> &headers) {
  CurlHandle handle;
  CURL *curl = handle.get();
  std::string body;
  long status_code = 0;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  apply_proxy(curl, url);
  if (std::string(verb) != "GET") {
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, verb);
  }
  if (data != nullptr) {
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, data->c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                     static_cast<curl_off_t>(data->size()));
  }
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  if (cancel_) {
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, cancel_.get());
  }
  char errbuf[CURL_ERROR_SIZE];
  errbuf[0] = '\0';
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
  CurlSlist header_list;
  for (const auto &h : headers) {
    header_list.append(h);
  }
  header_list.append("User-Agent: adoinventory");
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());

  http_log()->trace("{} {}", verb, url);
  CURLcode res = curl_easy_perform(curl);
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);

  if (res == CURLE_ABORTED_BY_CALLBACK) {
    throw RequestCancelledError(std::string("curl ") + verb + " " + url +
                                " cancelled");
  }
  if (res != CURLE_OK) {
    std::string msg = format_curl_error(verb, url, res, errbuf);
    http_log()->debug(msg);
    throw TransientNetworkError(msg);
  }
  if (status_code < 200 || status_code >= 300) {
    http_log()->debug("curl {} {} failed with HTTP code {}", verb, url,
                      status_code);
    throw HttpStatusError(static_cast<int>(status_code),
                          std::string("curl ") + verb +
                              " failed with HTTP code " +
                              std::to_string(status_code),
                          std::move(body));
  }
  return body;
}

std::string CurlHttpClient::get(const std::string &url,
                                const std::vector<std::string> &headers) {
  return perform("GET", url, nullptr, headers);
}

std::string CurlHttpClient::post(const std::string &url,
                                 const std::string &data,
                                 const std::vector<std::string> &headers) {
  return perform("POST", url, &data, headers);
}

std::string CurlHttpClient::put(const std::string &url, const std::string &data,
                                const std::vector<std::string> &headers) {
  return perform("PUT", url, &data, headers);
}

std::string CurlHttpClient::patch(const std::string &url,
                                  const std::string &data,
                                  const std::vector<std::string> &headers) {
  return perform("PATCH", url, &data, headers);
}

std::string CurlHttpClient::del(const std::string &url,
                                const std::vector<std::string> &headers) {
  return perform("DELETE", url, nullptr, headers);
}

RetryHttpClient::RetryHttpClient(std::unique_ptr<HttpClient> inner,
                                 int max_retries, int backoff_ms,
                                 CancellationTokenPtr cancel)
    : inner_(std::move(inner)),
      max_retries_(std::clamp(max_retries, 0, kMaxRetries)),
      backoff_ms_(backoff_ms < 0 ? 0 : backoff_ms), cancel_(std::move(cancel)) {}

std::chrono::milliseconds RetryHttpClient::backoff_delay(int backoff_ms,
                                                         int attempt) {
  long long delay = backoff_ms < 0 ? 0 : backoff_ms;
  for (int i = 0; i < attempt && delay < kMaxBackoffMs; ++i) {
    delay *= 2;
  }
  return std::chrono::milliseconds(std::min(delay, kMaxBackoffMs));
}

/**
 * Execute a GET with retry handling.
 */
template <typename F>
auto RetryHttpClient::with_retries(const std::string &url, F f)
    -> decltype(f()) {
  int attempt = 0;
  while (true) {
    try {
      return f();
    } catch (const std::exception &e) {
      if (attempt >= max_retries_ || !is_transient(e) ||
          is_cancelled(cancel_)) {
        throw;
      }
      auto delay = backoff_delay(backoff_ms_, attempt);
      http_log()->warn("GET {} failed ({}); retry {}/{} in {} ms", url,
                       e.what(), attempt + 1, max_retries_, delay.count());
      std::this_thread::sleep_for(delay);
      ++attempt;
    }
  }
}

bool RetryHttpClient::is_transient(const std::exception &e) {
  if (dynamic_cast<const RequestCancelledError *>(&e)) {
    return false;
  }
  if (dynamic_cast<const TransientNetworkError *>(&e)) {
    return true;
  }
  if (const auto *http_err = dynamic_cast<const HttpStatusError *>(&e)) {
    return http_err->status == 429 ||
           (http_err->status >= 500 && http_err->status < 600);
  }
  return false;
}

std::string RetryHttpClient::get(const std::string &url,
                                 const std::vector<std::string> &headers) {
  return with_retries(url, [&] { return inner_->get(url, headers); });
}

std::string RetryHttpClient::post(const std::string &url,
                                  const std::string &data,
                                  const std::vector<std::string> &headers) {
  return inner_->post(url, data, headers);
}

std::string RetryHttpClient::put(const std::string &url,
                                 const std::string &data,
                                 const std::vector<std::string> &headers) {
  return inner_->put(url, data, headers);
}

std::string RetryHttpClient::patch(const std::string &url,
                                   const std::string &data,
                                   const std::vector<std::string> &headers) {
  return inner_->patch(url, data, headers);
}

std::string RetryHttpClient::del(const std::string &url,
                                 const std::vector<std::string> &headers) {
  return inner_->del(url, headers);
}

} // namespace adoi
