#ifndef ADOINVENTORY_TESTS_FAKE_HTTP_CLIENT_HPP
#define ADOINVENTORY_TESTS_FAKE_HTTP_CLIENT_HPP

#include "http_client.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * Canned-response HTTP client. A request is answered by the longest route
 * fragment contained in its URL; unknown URLs get a 404.
 */
class FakeHttpClient : public adoi::HttpClient {
public:
  struct Route {
    std::string body;
    int status{200};
    std::chrono::milliseconds delay{0};
  };

  void on(const std::string &fragment, std::string body,
          std::chrono::milliseconds delay = std::chrono::milliseconds(0)) {
    std::lock_guard<std::mutex> lock(mutex_);
    routes_[fragment] = Route{std::move(body), 200, delay};
  }

  void fail(const std::string &fragment, int status) {
    std::lock_guard<std::mutex> lock(mutex_);
    routes_[fragment] = Route{"{\"message\":\"denied\"}", status, {}};
  }

  /// One request as seen by the fake.
  struct Request {
    std::string method;
    std::string url;
    std::string body;
    std::vector<std::string> headers;
  };

  std::string get(const std::string &url,
                  const std::vector<std::string> &headers) override {
    return respond("GET", url, {}, headers);
  }

  std::string post(const std::string &url, const std::string &data,
                   const std::vector<std::string> &headers) override {
    return respond("POST", url, data, headers);
  }

  std::string put(const std::string &url, const std::string &data,
                  const std::vector<std::string> &headers) override {
    return respond("PUT", url, data, headers);
  }

  std::string patch(const std::string &url, const std::string &data,
                    const std::vector<std::string> &headers) override {
    return respond("PATCH", url, data, headers);
  }

  std::string del(const std::string &url,
                  const std::vector<std::string> &headers) override {
    return respond("DELETE", url, {}, headers);
  }

  std::vector<Request> requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

  std::vector<std::string> urls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return urls_;
  }

  std::vector<std::string> last_headers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return headers_;
  }

private:
  std::string respond(const std::string &method, const std::string &url,
                      const std::string &data,
                      const std::vector<std::string> &headers) {
    Route route;
    bool found = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      urls_.push_back(url);
      headers_ = headers;
      requests_.push_back(Request{method, url, data, headers});
      std::size_t best = 0;
      for (const auto &[fragment, r] : routes_) {
        if (url.find(fragment) != std::string::npos &&
            fragment.size() >= best) {
          best = fragment.size();
          route = r;
          found = true;
        }
      }
    }
    if (!found) {
      throw adoi::HttpStatusError(404, "curl " + method +
                                           " failed with HTTP code 404");
    }
    if (route.delay.count() > 0) {
      std::this_thread::sleep_for(route.delay);
    }
    if (route.status < 200 || route.status >= 300) {
      throw adoi::HttpStatusError(route.status,
                                  "curl " + method + " failed with HTTP code " +
                                      std::to_string(route.status),
                                  route.body);
    }
    return route.body;
  }

  mutable std::mutex mutex_;
  std::map<std::string, Route> routes_;
  std::vector<std::string> urls_;
  std::vector<std::string> headers_;
  std::vector<Request> requests_;
};

#endif // ADOINVENTORY_TESTS_FAKE_HTTP_CLIENT_HPP
