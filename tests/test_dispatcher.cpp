#include "dispatcher.hpp"
#include "http_client.hpp"
#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace adoi;
using namespace std::chrono_literals;

namespace {

std::vector<ChildResource> make_resources(int n) {
  std::vector<ChildResource> resources;
  for (int i = 0; i < n; ++i) {
    std::string id = std::to_string(i);
    resources.push_back({"r" + id, "repo" + id, "p", "Project"});
  }
  return resources;
}

} // namespace

TEST_CASE("test dispatch returns one result per resource") {
  auto resources = make_resources(25);
  DispatchOptions options;
  options.throttle = 4;
  auto results = dispatch<int>(resources, options,
                               [](const ChildResource &r) {
                                 return std::vector<int>{
                                     std::stoi(r.id.substr(1))};
                               });
  REQUIRE(results.size() == 25);
  for (std::size_t i = 0; i < results.size(); ++i) {
    REQUIRE(results[i].succeeded());
    REQUIRE(results[i].resource.id == resources[i].id);
    REQUIRE(results[i].records == std::vector<int>{static_cast<int>(i)});
    REQUIRE(results[i].failure == FailureKind::None);
  }
}

TEST_CASE("test dispatch isolates task failures") {
  auto resources = make_resources(6);
  DispatchOptions options;
  options.throttle = 3;
  auto results =
      dispatch<int>(resources, options, [](const ChildResource &r) {
        if (r.id == "r2") {
          throw std::runtime_error("boom");
        }
        if (r.id == "r4") {
          throw HttpStatusError(403, "curl GET failed with HTTP code 403");
        }
        return std::vector<int>{1, 2};
      });
  REQUIRE(results.size() == 6);
  std::size_t ok = 0;
  for (const auto &r : results) {
    if (r.succeeded()) {
      ++ok;
      REQUIRE(r.records.size() == 2);
    }
  }
  REQUIRE(ok == 4);
  REQUIRE_FALSE(results[2].succeeded());
  REQUIRE(*results[2].error == "boom");
  REQUIRE(results[2].failure == FailureKind::Other);
  REQUIRE(results[2].records.empty());
  REQUIRE(results[4].failure == FailureKind::PermissionDenied);
}

TEST_CASE("test dispatch respects throttle") {
  auto resources = make_resources(20);
  DispatchOptions options;
  options.throttle = 3;
  auto running = std::make_shared<std::atomic<int>>(0);
  auto peak = std::make_shared<std::atomic<int>>(0);
  auto results =
      dispatch<int>(resources, options, [running, peak](const ChildResource &) {
        int now = ++*running;
        int seen = peak->load();
        while (now > seen && !peak->compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(5ms);
        --*running;
        return std::vector<int>{};
      });
  REQUIRE(results.size() == 20);
  REQUIRE(peak->load() <= 3);
  REQUIRE(peak->load() >= 1);
}

TEST_CASE("test dispatch times out without hanging") {
  auto resources = make_resources(3);
  auto abandon = std::make_shared<CancellationToken>();
  DispatchOptions options;
  options.throttle = 3;
  options.timeout = 100ms;
  options.abandon = abandon;

  auto started = std::chrono::steady_clock::now();
  auto results = dispatch<int>(
      resources, options, [abandon](const ChildResource &r) {
        if (r.id == "r0") {
          return std::vector<int>{7};
        }
        for (int i = 0; i < 500 && !abandon->cancelled(); ++i) {
          std::this_thread::sleep_for(10ms);
        }
        return std::vector<int>{1};
      });
  auto elapsed = std::chrono::steady_clock::now() - started;

  REQUIRE(elapsed < 3s);
  REQUIRE(abandon->cancelled());
  REQUIRE(results.size() == 3);
  REQUIRE(results[0].succeeded());
  REQUIRE(results[0].records == std::vector<int>{7});
  for (std::size_t i = 1; i < 3; ++i) {
    REQUIRE_FALSE(results[i].succeeded());
    REQUIRE(results[i].failure == FailureKind::TimedOut);
    REQUIRE(results[i].records.empty());
    REQUIRE(results[i].resource.id == resources[i].id);
  }
  REQUIRE(wait_for_abandoned_workers(5s));
  REQUIRE(abandoned_worker_count() == 0);
}

TEST_CASE("test dispatch counts abandoned workers until they exit") {
  REQUIRE(wait_for_abandoned_workers(5s));
  auto resources = make_resources(2);
  auto release = std::make_shared<std::atomic<bool>>(false);
  DispatchOptions options;
  options.throttle = 2;
  options.timeout = 50ms;

  auto results = dispatch<int>(
      resources, options, [release](const ChildResource &) {
        while (!release->load()) {
          std::this_thread::sleep_for(5ms);
        }
        return std::vector<int>{1};
      });
  REQUIRE(results.size() == 2);
  REQUIRE(abandoned_worker_count() == 2);
  REQUIRE_FALSE(wait_for_abandoned_workers(20ms));

  release->store(true);
  REQUIRE(wait_for_abandoned_workers(5s));
  REQUIRE(abandoned_worker_count() == 0);
}

TEST_CASE("test dispatch stop token cancels pending tasks") {
  auto resources = make_resources(5);
  auto stop = std::make_shared<CancellationToken>();
  DispatchOptions options;
  options.throttle = 1;
  options.stop = stop;
  auto results = dispatch<int>(resources, options,
                               [stop](const ChildResource &r) {
                                 if (r.id == "r1") {
                                   stop->cancel();
                                 }
                                 return std::vector<int>{1};
                               });
  REQUIRE(results.size() == 5);
  REQUIRE(results[0].succeeded());
  REQUIRE(results[1].succeeded());
  for (std::size_t i = 2; i < 5; ++i) {
    REQUIRE(results[i].failure == FailureKind::Cancelled);
    REQUIRE(*results[i].error == "cancelled");
  }
}

TEST_CASE("test dispatch reports progress") {
  auto resources = make_resources(8);
  DispatchOptions options;
  options.throttle = 2;
  std::vector<std::size_t> seen;
  std::size_t reported_total = 0;
  options.progress = [&](std::size_t done, std::size_t total) {
    seen.push_back(done);
    reported_total = total;
  };
  dispatch<int>(resources, options,
                [](const ChildResource &) { return std::vector<int>{}; });
  REQUIRE_FALSE(seen.empty());
  REQUIRE(seen.back() == 8);
  REQUIRE(reported_total == 8);
  for (std::size_t i = 1; i < seen.size(); ++i) {
    REQUIRE(seen[i] > seen[i - 1]);
  }
}

TEST_CASE("test dispatch with no resources") {
  DispatchOptions options;
  bool called = false;
  options.progress = [&](std::size_t, std::size_t) { called = true; };
  auto results = dispatch<int>(std::vector<ChildResource>{}, options,
                               [](const ChildResource &) {
                                 return std::vector<int>{1};
                               });
  REQUIRE(results.empty());
  REQUIRE_FALSE(called);
}

TEST_CASE("test failure classification") {
  REQUIRE(classify_failure(HttpStatusError(401, "e")) ==
          FailureKind::PermissionDenied);
  REQUIRE(classify_failure(HttpStatusError(403, "e")) ==
          FailureKind::PermissionDenied);
  REQUIRE(classify_failure(HttpStatusError(404, "e")) == FailureKind::NotFound);
  REQUIRE(classify_failure(HttpStatusError(500, "e")) == FailureKind::Other);
  REQUIRE(classify_failure(RequestCancelledError("e")) ==
          FailureKind::Cancelled);
  REQUIRE(classify_failure(std::runtime_error("e")) == FailureKind::Other);
  REQUIRE(failure_kind_name(FailureKind::PermissionDenied) ==
          "permission_denied");
  REQUIRE(failure_kind_name(FailureKind::TimedOut) == "timed_out");
}
