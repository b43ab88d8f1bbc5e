/**
 * @file dispatcher.hpp
 * @brief Bounded parallel fan-out of per-resource work with an overall
 * deadline and cooperative cancellation.
 *
 * Every dispatched resource yields exactly one TaskResult: the records the
 * work produced, or an error describing why it did not.
 */
#ifndef ADOINVENTORY_DISPATCHER_HPP
#define ADOINVENTORY_DISPATCHER_HPP

#include "cancellation.hpp"
#include "models.hpp"

#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace adoi {

/// Why a task failed.
enum class FailureKind {
  None,
  PermissionDenied, ///< HTTP 401 or 403
  NotFound,         ///< HTTP 404
  TimedOut,         ///< Unfinished when the overall deadline expired
  Cancelled,        ///< Never started, or its transfer was aborted
  Other
};

/// Lower-case name of a failure kind, e.g. `permission_denied`.
std::string failure_kind_name(FailureKind kind);

/// Map an exception thrown by task work onto a failure kind.
FailureKind classify_failure(const std::exception &e);

/**
 * Outcome of processing one child resource.
 *
 * A result either carries records or an error, never both.
 */
template <typename Record> struct TaskResult {
  ChildResource resource;
  std::vector<Record> records;
  std::optional<std::string> error;
  FailureKind failure{FailureKind::None};

  bool succeeded() const { return !error.has_value(); }
};

/// Tuning knobs for a dispatch.
struct DispatchOptions {
  int throttle{10}; ///< Maximum concurrently running tasks
  /// Overall wall-clock budget; zero or negative waits indefinitely.
  std::chrono::milliseconds timeout{std::chrono::minutes(10)};
  CancellationTokenPtr stop;    ///< Caller-owned; stops handing out tasks
  CancellationTokenPtr abandon; ///< Fired when the deadline expires
  /// Called from the dispatching thread with (processed, total).
  std::function<void(std::size_t, std::size_t)> progress;
};

/// Final state of a slot once run_bounded() returns.
enum class SlotOutcome { Completed, TimedOut, Cancelled };

/**
 * Work for one slot.
 *
 * Runs on a worker thread and returns a publisher. The publisher is invoked
 * under the dispatcher lock, and only while the run is still open, so results
 * computed after the deadline are dropped.
 */
using SlotJob = std::function<std::function<void()>(std::size_t)>;

/**
 * Run `count` jobs on at most `options.throttle` threads.
 *
 * Blocks until every job has published, the deadline expires or the stop
 * token fires and running jobs have drained. Threads still busy at the
 * deadline are detached; they keep the job alive through shared ownership.
 *
 * @return One outcome per slot, indexed like the jobs.
 */
std::vector<SlotOutcome> run_bounded(std::size_t count, SlotJob job,
                                     const DispatchOptions &options);

/// Number of detached workers that have not exited yet.
std::size_t abandoned_worker_count();

/**
 * Block until every detached worker has exited or `grace` elapses.
 *
 * @return True when no detached worker is left running.
 */
bool wait_for_abandoned_workers(std::chrono::milliseconds grace);

/**
 * Run `work` for one resource, turning exceptions into a failed result.
 */
template <typename Record, typename Work>
TaskResult<Record> run_task(const ChildResource &resource, const Work &work) {
  TaskResult<Record> result;
  result.resource = resource;
  try {
    result.records = work(resource);
  } catch (const std::exception &e) {
    result.records.clear();
    result.error = e.what();
    result.failure = classify_failure(e);
  } catch (...) {
    result.records.clear();
    result.error = "unknown error";
    result.failure = FailureKind::Other;
  }
  return result;
}

/**
 * Fan `work` out over `resources` and collect one TaskResult per resource.
 *
 * Results are returned in resource order. `work` must be copyable and must
 * keep whatever it uses alive on its own, since it may outlive the call when
 * the deadline expires. It is invoked concurrently from several threads.
 *
 * @param resources Child resources to process.
 * @param options Throttle, deadline, cancellation and progress settings.
 * @param work Callable `std::vector<Record>(const ChildResource &)`.
 */
template <typename Record, typename Work>
std::vector<TaskResult<Record>>
dispatch(const std::vector<ChildResource> &resources,
         const DispatchOptions &options, Work work) {
  auto inputs = std::make_shared<const std::vector<ChildResource>>(resources);
  auto results =
      std::make_shared<std::vector<TaskResult<Record>>>(resources.size());
  SlotJob job = [inputs, results, work](std::size_t i) {
    TaskResult<Record> r = run_task<Record>((*inputs)[i], work);
    return std::function<void()>(
        [results, i, r = std::move(r)]() mutable {
          (*results)[i] = std::move(r);
        });
  };
  auto outcomes = run_bounded(resources.size(), std::move(job), options);
  for (std::size_t i = 0; i < outcomes.size(); ++i) {
    if (outcomes[i] == SlotOutcome::Completed) {
      continue;
    }
    TaskResult<Record> &r = (*results)[i];
    r.resource = resources[i];
    r.records.clear();
    if (outcomes[i] == SlotOutcome::TimedOut) {
      r.error = "timed out";
      r.failure = FailureKind::TimedOut;
    } else {
      r.error = "cancelled";
      r.failure = FailureKind::Cancelled;
    }
  }
  return std::move(*results);
}

} // namespace adoi

#endif // ADOINVENTORY_DISPATCHER_HPP
