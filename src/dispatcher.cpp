#include "dispatcher.hpp"
#include "http_client.hpp"
#include "log.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace adoi {

namespace {

std::shared_ptr<spdlog::logger> dispatch_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("dispatch");
  }();
  return logger;
}

enum class SlotState { Pending, Running, Completed };

/**
 * State shared between the dispatching thread and its workers.
 *
 * Owned through shared_ptr so detached workers can finish after the
 * dispatcher has returned.
 */
struct DispatchState {
  std::mutex mutex;
  std::condition_variable cv;
  std::vector<SlotState> slots;
  std::size_t next{0};
  std::size_t finished{0};
  std::size_t alive{0};
  bool closed{false};
  bool detached{false};
  SlotJob job;
  CancellationTokenPtr stop;
};

/// Process-wide count of workers left running after a deadline.
struct AbandonedWorkers {
  std::mutex mutex;
  std::condition_variable cv;
  std::size_t live{0};
};

// Never destroyed, so late workers can still report their exit.
AbandonedWorkers &abandoned() {
  static auto *workers = new AbandonedWorkers;
  return *workers;
}

/// @return Whether the worker had been detached by the dispatcher.
bool worker_loop(const std::shared_ptr<DispatchState> &state) {
  while (true) {
    std::size_t index = 0;
    {
      std::lock_guard<std::mutex> lock(state->mutex);
      if (state->closed || state->next >= state->slots.size() ||
          is_cancelled(state->stop)) {
        --state->alive;
        state->cv.notify_all();
        return state->detached;
      }
      index = state->next++;
      state->slots[index] = SlotState::Running;
    }
    std::function<void()> publish = state->job(index);
    {
      std::lock_guard<std::mutex> lock(state->mutex);
      if (!state->closed && state->slots[index] == SlotState::Running) {
        if (publish) {
          publish();
        }
        state->slots[index] = SlotState::Completed;
        ++state->finished;
      } else {
        dispatch_log()->debug("Discarding late result for slot {}", index);
      }
    }
    state->cv.notify_all();
  }
}

void worker(std::shared_ptr<DispatchState> state) {
  bool detached = worker_loop(state);
  state.reset();
  if (detached) {
    auto &workers = abandoned();
    std::lock_guard<std::mutex> lock(workers.mutex);
    --workers.live;
    workers.cv.notify_all();
  }
}

} // namespace

std::string failure_kind_name(FailureKind kind) {
  switch (kind) {
  case FailureKind::None:
    return "none";
  case FailureKind::PermissionDenied:
    return "permission_denied";
  case FailureKind::NotFound:
    return "not_found";
  case FailureKind::TimedOut:
    return "timed_out";
  case FailureKind::Cancelled:
    return "cancelled";
  case FailureKind::Other:
    break;
  }
  return "other";
}

FailureKind classify_failure(const std::exception &e) {
  if (const auto *status = dynamic_cast<const HttpStatusError *>(&e)) {
    if (status->status == 401 || status->status == 403) {
      return FailureKind::PermissionDenied;
    }
    if (status->status == 404) {
      return FailureKind::NotFound;
    }
    return FailureKind::Other;
  }
  if (dynamic_cast<const RequestCancelledError *>(&e)) {
    return FailureKind::Cancelled;
  }
  return FailureKind::Other;
}

std::size_t abandoned_worker_count() {
  auto &workers = abandoned();
  std::lock_guard<std::mutex> lock(workers.mutex);
  return workers.live;
}

bool wait_for_abandoned_workers(std::chrono::milliseconds grace) {
  auto &workers = abandoned();
  std::unique_lock<std::mutex> lock(workers.mutex);
  bool drained = workers.cv.wait_for(lock, grace,
                                     [&workers] { return workers.live == 0; });
  if (!drained) {
    dispatch_log()->warn("{} abandoned worker(s) still running at exit",
                         workers.live);
  }
  return drained;
}

std::vector<SlotOutcome> run_bounded(std::size_t count, SlotJob job,
                                     const DispatchOptions &options) {
  std::vector<SlotOutcome> outcomes(count, SlotOutcome::Completed);
  if (count == 0) {
    return outcomes;
  }
  auto state = std::make_shared<DispatchState>();
  state->slots.assign(count, SlotState::Pending);
  state->job = std::move(job);
  state->stop = options.stop;

  std::size_t workers = static_cast<std::size_t>(std::max(1, options.throttle));
  workers = std::min(workers, count);
  state->alive = workers;
  dispatch_log()->debug("Dispatching {} task(s) on {} worker(s)", count,
                        workers);

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker, state);
  }

  const bool bounded = options.timeout.count() > 0;
  const auto deadline = std::chrono::steady_clock::now() + options.timeout;
  std::size_t reported = 0;
  bool expired = false;
  {
    std::unique_lock<std::mutex> lock(state->mutex);
    auto wake = [&] {
      return state->alive == 0 || state->finished != reported;
    };
    while (true) {
      bool ready = true;
      if (bounded) {
        ready = state->cv.wait_until(lock, deadline, wake);
      } else {
        state->cv.wait(lock, wake);
      }
      if (state->finished != reported) {
        reported = state->finished;
        if (options.progress) {
          lock.unlock();
          options.progress(reported, count);
          lock.lock();
        }
      }
      if (state->alive == 0) {
        break;
      }
      if (!ready) {
        expired = true;
        break;
      }
    }

    state->closed = true;
    bool stopped = is_cancelled(options.stop);
    std::size_t timed_out = 0;
    std::size_t cancelled = 0;
    for (std::size_t i = 0; i < count; ++i) {
      switch (state->slots[i]) {
      case SlotState::Completed:
        break;
      case SlotState::Running:
        outcomes[i] = SlotOutcome::TimedOut;
        ++timed_out;
        break;
      case SlotState::Pending:
        if (stopped) {
          outcomes[i] = SlotOutcome::Cancelled;
          ++cancelled;
        } else {
          outcomes[i] = SlotOutcome::TimedOut;
          ++timed_out;
        }
        break;
      }
    }
    if (timed_out > 0) {
      dispatch_log()->warn("Deadline of {} ms expired with {} task(s) "
                           "unfinished",
                           options.timeout.count(), timed_out);
    }
    if (cancelled > 0) {
      dispatch_log()->info("Cancelled {} task(s) before they started",
                           cancelled);
    }
  }

  if (reported < count && options.progress) {
    options.progress(count, count);
  }

  if (expired) {
    if (options.abandon) {
      options.abandon->cancel();
    }
    {
      std::lock_guard<std::mutex> lock(state->mutex);
      state->detached = true;
      auto &workers = abandoned();
      std::lock_guard<std::mutex> count_lock(workers.mutex);
      workers.live += state->alive;
    }
    for (auto &t : threads) {
      t.detach();
    }
  } else {
    for (auto &t : threads) {
      if (t.joinable()) {
        t.join();
      }
    }
  }
  return outcomes;
}

} // namespace adoi
