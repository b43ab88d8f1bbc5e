/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation flag shared between a run and its workers.
 */
#ifndef ADOINVENTORY_CANCELLATION_HPP
#define ADOINVENTORY_CANCELLATION_HPP

#include <atomic>
#include <memory>

namespace adoi {

/**
 * One-shot cancellation flag.
 *
 * Cancelling never interrupts a thread; holders poll `cancelled()` at points
 * where stopping is safe (before starting a task, between retries, inside the
 * libcurl progress callback).
 */
class CancellationToken {
public:
  /// Request cancellation. Idempotent.
  void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

  /// Whether cancellation was requested.
  bool cancelled() const noexcept {
    return cancelled_.load(std::memory_order_acquire);
  }

private:
  std::atomic<bool> cancelled_{false};
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

/// Convenience check treating a null token as never cancelled.
inline bool is_cancelled(const CancellationTokenPtr &token) noexcept {
  return token && token->cancelled();
}

} // namespace adoi

#endif // ADOINVENTORY_CANCELLATION_HPP
