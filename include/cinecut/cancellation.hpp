/**
 * @file cancellation.hpp
 * @brief Export cancellation signal
 */

#ifndef CINECUT_CANCELLATION_HPP
#define CINECUT_CANCELLATION_HPP

#include <atomic>

#include "errors.hpp"

namespace cinecut {

/**
 * @class CancellationToken
 * @brief One-shot flag raised by the user (or a signal handler).
 * @note cancel() is a lock-free atomic store and safe to call from a
 *       signal handler.
 */
class CancellationToken {
public:
  void cancel() { cancelled_.store(true, std::memory_order_relaxed); }

  bool is_cancelled() const {
    return cancelled_.load(std::memory_order_relaxed);
  }

  /// @throws ExportError(Cancelled) once cancel() has been called
  void throw_if_cancelled() const {
    if (is_cancelled())
      throw ExportError(ErrorKind::Cancelled, cancelled_message());
  }

private:
  std::atomic<bool> cancelled_{false};
};

/// Null-tolerant helper for optional tokens
inline void throw_if_cancelled(const CancellationToken *token) {
  if (token)
    token->throw_if_cancelled();
}

} // namespace cinecut

#endif // CINECUT_CANCELLATION_HPP
