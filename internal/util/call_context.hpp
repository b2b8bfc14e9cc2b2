#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace launcher::util {

/*
  CallContext

  Per-call deadline, cancellation and correlation id. Contexts are values;
  deriving one never changes the parent. Cancellation is shared between a
  context and everything derived from it, and WithCancel() starts a new scope
  that observes the parent's cancellation without propagating upwards.
*/
class CallContext {
 public:
  CallContext();

  static CallContext Background();

  CallContext WithCancel() const;
  CallContext WithDeadline(TimePoint deadline) const;
  CallContext WithTimeout(std::chrono::nanoseconds timeout) const;
  CallContext WithCorrelationId(std::string correlation_id) const;

  void Cancel() const;

  bool Cancelled() const;
  bool Expired() const;
  bool Done() const {
    return Cancelled() || Expired();
  }

  // Throws Cancelled or DeadlineExceeded once the context is done.
  void ThrowIfDone() const;

  const std::optional<TimePoint>& deadline() const {
    return deadline_;
  }

  // Remaining time before the deadline, clamped at zero.
  std::optional<std::chrono::nanoseconds> Remaining() const;

  const std::string& correlation_id() const {
    return correlation_id_;
  }

 private:
  struct CancelState {
    std::atomic<bool>            cancelled{false};
    std::shared_ptr<CancelState> parent;

    bool IsCancelled() const;
  };

  std::shared_ptr<CancelState> cancel_;
  std::optional<TimePoint>     deadline_;
  std::string                  correlation_id_;
};

} // namespace launcher::util
