#include "call_context.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace launcher::util {

bool CallContext::CancelState::IsCancelled() const {
  for (const CancelState* state = this; state != nullptr; state = state->parent.get()) {
    if (state->cancelled.load(std::memory_order_acquire)) {
      return true;
    }
  }
  return false;
}

CallContext::CallContext() : cancel_(std::make_shared<CancelState>()) {
}

CallContext CallContext::Background() {
  return CallContext();
}

CallContext CallContext::WithCancel() const {
  CallContext child = *this;
  child.cancel_     = std::make_shared<CancelState>();
  child.cancel_->parent = cancel_;
  return child;
}

CallContext CallContext::WithDeadline(TimePoint deadline) const {
  CallContext child = *this;
  child.deadline_   = deadline_ ? std::min(*deadline_, deadline) : deadline;
  return child;
}

CallContext CallContext::WithTimeout(std::chrono::nanoseconds timeout) const {
  return WithDeadline(Now() + timeout);
}

CallContext CallContext::WithCorrelationId(std::string correlation_id) const {
  CallContext child     = *this;
  child.correlation_id_ = std::move(correlation_id);
  return child;
}

void CallContext::Cancel() const {
  cancel_->cancelled.store(true, std::memory_order_release);
}

bool CallContext::Cancelled() const {
  return cancel_->IsCancelled();
}

bool CallContext::Expired() const {
  return deadline_ && Now() >= *deadline_;
}

void CallContext::ThrowIfDone() const {
  if (Cancelled()) {
    throw util::Cancelled();
  }
  if (Expired()) {
    throw DeadlineExceeded();
  }
}

std::optional<std::chrono::nanoseconds> CallContext::Remaining() const {
  if (!deadline_) {
    return std::nullopt;
  }
  return std::max(std::chrono::nanoseconds::zero(), std::chrono::duration_cast<std::chrono::nanoseconds>(*deadline_ - Now()));
}

} // namespace launcher::util
