#ifndef BASE_DELIVERY_AGENT_HPP
#define BASE_DELIVERY_AGENT_HPP

#include "core/delivery.hpp"
#include "core/endpoint.hpp"
#include "core/event.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <utility>

// Lets the dispatch engine abort one running attempt once its deadline has
// passed. The agent installs a hook that interrupts whatever it is blocked
// on; cancel() runs the hook at most once, under the token's lock, so
// clear_hook() returning means the hook is no longer running.
class AttemptCancellation {
public:
  void cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_)
      return;
    cancelled_ = true;
    if (hook_)
      hook_();
  }

  bool is_cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
  }

  // Runs `hook` right away if cancel() already happened.
  void set_hook(std::function<void()> hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    hook_ = std::move(hook);
    if (cancelled_ && hook_)
      hook_();
  }

  void clear_hook() {
    std::lock_guard<std::mutex> lock(mutex_);
    hook_ = nullptr;
  }

private:
  mutable std::mutex mutex_;
  bool cancelled_ = false;
  std::function<void()> hook_;
};

// Performs one delivery of one event to one endpoint.
//
// Implementations must not throw: every failure mode, including their own
// internal errors, is reported through the returned outcome. They make
// exactly one outbound call and never retry. attempt() is called
// concurrently from several threads, and must return promptly once
// `cancellation` is cancelled.
class IDeliveryAgent {
public:
  virtual ~IDeliveryAgent() = default;
  virtual DeliveryOutcome attempt(const Endpoint &endpoint, const Event &event,
                                  std::chrono::milliseconds timeout,
                                  AttemptCancellation &cancellation) = 0;
  virtual const char *get_name() const = 0;
};

#endif // BASE_DELIVERY_AGENT_HPP
