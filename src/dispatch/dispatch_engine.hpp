#ifndef DISPATCH_ENGINE_HPP
#define DISPATCH_ENGINE_HPP

#include "core/config.hpp"
#include "core/delivery.hpp"
#include "core/endpoint.hpp"
#include "core/event.hpp"
#include "io/delivery/base_delivery_agent.hpp"

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

class EndpointRegistry;
class RelayMetrics;

// Fans one event out to every endpoint of a snapshot.
//
// Each endpoint gets its own thread running one delivery attempt; all of
// them start before the engine waits on any. The engine then joins them
// against a single deadline (attempt timeout + join grace). An attempt that
// has not reported by the deadline is cancelled and recorded as a timeout.
// The destructor gives stragglers one more attempt timeout + join grace to
// unwind.
class DispatchEngine {
public:
  DispatchEngine(EndpointRegistry &registry,
                 std::shared_ptr<IDeliveryAgent> agent,
                 const Config::DispatchConfig &config,
                 RelayMetrics *metrics = nullptr);
  ~DispatchEngine();

  DispatchEngine(const DispatchEngine &) = delete;
  DispatchEngine &operator=(const DispatchEngine &) = delete;

  // Takes one list_active() snapshot and delivers to it. Later registry
  // changes do not affect this call.
  DispatchResult dispatch(const Event &event);

  // Delivers to an explicit destination list (fixed service routes).
  // Throws InternalError when no delivery agent is configured.
  DispatchResult dispatch_to(const std::vector<Endpoint> &snapshot,
                             const Event &event);

  // Applies to dispatches that start after the call.
  void reconfigure(const Config::DispatchConfig &config,
                   std::shared_ptr<IDeliveryAgent> agent);

  // Attempts still running, including ones already given up on.
  size_t attempts_in_flight() const;

private:
  struct InFlight {
    std::mutex mutex;
    std::condition_variable cv;
    size_t count = 0;
  };

  EndpointRegistry &registry_;
  RelayMetrics *metrics_;

  mutable std::mutex config_mutex_;
  std::shared_ptr<IDeliveryAgent> agent_;
  Config::DispatchConfig config_;

  std::shared_ptr<InFlight> in_flight_ = std::make_shared<InFlight>();
};

#endif // DISPATCH_ENGINE_HPP
