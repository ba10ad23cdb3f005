#include "dispatch_engine.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "dispatch/result_aggregator.hpp"
#include "registry/endpoint_registry.hpp"
#include "utils/scoped_timer.hpp"

#include <chrono>
#include <exception>
#include <future>
#include <optional>
#include <system_error>
#include <thread>
#include <utility>

DispatchEngine::DispatchEngine(EndpointRegistry &registry,
                               std::shared_ptr<IDeliveryAgent> agent,
                               const Config::DispatchConfig &config,
                               RelayMetrics *metrics)
    : registry_(registry), metrics_(metrics), agent_(std::move(agent)),
      config_(config) {}

DispatchEngine::~DispatchEngine() {
  std::chrono::milliseconds limit;
  {
    std::lock_guard<std::mutex> lock(config_mutex_);
    limit = std::chrono::milliseconds(config_.attempt_timeout_ms +
                                      config_.join_grace_ms);
  }

  std::unique_lock<std::mutex> lock(in_flight_->mutex);
  if (in_flight_->count == 0)
    return;

  LOG(LogLevel::INFO, LogComponent::DISPATCH,
      "Waiting up to " << limit.count() << "ms for " << in_flight_->count
                       << " delivery attempts to finish");
  // Attempts own their inputs, so leaving one behind is safe.
  if (!in_flight_->cv.wait_for(lock, limit,
                               [this] { return in_flight_->count == 0; }))
    LOG(LogLevel::WARN, LogComponent::DISPATCH,
        in_flight_->count << " delivery attempts did not stop in time");
}

void DispatchEngine::reconfigure(const Config::DispatchConfig &config,
                                 std::shared_ptr<IDeliveryAgent> agent) {
  std::lock_guard<std::mutex> lock(config_mutex_);
  config_ = config;
  if (agent)
    agent_ = std::move(agent);
  LOG(LogLevel::INFO, LogComponent::DISPATCH,
      "Dispatch reconfigured: attempt timeout " << config_.attempt_timeout_ms
                                                << "ms, join grace "
                                                << config_.join_grace_ms
                                                << "ms");
}

size_t DispatchEngine::attempts_in_flight() const {
  std::lock_guard<std::mutex> lock(in_flight_->mutex);
  return in_flight_->count;
}

DispatchResult DispatchEngine::dispatch(const Event &event) {
  std::vector<Endpoint> snapshot = registry_.list_active();
  if (metrics_)
    metrics_->set_active_endpoints(snapshot.size());
  LOG(LogLevel::DEBUG, LogComponent::DISPATCH,
      "Snapshot taken: " << snapshot.size() << " active endpoints");
  return dispatch_to(snapshot, event);
}

DispatchResult DispatchEngine::dispatch_to(const std::vector<Endpoint> &snapshot,
                                           const Event &event) {
  ScopedTimer timer(metrics_ ? &metrics_->dispatch_duration() : nullptr);

  if (snapshot.empty()) {
    LOG(LogLevel::INFO, LogComponent::DISPATCH,
        "No active endpoints configured, nothing to deliver");
    DispatchResult empty;
    if (metrics_)
      metrics_->record_dispatch(empty);
    return empty;
  }

  std::shared_ptr<IDeliveryAgent> agent;
  Config::DispatchConfig config;
  {
    std::lock_guard<std::mutex> lock(config_mutex_);
    agent = agent_;
    config = config_;
  }

  if (!agent)
    throw InternalError("No delivery agent configured");

  const std::chrono::milliseconds timeout(config.attempt_timeout_ms);
  const auto started = std::chrono::steady_clock::now();
  const auto deadline =
      started + timeout + std::chrono::milliseconds(config.join_grace_ms);

  // Attempts outlive this call when they overrun the deadline, so they own
  // their inputs.
  auto shared_event = std::make_shared<const Event>(event);

  std::vector<std::future<DeliveryOutcome>> futures(snapshot.size());
  std::vector<std::shared_ptr<AttemptCancellation>> cancellations(
      snapshot.size());
  std::vector<std::optional<DeliveryOutcome>> outcomes(snapshot.size());

  for (size_t i = 0; i < snapshot.size(); ++i) {
    cancellations[i] = std::make_shared<AttemptCancellation>();
    std::packaged_task<DeliveryOutcome()> task(
        [agent, endpoint = snapshot[i], shared_event, timeout,
         cancellation = cancellations[i]]() {
          return agent->attempt(endpoint, *shared_event, timeout,
                                *cancellation);
        });
    futures[i] = task.get_future();

    {
      std::lock_guard<std::mutex> lock(in_flight_->mutex);
      in_flight_->count++;
    }

    try {
      std::thread([task = std::move(task), in_flight = in_flight_]() mutable {
        task();
        std::lock_guard<std::mutex> lock(in_flight->mutex);
        in_flight->count--;
        in_flight->cv.notify_all();
      }).detach();
    } catch (const std::system_error &e) {
      {
        std::lock_guard<std::mutex> lock(in_flight_->mutex);
        in_flight_->count--;
      }
      LOG(LogLevel::ERROR, LogComponent::DISPATCH,
          "Could not start delivery to " << snapshot[i].name << ": "
                                         << e.what());
      outcomes[i] = DeliveryOutcome::failed(
          snapshot[i], DeliveryErrorKind::OTHER, std::nullopt,
          std::string("could not start attempt: ") + e.what(),
          std::chrono::milliseconds(0));
    }
  }

  // Join point: every attempt is already running.
  for (size_t i = 0; i < snapshot.size(); ++i) {
    if (outcomes[i])
      continue;

    if (futures[i].wait_until(deadline) != std::future_status::ready) {
      cancellations[i]->cancel();
      auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started);
      LOG(LogLevel::WARN, LogComponent::DISPATCH,
          "Delivery to " << snapshot[i].name
                         << " did not report back within " << waited.count()
                         << "ms, cancelled and recorded as timeout");
      outcomes[i] = DeliveryOutcome::failed(
          snapshot[i], DeliveryErrorKind::TIMEOUT, std::nullopt,
          "no response before dispatch deadline", waited);
      continue;
    }

    try {
      outcomes[i] = futures[i].get();
    } catch (const std::exception &e) {
      // Agents are not supposed to throw; contain it to this endpoint.
      LOG(LogLevel::ERROR, LogComponent::DISPATCH,
          agent->get_name() << " threw while delivering to "
                            << snapshot[i].name << ": " << e.what());
      outcomes[i] = DeliveryOutcome::failed(
          snapshot[i], DeliveryErrorKind::OTHER, std::nullopt, e.what(),
          std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::steady_clock::now() - started));
    }
  }

  std::vector<DeliveryOutcome> collected;
  collected.reserve(outcomes.size());
  for (auto &outcome : outcomes)
    collected.push_back(std::move(*outcome));

  DispatchResult result =
      ResultAggregator::aggregate(snapshot, std::move(collected));

  LOG(LogLevel::INFO, LogComponent::DISPATCH,
      "Dispatch complete in "
          << static_cast<long long>(timer.elapsed_seconds() * 1000)
          << "ms: " << ResultAggregator::summary_line(result));
  if (metrics_)
    metrics_->record_dispatch(result);
  return result;
}
