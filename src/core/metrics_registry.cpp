#include "metrics_registry.hpp"

MetricsRegistry &MetricsRegistry::instance() {
  static MetricsRegistry instance;
  return instance;
}

MetricsRegistry::MetricsRegistry()
    : registry_(std::make_shared<prometheus::Registry>()) {}

std::shared_ptr<prometheus::Registry> MetricsRegistry::get_registry() {
  return registry_;
}

RelayMetrics::RelayMetrics(prometheus::Registry &registry)
    : dispatches_(prometheus::BuildCounter()
                      .Name("webhook_relay_dispatches_total")
                      .Help("Inbound events fanned out")
                      .Register(registry)
                      .Add({})),
      deliveries_(prometheus::BuildCounter()
                      .Name("webhook_relay_deliveries_total")
                      .Help("Delivery attempts by result")
                      .Register(registry)),
      deliveries_success_(deliveries_.Add({{"result", "success"}})),
      deliveries_failure_(deliveries_.Add({{"result", "failure"}})),
      delivery_errors_(prometheus::BuildCounter()
                           .Name("webhook_relay_delivery_errors_total")
                           .Help("Failed delivery attempts by classification")
                           .Register(registry)),
      dispatch_duration_(
          prometheus::BuildHistogram()
              .Name("webhook_relay_dispatch_duration_seconds")
              .Help("Wall time of one dispatch, all attempts included")
              .Register(registry)
              .Add({}, prometheus::Histogram::BucketBoundaries{
                           0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0,
                           2.5, 5.0, 10.0, 30.0})),
      active_endpoints_(prometheus::BuildGauge()
                            .Name("webhook_relay_active_endpoints")
                            .Help("Active endpoints in the latest snapshot")
                            .Register(registry)
                            .Add({})) {}

void RelayMetrics::record_dispatch(const DispatchResult &result) {
  dispatches_.Increment();
  deliveries_success_.Increment(static_cast<double>(result.succeeded));
  deliveries_failure_.Increment(static_cast<double>(result.failed));
  for (const auto &outcome : result.outcomes) {
    if (!outcome.success)
      delivery_errors_
          .Add({{"kind", delivery_error_kind_to_string(outcome.error_kind)}})
          .Increment();
  }
}

void RelayMetrics::set_active_endpoints(size_t count) {
  active_endpoints_.Set(static_cast<double>(count));
}
