#ifndef METRICS_REGISTRY_HPP
#define METRICS_REGISTRY_HPP

#include "delivery.hpp"

#include <cstddef>
#include <memory>
#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

// Process-wide prometheus registry served on the metrics path.
class MetricsRegistry {
public:
  static MetricsRegistry &instance();

  MetricsRegistry(const MetricsRegistry &) = delete;
  MetricsRegistry &operator=(const MetricsRegistry &) = delete;

  std::shared_ptr<prometheus::Registry> get_registry();

private:
  MetricsRegistry();
  ~MetricsRegistry() = default;

  std::shared_ptr<prometheus::Registry> registry_;
};

// The relay's own series, registered on whichever registry it is given so
// tests can observe them in isolation.
class RelayMetrics {
public:
  explicit RelayMetrics(prometheus::Registry &registry);

  void record_dispatch(const DispatchResult &result);
  void set_active_endpoints(size_t count);

  prometheus::Histogram &dispatch_duration() { return dispatch_duration_; }

private:
  prometheus::Counter &dispatches_;
  prometheus::Family<prometheus::Counter> &deliveries_;
  prometheus::Counter &deliveries_success_;
  prometheus::Counter &deliveries_failure_;
  prometheus::Family<prometheus::Counter> &delivery_errors_;
  prometheus::Histogram &dispatch_duration_;
  prometheus::Gauge &active_endpoints_;
};

#endif // METRICS_REGISTRY_HPP
