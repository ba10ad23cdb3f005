#ifndef RESULT_AGGREGATOR_HPP
#define RESULT_AGGREGATOR_HPP

#include "core/delivery.hpp"
#include "core/endpoint.hpp"
#include "nlohmann/json.hpp"

#include <string>
#include <vector>

// Pure functions over the outcomes of one dispatch. No I/O.
namespace ResultAggregator {

// Counts the outcomes and keeps them in the order given.
DispatchResult aggregate(std::vector<DeliveryOutcome> outcomes);

// Counts the outcomes and orders them by the endpoint's position in
// `snapshot`, whatever order they completed in. Outcomes are matched to
// snapshot entries by endpoint id; an endpoint id that appears several times
// in the snapshot takes its outcomes in turn. Outcomes that match nothing
// go last, sorted by endpoint id.
DispatchResult aggregate(const std::vector<Endpoint> &snapshot,
                         std::vector<DeliveryOutcome> outcomes);

// One line for the dispatch log, e.g.
// "total=2 succeeded=1 failed=1 failures=[B: connection_error]"
std::string summary_line(const DispatchResult &result);

// Body returned to whoever posted the webhook.
nlohmann::json to_json(const DispatchResult &result, bool include_outcomes);

} // namespace ResultAggregator

#endif // RESULT_AGGREGATOR_HPP
