#include "result_aggregator.hpp"
#include "utils/json_formatter.hpp"

#include <algorithm>
#include <cstddef>
#include <deque>
#include <optional>
#include <sstream>
#include <unordered_map>
#include <utility>

namespace ResultAggregator {

DispatchResult aggregate(std::vector<DeliveryOutcome> outcomes) {
  DispatchResult result;
  result.total = outcomes.size();
  result.succeeded = static_cast<size_t>(
      std::count_if(outcomes.begin(), outcomes.end(),
                    [](const DeliveryOutcome &o) { return o.success; }));
  result.failed = result.total - result.succeeded;
  result.outcomes = std::move(outcomes);
  return result;
}

DispatchResult aggregate(const std::vector<Endpoint> &snapshot,
                         std::vector<DeliveryOutcome> outcomes) {
  std::unordered_map<std::string, std::deque<size_t>> slots_by_id;
  for (size_t i = 0; i < snapshot.size(); ++i)
    slots_by_id[snapshot[i].id].push_back(i);

  std::vector<std::optional<DeliveryOutcome>> slots(snapshot.size());
  std::vector<DeliveryOutcome> unmatched;

  for (auto &outcome : outcomes) {
    auto it = slots_by_id.find(outcome.endpoint_id);
    if (it == slots_by_id.end() || it->second.empty()) {
      unmatched.push_back(std::move(outcome));
      continue;
    }
    slots[it->second.front()] = std::move(outcome);
    it->second.pop_front();
  }

  std::vector<DeliveryOutcome> ordered;
  ordered.reserve(outcomes.size());
  for (auto &slot : slots)
    if (slot)
      ordered.push_back(std::move(*slot));

  std::stable_sort(unmatched.begin(), unmatched.end(),
                   [](const DeliveryOutcome &a, const DeliveryOutcome &b) {
                     return a.endpoint_id < b.endpoint_id;
                   });
  for (auto &outcome : unmatched)
    ordered.push_back(std::move(outcome));

  return aggregate(std::move(ordered));
}

std::string summary_line(const DispatchResult &result) {
  std::ostringstream oss;
  oss << "total=" << result.total << " succeeded=" << result.succeeded
      << " failed=" << result.failed;

  if (result.failed > 0) {
    oss << " failures=[";
    bool first = true;
    for (const auto &outcome : result.outcomes) {
      if (outcome.success)
        continue;
      if (!first)
        oss << ", ";
      first = false;
      oss << (outcome.endpoint_name.empty() ? outcome.endpoint_id
                                            : outcome.endpoint_name)
          << ": " << outcome.error.value_or("other");
    }
    oss << "]";
  }
  return oss.str();
}

nlohmann::json to_json(const DispatchResult &result, bool include_outcomes) {
  nlohmann::json j;
  j["status"] = result.total == 0 ? "no_active_endpoints" : "dispatched";
  j["total"] = result.total;
  j["succeeded"] = result.succeeded;
  j["failed"] = result.failed;

  if (include_outcomes) {
    nlohmann::json j_outcomes = nlohmann::json::array();
    for (const auto &outcome : result.outcomes)
      j_outcomes.push_back(JsonFormatter::outcome_to_json_object(outcome));
    j["outcomes"] = j_outcomes;
  }
  return j;
}

} // namespace ResultAggregator
