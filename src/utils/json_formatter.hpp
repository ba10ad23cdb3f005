#ifndef JSON_FORMATTER_HPP
#define JSON_FORMATTER_HPP

#include "core/delivery.hpp"
#include "core/endpoint.hpp"
#include "nlohmann/json.hpp"

#include <string>
#include <vector>

namespace JsonFormatter {

nlohmann::json endpoint_to_json_object(const Endpoint &endpoint);
nlohmann::json endpoints_to_json_array(const std::vector<Endpoint> &endpoints);

// Reads one stored record. Throws nlohmann::json::exception when `url` or
// `name` is missing or not a string; `id` and `is_active` are optional.
Endpoint endpoint_from_json_object(const nlohmann::json &j);

nlohmann::json outcome_to_json_object(const DeliveryOutcome &outcome);

// {"error": message[, "details": details]}
std::string format_error_body(const std::string &message,
                              const std::string &details = {});

} // namespace JsonFormatter

#endif // JSON_FORMATTER_HPP
