#include "json_formatter.hpp"

nlohmann::json JsonFormatter::endpoint_to_json_object(const Endpoint &endpoint) {
  return nlohmann::json{{"id", endpoint.id},
                        {"name", endpoint.name},
                        {"url", endpoint.url},
                        {"is_active", endpoint.is_active}};
}

nlohmann::json
JsonFormatter::endpoints_to_json_array(const std::vector<Endpoint> &endpoints) {
  nlohmann::json j = nlohmann::json::array();
  for (const auto &endpoint : endpoints)
    j.push_back(endpoint_to_json_object(endpoint));
  return j;
}

Endpoint JsonFormatter::endpoint_from_json_object(const nlohmann::json &j) {
  Endpoint endpoint;
  endpoint.url = j.at("url").get<std::string>();
  endpoint.name = j.at("name").get<std::string>();
  endpoint.id = j.value("id", std::string());
  endpoint.is_active = j.value("is_active", false);
  return endpoint;
}

nlohmann::json
JsonFormatter::outcome_to_json_object(const DeliveryOutcome &outcome) {
  nlohmann::json j;
  j["endpoint_id"] = outcome.endpoint_id;
  j["endpoint_name"] = outcome.endpoint_name;
  j["url"] = outcome.url;
  j["success"] = outcome.success;
  if (outcome.http_status)
    j["http_status"] = *outcome.http_status;
  if (outcome.error)
    j["error"] = *outcome.error;
  j["latency_ms"] = outcome.latency.count();
  return j;
}

std::string JsonFormatter::format_error_body(const std::string &message,
                                             const std::string &details) {
  nlohmann::json j{{"error", message}};
  if (!details.empty())
    j["details"] = details;
  return j.dump();
}
