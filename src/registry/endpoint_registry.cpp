#include "endpoint_registry.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "utils/json_formatter.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <unordered_set>
#include <utility>

namespace {

void write_endpoints_file(const std::string &path,
                          const std::vector<Endpoint> &endpoints) {
  const std::string tmp_path = path + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::trunc);
    if (!out.is_open())
      throw StorageError("Failed to open " + tmp_path + " for writing");
    out << JsonFormatter::endpoints_to_json_array(endpoints).dump(2);
    out.flush();
    if (!out)
      throw StorageError("Failed to write endpoints file " + tmp_path);
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec)
    throw StorageError("Failed to replace " + path + ": " + ec.message());
}

} // namespace

EndpointRegistry::EndpointRegistry(Config::RegistryConfig config)
    : config_(std::move(config)) {}

void EndpointRegistry::load(
    const std::map<std::string, std::string> &seed_routes) {
  if (config_.persistence_enabled) {
    if (std::filesystem::exists(config_.storage_path)) {
      load_file();
      return;
    }
    LOG(LogLevel::INFO, LogComponent::REGISTRY,
        "No endpoints file at " << config_.storage_path);
  }

  std::vector<Endpoint> seeded;
  for (const auto &[service, url] : seed_routes) {
    std::string why;
    if (!Utils::parse_url(url, &why)) {
      LOG(LogLevel::WARN, LogComponent::REGISTRY,
          "Not seeding route '" << service << "': " << why);
      continue;
    }
    Endpoint endpoint;
    endpoint.id = service;
    endpoint.name = service;
    endpoint.url = url;
    endpoint.is_active = true;
    seeded.push_back(std::move(endpoint));
  }

  std::lock_guard<std::mutex> lock(mutex_);
  endpoints_ = std::move(seeded);
  LOG(LogLevel::INFO, LogComponent::REGISTRY,
      "Starting with " << endpoints_.size()
                       << " endpoints seeded from configured routes");
  if (!endpoints_.empty())
    persist_locked();
}

void EndpointRegistry::load_file() {
  const std::string &path = config_.storage_path;
  std::ifstream in(path);
  if (!in.is_open()) {
    LOG(LogLevel::ERROR, LogComponent::REGISTRY,
        "Error reading endpoints file " << path);
    return;
  }

  std::vector<Endpoint> loaded;
  try {
    nlohmann::json j = nlohmann::json::parse(in);
    if (!j.is_array())
      throw StorageError("top-level value is not an array");

    std::unordered_set<std::string> seen_ids;
    for (const auto &item : j) {
      Endpoint endpoint = JsonFormatter::endpoint_from_json_object(item);
      if (endpoint.id.empty() || seen_ids.count(endpoint.id)) {
        if (!endpoint.id.empty())
          LOG(LogLevel::WARN, LogComponent::REGISTRY,
              "Duplicate endpoint id " << endpoint.id << " in " << path
                                       << ", assigning a new one");
        endpoint.id = Utils::generate_uuid();
      }
      seen_ids.insert(endpoint.id);
      loaded.push_back(std::move(endpoint));
    }
  } catch (const nlohmann::json::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::REGISTRY,
        "Error parsing endpoints file " << path << ": " << e.what());
    return;
  } catch (const StorageError &e) {
    LOG(LogLevel::ERROR, LogComponent::REGISTRY,
        "Error parsing endpoints file " << path << ": " << e.what());
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  endpoints_ = std::move(loaded);
  LOG(LogLevel::INFO, LogComponent::REGISTRY,
      "Loaded " << endpoints_.size() << " endpoints from file");
}

std::vector<Endpoint> EndpointRegistry::create(const std::string &name,
                                               const std::string &url,
                                               bool is_active) {
  std::string clean_url = Utils::trim_copy(url);
  std::string why;
  if (!Utils::parse_url(clean_url, &why))
    throw ValidationError("Invalid URL format", why);

  std::string clean_name = Utils::trim_copy(name);
  if (clean_name.empty())
    throw ValidationError("Name cannot be empty");

  Endpoint endpoint;
  endpoint.id = Utils::generate_uuid();
  endpoint.name = std::move(clean_name);
  endpoint.url = std::move(clean_url);
  endpoint.is_active = is_active;

  std::lock_guard<std::mutex> lock(mutex_);
  endpoints_.push_back(endpoint);
  LOG(LogLevel::INFO, LogComponent::REGISTRY,
      "Registered endpoint " << endpoint.id << " (" << endpoint.name << ") -> "
                             << endpoint.url
                             << (endpoint.is_active ? " [active]"
                                                    : " [inactive]"));
  persist_locked();
  return endpoints_;
}

std::vector<Endpoint> EndpointRegistry::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return endpoints_;
}

std::vector<Endpoint> EndpointRegistry::list_active() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Endpoint> active;
  std::copy_if(endpoints_.begin(), endpoints_.end(), std::back_inserter(active),
               [](const Endpoint &e) { return e.is_active; });
  return active;
}

Endpoint EndpointRegistry::update_status(const std::string &id,
                                         bool is_active) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = find_locked(id);
  if (it == endpoints_.end())
    throw NotFoundError("Endpoint not found: " + id);

  if (it->is_active == is_active) {
    LOG(LogLevel::DEBUG, LogComponent::REGISTRY,
        "Endpoint " << id << " already "
                    << (is_active ? "active" : "inactive"));
    return *it;
  }

  it->is_active = is_active;
  Endpoint updated = *it;
  LOG(LogLevel::INFO, LogComponent::REGISTRY,
      "Endpoint " << id << " " << (is_active ? "activated" : "deactivated"));
  persist_locked();
  return updated;
}

std::vector<Endpoint> EndpointRegistry::remove(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = find_locked(id);
  if (it == endpoints_.end())
    throw NotFoundError("Endpoint not found: " + id);

  endpoints_.erase(it);
  LOG(LogLevel::INFO, LogComponent::REGISTRY, "Deleted endpoint " << id);
  persist_locked();
  return endpoints_;
}

std::optional<Endpoint> EndpointRegistry::find(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &endpoint : endpoints_)
    if (endpoint.id == id)
      return endpoint;
  return std::nullopt;
}

size_t EndpointRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return endpoints_.size();
}

size_t EndpointRegistry::active_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<size_t>(
      std::count_if(endpoints_.begin(), endpoints_.end(),
                    [](const Endpoint &e) { return e.is_active; }));
}

std::vector<Endpoint>::iterator
EndpointRegistry::find_locked(const std::string &id) {
  return std::find_if(endpoints_.begin(), endpoints_.end(),
                      [&id](const Endpoint &e) { return e.id == id; });
}

void EndpointRegistry::persist_locked() const {
  if (!config_.persistence_enabled)
    return;

  try {
    write_endpoints_file(config_.storage_path, endpoints_);
  } catch (const StorageError &e) {
    LOG(LogLevel::ERROR, LogComponent::REGISTRY,
        "Error saving endpoints: " << e.what());
  }
}
