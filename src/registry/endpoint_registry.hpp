#ifndef ENDPOINT_REGISTRY_HPP
#define ENDPOINT_REGISTRY_HPP

#include "core/config.hpp"
#include "core/endpoint.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Owned store of forwarding endpoints. Every operation takes the one mutex;
// readers get copies, so a returned snapshot never changes under them.
//
// With persistence enabled the whole collection is rewritten to
// `storage_path` after each mutation. A failed write is logged and the
// in-memory change stands.
class EndpointRegistry {
public:
  explicit EndpointRegistry(Config::RegistryConfig config);

  // Replaces the in-memory set with the storage file's contents. An
  // unreadable file is logged and leaves the registry empty. With no file
  // (or persistence off) the registry starts from `seed_routes`: one active
  // endpoint per service, id and name set to the service name.
  void load(const std::map<std::string, std::string> &seed_routes = {});

  // Throws ValidationError on a blank name or a URL that is not an absolute
  // http/https URL. Returns the full list after insertion.
  std::vector<Endpoint> create(const std::string &name, const std::string &url,
                               bool is_active);

  std::vector<Endpoint> list() const;

  // Point-in-time copy of the active endpoints, in registration order.
  std::vector<Endpoint> list_active() const;

  // Throws NotFoundError. Setting the current value again is a no-op.
  Endpoint update_status(const std::string &id, bool is_active);

  // Throws NotFoundError. Returns the full list after removal.
  std::vector<Endpoint> remove(const std::string &id);

  std::optional<Endpoint> find(const std::string &id) const;

  size_t size() const;
  size_t active_count() const;

private:
  void load_file();
  void persist_locked() const;
  std::vector<Endpoint>::iterator find_locked(const std::string &id);

  Config::RegistryConfig config_;
  mutable std::mutex mutex_;
  std::vector<Endpoint> endpoints_;
};

#endif // ENDPOINT_REGISTRY_HPP
