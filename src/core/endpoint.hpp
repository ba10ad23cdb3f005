#ifndef ENDPOINT_HPP
#define ENDPOINT_HPP

#include <string>

// A registered forwarding destination. The registry owns the canonical
// records; everything else works on copies.
struct Endpoint {
  std::string id;
  std::string name;
  std::string url;
  bool is_active = false;
};

#endif // ENDPOINT_HPP
