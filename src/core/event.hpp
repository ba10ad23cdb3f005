#ifndef EVENT_HPP
#define EVENT_HPP

#include <chrono>
#include <string>
#include <utility>
#include <vector>

using HeaderList = std::vector<std::pair<std::string, std::string>>;

// One inbound webhook. Lives only for the duration of a dispatch.
struct Event {
  std::string payload; // body exactly as received
  std::chrono::system_clock::time_point received_at =
      std::chrono::system_clock::now();
  HeaderList headers; // inbound request headers, in arrival order
};

#endif // EVENT_HPP
