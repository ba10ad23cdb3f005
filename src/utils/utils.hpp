#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace Utils {
std::string to_lower_copy(std::string_view s);

// Random RFC 4122 version-4 UUID in canonical 8-4-4-4-12 form
std::string generate_uuid();

struct ParsedUrl {
  std::string scheme; // "http" or "https"
  std::string host;   // without port
  int port = 0;       // explicit or scheme default
  bool explicit_port = false;
  std::string path;   // always starts with '/', includes the query string

  bool is_https() const { return scheme == "https"; }
  // host[:port] as it belongs in a Host header
  std::string host_header() const;
};

// Parses an absolute http/https URL. On failure returns nullopt and, when
// `error` is given, a short description of what was wrong.
std::optional<ParsedUrl> parse_url(std::string_view url,
                                   std::string *error = nullptr);

template <typename T> std::optional<T> string_to_number(std::string_view s) {
  if (s.empty())
    return std::nullopt;

  T value;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);

  if (ec == std::errc() && ptr == s.data() + s.size())
    return value;
  return std::nullopt;
}

inline void ltrim_inplace(std::string &s) {
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) {
            return !std::isspace(ch);
          }));
}

inline void rtrim_inplace(std::string &s) {
  s.erase(std::find_if(s.rbegin(), s.rend(),
                       [](unsigned char ch) { return !std::isspace(ch); })
              .base(),
          s.end());
}

inline void trim_inplace(std::string &s) {
  ltrim_inplace(s);
  rtrim_inplace(s);
}

inline std::string trim_copy(std::string_view sv) {
  std::string s{sv};
  trim_inplace(s);
  return s;
}
} // namespace Utils

#endif // UTILS_HPP
