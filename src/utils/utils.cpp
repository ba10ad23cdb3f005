#include "utils.hpp"

#include <iomanip>
#include <random>
#include <regex>
#include <sstream>

namespace Utils {

std::string to_lower_copy(std::string_view s) {
  std::string out{s};
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return out;
}

std::string generate_uuid() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  uint8_t bytes[16];
  for (auto &b : bytes)
    b = static_cast<uint8_t>(rng());

  // RFC4122 variant + version 4
  bytes[6] = (bytes[6] & 0x0F) | 0x40;
  bytes[8] = (bytes[8] & 0x3F) | 0x80;

  std::ostringstream oss;
  for (size_t i = 0; i < sizeof(bytes); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10)
      oss << "-";
    oss << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(bytes[i]);
  }
  return oss.str();
}

std::string ParsedUrl::host_header() const {
  std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
  if (explicit_port)
    h += ":" + std::to_string(port);
  return h;
}

std::optional<ParsedUrl> parse_url(std::string_view url, std::string *error) {
  auto fail = [error](const char *why) -> std::optional<ParsedUrl> {
    if (error)
      *error = why;
    return std::nullopt;
  };

  // Group 1: scheme, group 2: authority, group 3: path/query/fragment
  static const std::regex url_regex(R"(^([A-Za-z][A-Za-z0-9+.-]*):\/\/([^\/?#]*)(.*)$)");
  std::smatch match;
  std::string input{url};

  if (!std::regex_match(input, match, url_regex))
    return fail("relative URL without a base");

  ParsedUrl parsed;
  parsed.scheme = to_lower_copy(match[1].str());
  if (parsed.scheme != "http" && parsed.scheme != "https")
    return fail("unsupported scheme, expected http or https");

  std::string authority = match[2].str();
  if (authority.find('@') != std::string::npos)
    return fail("credentials in URL are not supported");
  if (authority.empty())
    return fail("empty host");

  std::string port_str;
  if (authority[0] == '[') {
    auto close = authority.find(']');
    if (close == std::string::npos)
      return fail("invalid IPv6 host");
    parsed.host = authority.substr(1, close - 1);
    if (parsed.host.find(':') == std::string::npos)
      return fail("invalid IPv6 host");
    std::string rest = authority.substr(close + 1);
    if (!rest.empty()) {
      if (rest[0] != ':')
        return fail("invalid IPv6 host");
      port_str = rest.substr(1);
    }
  } else {
    // A bare host has at most one colon, before the port. Anything after it
    // that is not a number (a second colon included) fails the port check.
    auto colon = authority.find(':');
    if (colon != std::string::npos) {
      parsed.host = authority.substr(0, colon);
      port_str = authority.substr(colon + 1);
    } else {
      parsed.host = authority;
    }
  }

  if (parsed.host.empty())
    return fail("empty host");
  for (char c : parsed.host)
    if (std::isspace(static_cast<unsigned char>(c)))
      return fail("invalid character in host");

  parsed.port = parsed.is_https() ? 443 : 80;
  if (!port_str.empty()) {
    auto port = string_to_number<int>(port_str);
    if (!port || *port < 1 || *port > 65535)
      return fail("invalid port number");
    parsed.port = *port;
    parsed.explicit_port = true;
  }

  std::string rest = match[3].str();
  auto hash = rest.find('#');
  if (hash != std::string::npos)
    rest.erase(hash);
  if (rest.empty() || rest[0] == '?')
    rest.insert(rest.begin(), '/');
  parsed.path = rest;

  return parsed;
}

} // namespace Utils
