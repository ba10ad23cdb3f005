#include <gtest/gtest.h>
#include <regex>
#include <set>
#include <string>

#include "utils/utils.hpp"

// =================================================================================
// String helpers
// =================================================================================

TEST(UtilsTest, TrimAndLowercase) {
  EXPECT_EQ(Utils::trim_copy("  value \t"), "value");
  EXPECT_EQ(Utils::trim_copy("   "), "");
  EXPECT_EQ(Utils::to_lower_copy("X-Signature"), "x-signature");
}

TEST(UtilsTest, StringToNumber) {
  EXPECT_EQ(Utils::string_to_number<int>("8080"), 8080);
  EXPECT_FALSE(Utils::string_to_number<int>("").has_value());
  EXPECT_FALSE(Utils::string_to_number<int>("80a").has_value());
  EXPECT_FALSE(Utils::string_to_number<uint32_t>("-1").has_value());
}

TEST(UtilsTest, GeneratedIdsAreUniqueVersion4) {
  static const std::regex uuid_v4(
      "^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");

  std::set<std::string> seen;
  for (int i = 0; i < 500; ++i) {
    auto id = Utils::generate_uuid();
    EXPECT_TRUE(std::regex_match(id, uuid_v4)) << id;
    seen.insert(id);
  }
  EXPECT_EQ(seen.size(), 500u);
}

// =================================================================================
// URL parsing
// =================================================================================

TEST(UrlParseTest, PlainHttpDefaults) {
  auto url = Utils::parse_url("http://example.com");
  ASSERT_TRUE(url.has_value());
  EXPECT_EQ(url->scheme, "http");
  EXPECT_EQ(url->host, "example.com");
  EXPECT_EQ(url->port, 80);
  EXPECT_FALSE(url->explicit_port);
  EXPECT_EQ(url->path, "/");
  EXPECT_EQ(url->host_header(), "example.com");
}

TEST(UrlParseTest, HttpsWithPortPathAndQuery) {
  auto url = Utils::parse_url("HTTPS://hooks.example.com:8443/in/abc?x=1#frag");
  ASSERT_TRUE(url.has_value());
  EXPECT_TRUE(url->is_https());
  EXPECT_EQ(url->port, 8443);
  EXPECT_TRUE(url->explicit_port);
  EXPECT_EQ(url->path, "/in/abc?x=1");
  EXPECT_EQ(url->host_header(), "hooks.example.com:8443");
}

TEST(UrlParseTest, QueryWithoutPath) {
  auto url = Utils::parse_url("http://example.com?token=1");
  ASSERT_TRUE(url.has_value());
  EXPECT_EQ(url->path, "/?token=1");
}

TEST(UrlParseTest, Ipv6Host) {
  auto url = Utils::parse_url("http://[::1]:9000/hook");
  ASSERT_TRUE(url.has_value());
  EXPECT_EQ(url->host, "::1");
  EXPECT_EQ(url->port, 9000);
  EXPECT_EQ(url->host_header(), "[::1]:9000");
}

TEST(UrlParseTest, RejectsInvalidUrls) {
  std::string why;
  EXPECT_FALSE(Utils::parse_url("not a url", &why).has_value());
  EXPECT_FALSE(why.empty());

  EXPECT_FALSE(Utils::parse_url("/relative/path").has_value());
  EXPECT_FALSE(Utils::parse_url("ftp://example.com/file").has_value());
  EXPECT_FALSE(Utils::parse_url("http://").has_value());
  EXPECT_FALSE(Utils::parse_url("http://:8080/x").has_value());
  EXPECT_FALSE(Utils::parse_url("http://example.com:99999/").has_value());
  EXPECT_FALSE(Utils::parse_url("http://example.com:port/").has_value());
  EXPECT_FALSE(Utils::parse_url("http://user:pw@example.com/").has_value());
  EXPECT_FALSE(Utils::parse_url("http://[::1/").has_value());
  EXPECT_FALSE(Utils::parse_url("http://[example.com]/").has_value());
}

TEST(UrlParseTest, RejectsStrayColonsInHost) {
  std::string why;
  EXPECT_FALSE(Utils::parse_url("http://a.com:80:90/", &why).has_value());
  EXPECT_EQ(why, "invalid port number");

  EXPECT_FALSE(Utils::parse_url("http://::1/", &why).has_value());
  EXPECT_EQ(why, "empty host");

  EXPECT_FALSE(Utils::parse_url("https://host:443:/x").has_value());
}
