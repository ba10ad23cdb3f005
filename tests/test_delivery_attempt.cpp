#include <chrono>
#include <gtest/gtest.h>
#include <string>
#include <thread>

#include "core/config.hpp"
#include "core/endpoint.hpp"
#include "core/event.hpp"
#include "dispatch/dispatch_engine.hpp"
#include "io/delivery/http_delivery_agent.hpp"
#include "local_http_server.hpp"
#include "registry/endpoint_registry.hpp"

using namespace std::chrono_literals;

class DeliveryAttemptTest : public ::testing::Test {
protected:
  Endpoint endpointFor(const std::string &url, const std::string &name = "A") {
    Endpoint endpoint;
    endpoint.id = "id-" + name;
    endpoint.name = name;
    endpoint.url = url;
    endpoint.is_active = true;
    return endpoint;
  }

  Event makeEvent(const std::string &payload) {
    Event event;
    event.payload = payload;
    event.headers = {{"X-Signature", "abc123"},
                     {"Content-Type", "text/plain"},
                     {"Content-Length", "999"},
                     {"Host", "relay.example.com"},
                     {"Connection", "keep-alive"},
                     {"Proxy-Authorization", "Basic secret"}};
    return event;
  }

  Config::DispatchConfig config;
  AttemptCancellation token;
};

TEST_F(DeliveryAttemptTest, SuccessDeliversPayloadVerbatim) {
  LocalHttpServer destination(200);
  destination.start();

  HttpDeliveryAgent agent(config);
  const std::string payload = R"({"event":"charge.success","amount":1200})";
  auto outcome = agent.attempt(endpointFor(destination.url("/in?src=relay")),
                               makeEvent(payload), 2000ms, token);

  EXPECT_TRUE(outcome.success);
  EXPECT_EQ(outcome.http_status, 200);
  EXPECT_FALSE(outcome.error.has_value());
  EXPECT_EQ(outcome.endpoint_id, "id-A");

  auto received = destination.received();
  ASSERT_EQ(received.size(), 1u);
  EXPECT_EQ(received[0].path, "/in");
  EXPECT_EQ(received[0].body, payload);

  const auto &headers = received[0].headers;
  auto header = [&headers](const std::string &name) {
    auto it = headers.find(name);
    return it == headers.end() ? std::string() : it->second;
  };
  EXPECT_EQ(header("Content-Type"), "application/json");
  EXPECT_EQ(header("X-Signature"), "abc123");
  EXPECT_EQ(header("Host"),
            "127.0.0.1:" + std::to_string(destination.port()));
  EXPECT_EQ(header("Proxy-Authorization"), "");
  EXPECT_EQ(header("User-Agent"), config.user_agent);
  EXPECT_EQ(headers.count("Content-Type"), 1u);
}

TEST_F(DeliveryAttemptTest, Non2xxIsHttpError) {
  LocalHttpServer destination(503);
  destination.start();

  HttpDeliveryAgent agent(config);
  auto outcome =
      agent.attempt(endpointFor(destination.url()), makeEvent("{}"), 2000ms, token);

  EXPECT_FALSE(outcome.success);
  EXPECT_EQ(outcome.http_status, 503);
  EXPECT_EQ(outcome.error_kind, DeliveryErrorKind::HTTP_ERROR);
  EXPECT_EQ(outcome.error, "http_error:503");
  EXPECT_EQ(destination.received().size(), 1u);
}

TEST_F(DeliveryAttemptTest, RedirectIsNotSuccess) {
  LocalHttpServer destination(302);
  destination.start();

  HttpDeliveryAgent agent(config);
  auto outcome =
      agent.attempt(endpointFor(destination.url()), makeEvent("{}"), 2000ms, token);

  EXPECT_FALSE(outcome.success);
  EXPECT_EQ(outcome.http_status, 302);
}

TEST_F(DeliveryAttemptTest, ClosedPortIsConnectionError) {
  HttpDeliveryAgent agent(config);
  auto url = "http://127.0.0.1:" + std::to_string(closed_local_port()) + "/x";
  auto outcome = agent.attempt(endpointFor(url, "B"), makeEvent("{}"), 2000ms, token);

  EXPECT_FALSE(outcome.success);
  EXPECT_FALSE(outcome.http_status.has_value());
  EXPECT_EQ(outcome.error_kind, DeliveryErrorKind::CONNECTION_ERROR);
  EXPECT_EQ(outcome.error, "connection_error");
  EXPECT_FALSE(outcome.error_detail.empty());
}

TEST_F(DeliveryAttemptTest, SlowDestinationTimesOut) {
  LocalHttpServer destination(200, 1500ms);
  destination.start();

  HttpDeliveryAgent agent(config);
  auto start = std::chrono::steady_clock::now();
  auto outcome =
      agent.attempt(endpointFor(destination.url()), makeEvent("{}"), 300ms, token);
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_FALSE(outcome.success);
  EXPECT_EQ(outcome.error, "timeout");
  EXPECT_LT(elapsed, 1400ms);
}

TEST_F(DeliveryAttemptTest, InvalidStoredUrlIsOther) {
  HttpDeliveryAgent agent(config);
  auto outcome =
      agent.attempt(endpointFor("not a url"), makeEvent("{}"), 1000ms, token);

  EXPECT_FALSE(outcome.success);
  EXPECT_EQ(outcome.error, "other");
}

TEST_F(DeliveryAttemptTest, HeaderForwardingCanBeDisabled) {
  LocalHttpServer destination(200);
  destination.start();

  config.forward_inbound_headers = false;
  HttpDeliveryAgent agent(config);
  auto outcome =
      agent.attempt(endpointFor(destination.url()), makeEvent("{}"), 2000ms, token);
  ASSERT_TRUE(outcome.success);

  auto received = destination.received();
  ASSERT_EQ(received.size(), 1u);
  EXPECT_EQ(received[0].headers.count("X-Signature"), 0u);
}

TEST_F(DeliveryAttemptTest, TricklingResponseIsCappedAtTimeout) {
  LocalHttpServer destination(200);
  destination.trickle(100ms, 50);
  destination.start();

  HttpDeliveryAgent agent(config);
  auto start = std::chrono::steady_clock::now();
  auto outcome =
      agent.attempt(endpointFor(destination.url()), makeEvent("{}"), 300ms,
                    token);
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_FALSE(outcome.success);
  EXPECT_EQ(outcome.error, "timeout");
  EXPECT_LT(elapsed, 2000ms);
}

TEST_F(DeliveryAttemptTest, CancelAbortsRunningAttempt) {
  LocalHttpServer destination(200, 2000ms);
  destination.start();

  HttpDeliveryAgent agent(config);
  std::thread canceller([this] {
    std::this_thread::sleep_for(200ms);
    token.cancel();
  });

  auto start = std::chrono::steady_clock::now();
  auto outcome =
      agent.attempt(endpointFor(destination.url()), makeEvent("{}"), 10000ms,
                    token);
  auto elapsed = std::chrono::steady_clock::now() - start;
  canceller.join();

  EXPECT_FALSE(outcome.success);
  EXPECT_EQ(outcome.error, "timeout");
  EXPECT_LT(elapsed, 1500ms);
}

TEST_F(DeliveryAttemptTest, AlreadyCancelledAttemptSendsNothing) {
  LocalHttpServer destination(200);
  destination.start();

  token.cancel();
  HttpDeliveryAgent agent(config);
  auto outcome = agent.attempt(endpointFor(destination.url()), makeEvent("{}"),
                               2000ms, token);

  EXPECT_EQ(outcome.error, "timeout");
  EXPECT_TRUE(destination.received().empty());
}

TEST_F(DeliveryAttemptTest, EngineReclaimsTricklingAttempts) {
  LocalHttpServer destination(200);
  destination.trickle(100ms, 100);
  destination.start();

  Config::RegistryConfig registry_config;
  registry_config.persistence_enabled = false;
  EndpointRegistry registry(registry_config);
  registry.create("trickle", destination.url(), true);

  config.attempt_timeout_ms = 300;
  config.join_grace_ms = 100;
  DispatchEngine engine(registry, std::make_shared<HttpDeliveryAgent>(config),
                        config);

  for (int i = 0; i < 3; ++i) {
    auto result = engine.dispatch(makeEvent("{}"));
    ASSERT_EQ(result.outcomes.size(), 1u);
    EXPECT_EQ(result.outcomes[0].error, "timeout");
  }

  const auto until = std::chrono::steady_clock::now() + 1000ms;
  while (engine.attempts_in_flight() > 0 &&
         std::chrono::steady_clock::now() < until)
    std::this_thread::sleep_for(10ms);
  EXPECT_EQ(engine.attempts_in_flight(), 0u);
}

TEST(HttpDeliveryAgentTest, ExcludedHeadersIgnoreCase) {
  EXPECT_TRUE(HttpDeliveryAgent::is_excluded_header("Host"));
  EXPECT_TRUE(HttpDeliveryAgent::is_excluded_header("CONTENT-LENGTH"));
  EXPECT_TRUE(HttpDeliveryAgent::is_excluded_header("transfer-encoding"));
  EXPECT_FALSE(HttpDeliveryAgent::is_excluded_header("X-Signature"));
  EXPECT_FALSE(HttpDeliveryAgent::is_excluded_header("Authorization"));
}
