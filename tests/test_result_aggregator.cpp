#include <chrono>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "core/delivery.hpp"
#include "core/endpoint.hpp"
#include "dispatch/result_aggregator.hpp"

namespace {

Endpoint make_endpoint(const std::string &id, const std::string &name) {
  Endpoint endpoint;
  endpoint.id = id;
  endpoint.name = name;
  endpoint.url = "http://" + name + ".example.com/hook";
  endpoint.is_active = true;
  return endpoint;
}

DeliveryOutcome ok(const Endpoint &endpoint, int status = 200) {
  return DeliveryOutcome::succeeded(endpoint, status,
                                    std::chrono::milliseconds(5));
}

DeliveryOutcome fail(const Endpoint &endpoint, DeliveryErrorKind kind,
                     std::optional<int> status = std::nullopt) {
  return DeliveryOutcome::failed(endpoint, kind, status, "detail",
                                 std::chrono::milliseconds(7));
}

} // namespace

TEST(DeliveryOutcomeTest, ErrorLabels) {
  auto a = make_endpoint("a", "A");

  EXPECT_FALSE(ok(a).error.has_value());
  EXPECT_EQ(fail(a, DeliveryErrorKind::TIMEOUT).error, "timeout");
  EXPECT_EQ(fail(a, DeliveryErrorKind::CONNECTION_ERROR).error,
            "connection_error");
  EXPECT_EQ(fail(a, DeliveryErrorKind::HTTP_ERROR, 503).error,
            "http_error:503");
  EXPECT_EQ(fail(a, DeliveryErrorKind::HTTP_ERROR, 503).http_status, 503);
  // A failure is never left unclassified
  EXPECT_EQ(fail(a, DeliveryErrorKind::NONE).error, "other");
}

TEST(ResultAggregatorTest, EmptyDispatch) {
  auto result = ResultAggregator::aggregate({}, {});
  EXPECT_EQ(result.total, 0u);
  EXPECT_EQ(result.succeeded, 0u);
  EXPECT_EQ(result.failed, 0u);

  auto j = ResultAggregator::to_json(result, true);
  EXPECT_EQ(j["status"], "no_active_endpoints");
  EXPECT_EQ(j["total"], 0);
  EXPECT_TRUE(j["outcomes"].empty());
  EXPECT_EQ(ResultAggregator::summary_line(result),
            "total=0 succeeded=0 failed=0");
}

TEST(ResultAggregatorTest, CountsAlwaysAddUp) {
  auto a = make_endpoint("a", "A");
  auto b = make_endpoint("b", "B");
  auto c = make_endpoint("c", "C");

  auto result = ResultAggregator::aggregate(
      {a, b, c}, {ok(a), fail(b, DeliveryErrorKind::CONNECTION_ERROR),
                  fail(c, DeliveryErrorKind::HTTP_ERROR, 500)});

  EXPECT_EQ(result.total, 3u);
  EXPECT_EQ(result.succeeded, 1u);
  EXPECT_EQ(result.failed, 2u);
  EXPECT_EQ(result.succeeded + result.failed, result.total);
}

TEST(ResultAggregatorTest, OrdersBySnapshotNotCompletion) {
  auto a = make_endpoint("a", "A");
  auto b = make_endpoint("b", "B");
  auto c = make_endpoint("c", "C");

  // Completion order c, a, b
  auto result = ResultAggregator::aggregate(
      {a, b, c}, {ok(c), ok(a), fail(b, DeliveryErrorKind::TIMEOUT)});

  ASSERT_EQ(result.outcomes.size(), 3u);
  EXPECT_EQ(result.outcomes[0].endpoint_id, "a");
  EXPECT_EQ(result.outcomes[1].endpoint_id, "b");
  EXPECT_EQ(result.outcomes[2].endpoint_id, "c");
}

TEST(ResultAggregatorTest, RepeatedIdsFillInTurn) {
  auto a = make_endpoint("a", "A");
  auto b = make_endpoint("b", "B");

  auto result = ResultAggregator::aggregate(
      {a, b, a}, {ok(a, 201), ok(b), ok(a, 202)});

  ASSERT_EQ(result.outcomes.size(), 3u);
  EXPECT_EQ(result.outcomes[0].http_status, 201);
  EXPECT_EQ(result.outcomes[1].endpoint_id, "b");
  EXPECT_EQ(result.outcomes[2].http_status, 202);
}

TEST(ResultAggregatorTest, UnmatchedOutcomesGoLast) {
  auto a = make_endpoint("a", "A");
  auto z = make_endpoint("z", "Z");
  auto m = make_endpoint("m", "M");

  auto result = ResultAggregator::aggregate({a}, {ok(z), ok(a), ok(m)});

  ASSERT_EQ(result.outcomes.size(), 3u);
  EXPECT_EQ(result.outcomes[0].endpoint_id, "a");
  EXPECT_EQ(result.outcomes[1].endpoint_id, "m");
  EXPECT_EQ(result.outcomes[2].endpoint_id, "z");
  EXPECT_EQ(result.total, 3u);
}

TEST(ResultAggregatorTest, SummaryLineListsFailures) {
  auto a = make_endpoint("a", "A");
  auto b = make_endpoint("b", "B");

  auto result = ResultAggregator::aggregate(
      {a, b}, {ok(a), fail(b, DeliveryErrorKind::CONNECTION_ERROR)});

  EXPECT_EQ(ResultAggregator::summary_line(result),
            "total=2 succeeded=1 failed=1 failures=[B: connection_error]");
}

TEST(ResultAggregatorTest, JsonBody) {
  auto a = make_endpoint("a", "A");
  auto b = make_endpoint("b", "B");

  auto result = ResultAggregator::aggregate(
      {a, b}, {ok(a), fail(b, DeliveryErrorKind::HTTP_ERROR, 404)});

  auto j = ResultAggregator::to_json(result, true);
  EXPECT_EQ(j["status"], "dispatched");
  EXPECT_EQ(j["total"], 2);
  EXPECT_EQ(j["succeeded"], 1);
  EXPECT_EQ(j["failed"], 1);
  ASSERT_EQ(j["outcomes"].size(), 2u);

  const auto &first = j["outcomes"][0];
  EXPECT_EQ(first["endpoint_id"], "a");
  EXPECT_EQ(first["endpoint_name"], "A");
  EXPECT_EQ(first["success"], true);
  EXPECT_EQ(first["http_status"], 200);
  EXPECT_FALSE(first.contains("error"));
  EXPECT_EQ(first["latency_ms"], 5);

  const auto &second = j["outcomes"][1];
  EXPECT_EQ(second["success"], false);
  EXPECT_EQ(second["http_status"], 404);
  EXPECT_EQ(second["error"], "http_error:404");

  auto compact = ResultAggregator::to_json(result, false);
  EXPECT_FALSE(compact.contains("outcomes"));
  EXPECT_EQ(compact["total"], 2);
}
