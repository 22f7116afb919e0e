#include "ctlapi/request.hpp"

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include <string>

using namespace ctlapi;
using nlohmann::json;

// ============================================================================
// Request::from_json
// ============================================================================

TEST_CASE("Request - from_json with path and args", "[request]") {
  auto req = Request::from_json({{"id", 9}, {"path", "objects/status"}, {"args", {{"toolhead", nullptr}}}}, nullptr);
  REQUIRE(req.has_value());
  REQUIRE(req.value().get_id() == 9);
  REQUIRE(req.value().get_path() == "objects/status");
  REQUIRE(req.value().get_args().contains("toolhead"));
}

TEST_CASE("Request - from_json accepts method and params", "[request]") {
  auto req = Request::from_json({{"id", "abc"}, {"method", "info"}, {"params", {{"client_info", "x"}}}}, nullptr);
  REQUIRE(req.has_value());
  REQUIRE(req.value().get_id() == "abc");
  REQUIRE(req.value().get_path() == "info");
  REQUIRE(req.value().get_args()["client_info"] == "x");
}

TEST_CASE("Request - from_json defaults args to empty object", "[request]") {
  auto req = Request::from_json({{"id", 1}, {"method", "list_endpoints"}}, nullptr);
  REQUIRE(req.has_value());
  REQUIRE(req.value().get_args().is_object());
  REQUIRE(req.value().get_args().empty());

  auto with_null = Request::from_json({{"id", 1}, {"method", "info"}, {"params", nullptr}}, nullptr);
  REQUIRE(with_null.has_value());
  REQUIRE(with_null.value().get_args().is_object());
}

TEST_CASE("Request - from_json rejects malformed requests", "[request]") {
  REQUIRE(!Request::from_json(json::array({1, 2}), nullptr).has_value());
  REQUIRE(!Request::from_json({{"method", "info"}}, nullptr).has_value());
  REQUIRE(!Request::from_json({{"id", 1}}, nullptr).has_value());
  REQUIRE(!Request::from_json({{"id", 1}, {"method", 5}}, nullptr).has_value());

  auto bad_args = Request::from_json({{"id", 1}, {"method", "info"}, {"params", json::array()}}, nullptr);
  REQUIRE(!bad_args.has_value());
  REQUIRE(bad_args.get_error() == ErrorCode::kInvalidRequest);
}

// ============================================================================
// Argument accessors
// ============================================================================

TEST_CASE("Request - typed argument accessors", "[request]") {
  Request req(nullptr, 1, "test",
              {{"count", 3}, {"whole", 4.0}, {"ratio", 0.5}, {"name", "bltouch"}, {"flag", true}});

  REQUIRE(req.get_int("count").value() == 3);
  REQUIRE(req.get_int("whole").value() == 4);
  REQUIRE(req.get_float("ratio").value() == 0.5);
  REQUIRE(req.get_float("count").value() == 3.0);
  REQUIRE(req.get_string("name").value() == "bltouch");
  REQUIRE(req.get("flag").value() == true);
  REQUIRE(req.get_or("missing", 12) == 12);
  REQUIRE(req.get_or("count", 12) == 3);
}

TEST_CASE("Request - accessor failures are command errors", "[request]") {
  Request req(nullptr, 1, "test", {{"ratio", 0.5}, {"name", "bltouch"}});

  auto missing = req.get("nope");
  REQUIRE(!missing.has_value());
  REQUIRE(missing.get_error().message == "Invalid Argument [nope]");
  REQUIRE(!missing.get_error().is_fatal());

  REQUIRE(!req.get_int("ratio").has_value());
  REQUIRE(!req.get_int("name").has_value());
  REQUIRE(!req.get_float("name").has_value());
  REQUIRE(req.get_string("ratio").get_error().message == "Invalid Argument [ratio]");
}

// ============================================================================
// Response slot
// ============================================================================

TEST_CASE("Request - unanswered request responds ok", "[request]") {
  Request req(nullptr, 42, "emergency_stop", json::object());
  REQUIRE(!req.has_response());
  json out = req.finish();
  REQUIRE(out == json({{"request_id", 42}, {"response", "ok"}}));
}

TEST_CASE("Request - send sets the payload once", "[request]") {
  Request req(nullptr, 7, "info", json::object());
  REQUIRE(req.send({{"a", 1}}).has_value());
  REQUIRE(req.has_response());

  auto second = req.send({{"b", 2}});
  REQUIRE(!second.has_value());
  REQUIRE(second.get_error().message == "Multiple calls to send not allowed");

  json out = req.finish();
  REQUIRE(out["request_id"] == 7);
  REQUIRE(out["response"] == json({{"a", 1}}));
}

TEST_CASE("Request - set_error replaces the payload", "[request]") {
  Request req(nullptr, 7, "info", json::object());
  REQUIRE(req.send({{"a", 1}}).has_value());
  req.set_error(HandlerError::command("nope"));

  json out = req.finish();
  REQUIRE(out["response"]["error"] == "WebRequestError");
  REQUIRE(out["response"]["message"] == "nope");
}

TEST_CASE("Request - to_json of handler error", "[request]") {
  json body = to_json(HandlerError::internal("boom"));
  REQUIRE(body == json({{"error", kRequestErrorTag}, {"message", "boom"}}));
}
