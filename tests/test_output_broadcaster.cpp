#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <stdexcept>
#include <string>

using namespace ctlapi;
using namespace ctlapi_test;
using nlohmann::json;

namespace {

struct OutputFixture {
  FakeLoop loop;
  FakeHost host;
  ServerConfig config{"/unused"};
  Router router{host, StartArgs{}};
  OutputBroadcaster output{router};

  std::shared_ptr<Connection> make_conn(uint64_t id, TestClient& client) {
    auto [sock, peer] = make_socket_pair();
    client.adopt(peer);
    auto conn = std::make_shared<Connection>(id, std::move(sock), loop, config);
    conn->start();
    return conn;
  }

  json subscribe(const std::shared_ptr<Connection>& conn, json args) {
    Request req(conn, 1, "subscribe_gcode_output", std::move(args));
    router.dispatch(req);
    return req.finish()["response"];
  }
};

}  // namespace

TEST_CASE("OutputBroadcaster - registers its endpoint once", "[output]") {
  OutputFixture f;
  REQUIRE(f.router.get_callback("subscribe_gcode_output").has_value());
  REQUIRE_THROWS_AS(OutputBroadcaster(f.router), std::logic_error);
}

TEST_CASE("OutputBroadcaster - publishes to subscribers in their template", "[output]") {
  OutputFixture f;
  TestClient client;
  auto conn = f.make_conn(1, client);

  json out = f.subscribe(conn, {{"response_template", {{"method", "gcode_output"}}}});
  REQUIRE(out == "ok");
  REQUIRE(f.output.client_count() == 1);

  f.output.publish("ok T:210.0 /210.0");
  f.loop.run_pending();

  auto msg = client.recv_frame();
  REQUIRE(msg.has_value());
  REQUIRE(*msg == json({{"method", "gcode_output"}, {"params", {{"response", "ok T:210.0 /210.0"}}}}));
}

TEST_CASE("OutputBroadcaster - missing template pushes bare params", "[output]") {
  OutputFixture f;
  TestClient client;
  auto conn = f.make_conn(1, client);
  (void)f.subscribe(conn, json::object());

  f.output.publish("echo: hi");
  f.loop.run_pending();

  auto msg = client.recv_frame();
  REQUIRE(msg.has_value());
  REQUIRE(*msg == json({{"params", {{"response", "echo: hi"}}}}));
}

TEST_CASE("OutputBroadcaster - invalid template is rejected", "[output]") {
  OutputFixture f;
  TestClient client;
  auto conn = f.make_conn(1, client);

  json out = f.subscribe(conn, {{"response_template", json::array()}});
  REQUIRE(out["error"] == "WebRequestError");
  REQUIRE(out["message"] == "Invalid Argument [response_template]");
  REQUIRE(f.output.client_count() == 0);
  REQUIRE(f.host.shutdown_count.load() == 0);
}

TEST_CASE("OutputBroadcaster - closed subscribers are dropped on publish", "[output]") {
  OutputFixture f;
  TestClient client_a;
  TestClient client_b;
  auto a = f.make_conn(1, client_a);
  auto b = f.make_conn(2, client_b);
  (void)f.subscribe(a, {{"response_template", {{"id", "a"}}}});
  (void)f.subscribe(b, {{"response_template", {{"id", "b"}}}});
  REQUIRE(f.output.client_count() == 2);

  a->close();
  f.output.publish("line");
  f.loop.run_pending();
  REQUIRE(f.output.client_count() == 1);

  auto msg = client_b.recv_frame();
  REQUIRE(msg.has_value());
  REQUIRE((*msg)["id"] == "b");
}

TEST_CASE("OutputBroadcaster - invalid UTF-8 output is still delivered", "[output]") {
  OutputFixture f;
  TestClient client;
  auto conn = f.make_conn(1, client);
  (void)f.subscribe(conn, {{"response_template", {{"method", "gcode_output"}}}});

  REQUIRE_NOTHROW(f.output.publish("// bad byte \xff"));
  f.loop.run_pending();

  auto msg = client.recv_frame();
  REQUIRE(msg.has_value());
  REQUIRE((*msg)["params"]["response"] == "// bad byte \xEF\xBF\xBD");
  REQUIRE(!conn->is_closed());
}
