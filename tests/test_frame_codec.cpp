#include "ctlapi/frame_codec.hpp"

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using namespace ctlapi;
using nlohmann::json;

// ============================================================================
// frame::encode / frame::decode
// ============================================================================

TEST_CASE("Frame - encode appends a single terminator", "[frame]") {
  std::string out = frame::encode({{"id", 1}, {"method", "info"}});
  REQUIRE(!out.empty());
  REQUIRE(out.back() == frame::kTerminator);
  REQUIRE(out.find(frame::kTerminator) == out.size() - 1);
  REQUIRE(json::parse(out.substr(0, out.size() - 1)) == json({{"id", 1}, {"method", "info"}}));
}

TEST_CASE("Frame - decode valid body", "[frame]") {
  auto result = frame::decode(R"({"id": 3, "path": "objects/list", "args": {}})");
  REQUIRE(result.has_value());
  REQUIRE(result.value()["id"] == 3);
  REQUIRE(result.value()["path"] == "objects/list");
}

TEST_CASE("Frame - decode malformed body", "[frame]") {
  auto result = frame::decode("{\"id\": 3,");
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == ErrorCode::kFrameParseError);
}

TEST_CASE("Frame - decode empty body", "[frame]") {
  auto result = frame::decode("");
  REQUIRE(!result.has_value());
}

TEST_CASE("Frame - non-ASCII text survives encoding", "[frame]") {
  json value = {{"response", "M117 temp \xC2\xB0" "C"}};
  std::string out = frame::encode(value);
  auto back = frame::decode(std::string_view(out.data(), out.size() - 1));
  REQUIRE(back.has_value());
  REQUIRE(back.value() == value);
}

// ============================================================================
// FrameDecoder
// ============================================================================

TEST_CASE("FrameDecoder - two frames split across three chunks", "[frame]") {
  std::string stream = frame::encode({{"id", 1}}) + frame::encode({{"id", 2}});
  size_t a = 3;
  size_t b = stream.size() - 4;

  FrameDecoder decoder;
  std::vector<std::string> bodies;
  for (auto chunk : {stream.substr(0, a), stream.substr(a, b - a), stream.substr(b)}) {
    for (auto& body : decoder.feed(chunk)) {
      bodies.push_back(body);
    }
  }

  REQUIRE(bodies.size() == 2);
  REQUIRE(json::parse(bodies[0])["id"] == 1);
  REQUIRE(json::parse(bodies[1])["id"] == 2);
  REQUIRE(decoder.pending() == 0);
}

TEST_CASE("FrameDecoder - keeps trailing partial frame", "[frame]") {
  FrameDecoder decoder;
  auto bodies = decoder.feed("{\"id\":1}\x03{\"id\"");
  REQUIRE(bodies.size() == 1);
  REQUIRE(decoder.pending() == 5);

  bodies = decoder.feed(":2}\x03");
  REQUIRE(bodies.size() == 1);
  REQUIRE(bodies[0] == "{\"id\":2}");
  REQUIRE(decoder.pending() == 0);
}

TEST_CASE("FrameDecoder - one frame per byte", "[frame]") {
  std::string stream = frame::encode({{"id", 7}, {"args", {{"a", 1}}}});
  FrameDecoder decoder;
  std::vector<std::string> bodies;
  for (char c : stream) {
    for (auto& body : decoder.feed(std::string_view(&c, 1))) {
      bodies.push_back(body);
    }
  }
  REQUIRE(bodies.size() == 1);
  REQUIRE(json::parse(bodies[0])["args"]["a"] == 1);
}

TEST_CASE("FrameDecoder - malformed frame does not disturb the next", "[frame]") {
  FrameDecoder decoder;
  auto bodies = decoder.feed("{not json\x03{\"id\":4}\x03");
  REQUIRE(bodies.size() == 2);
  REQUIRE(!frame::decode(bodies[0]).has_value());
  auto good = frame::decode(bodies[1]);
  REQUIRE(good.has_value());
  REQUIRE(good.value()["id"] == 4);
}

TEST_CASE("FrameDecoder - empty segment between terminators", "[frame]") {
  FrameDecoder decoder;
  auto bodies = decoder.feed("\x03\x03");
  REQUIRE(bodies.size() == 2);
  REQUIRE(bodies[0].empty());
}

TEST_CASE("FrameDecoder - clear drops pending bytes", "[frame]") {
  FrameDecoder decoder;
  (void)decoder.feed("{\"id\":");
  REQUIRE(decoder.pending() > 0);
  decoder.clear();
  REQUIRE(decoder.pending() == 0);
}

TEST_CASE("Frame - invalid UTF-8 is replaced, not thrown", "[frame]") {
  json status = {{"print_stats", {{"filename", "part\xff.gcode"}}}};
  std::string wire;
  REQUIRE_NOTHROW(wire = frame::encode(status));
  REQUIRE(wire.back() == frame::kTerminator);

  auto decoded = frame::decode(wire.substr(0, wire.size() - 1));
  REQUIRE(decoded.has_value());
  REQUIRE(decoded.value()["print_stats"]["filename"] == "part\xEF\xBF\xBD.gcode");
}
