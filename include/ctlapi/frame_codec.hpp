#ifndef CTLAPI_FRAME_CODEC_HPP_
#define CTLAPI_FRAME_CODEC_HPP_

#include "vocabulary.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace ctlapi {

// ============================================================================
// Frame codec (UTF-8 JSON text terminated by 0x03, no length prefix)
// ============================================================================

namespace frame {

constexpr char kTerminator = '\x03';

// Compact JSON text. Invalid UTF-8 in host strings becomes U+FFFD instead
// of throwing.
inline std::string to_text(const nlohmann::json& value) {
  return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// Encode one value as a complete frame. Never throws on string content.
inline std::string encode(const nlohmann::json& value) {
  std::string out = to_text(value);
  out.push_back(kTerminator);
  return out;
}

// Parse one frame body (terminator already stripped). Never throws.
inline expected<nlohmann::json, ErrorCode> decode(std::string_view body) {
  nlohmann::json value = nlohmann::json::parse(body.begin(), body.end(), nullptr, false);
  if (value.is_discarded()) {
    return expected<nlohmann::json, ErrorCode>::error(ErrorCode::kFrameParseError);
  }
  return expected<nlohmann::json, ErrorCode>::success(std::move(value));
}

}  // namespace frame

// ============================================================================
// FrameDecoder (splits a byte stream into frame bodies)
// ============================================================================

class FrameDecoder {
 public:
  // Appends received bytes and returns every frame body completed by them,
  // in arrival order. A trailing incomplete segment is kept for the next call.
  std::vector<std::string> feed(std::string_view data) {
    std::vector<std::string> frames;
    size_t start = 0;
    size_t pos = data.find(frame::kTerminator);
    while (pos != std::string_view::npos) {
      partial_.append(data.data() + start, pos - start);
      frames.push_back(std::move(partial_));
      partial_.clear();
      start = pos + 1;
      pos = data.find(frame::kTerminator, start);
    }
    partial_.append(data.data() + start, data.size() - start);
    return frames;
  }

  size_t pending() const { return partial_.size(); }

  void clear() { partial_.clear(); }

 private:
  std::string partial_;
};

}  // namespace ctlapi

#endif  // CTLAPI_FRAME_CODEC_HPP_
