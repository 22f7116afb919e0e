#ifndef CTLAPI_REQUEST_HPP_
#define CTLAPI_REQUEST_HPP_

#include "vocabulary.hpp"

#include <cstdint>

#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace ctlapi {

class Connection;

// Wire tag used for every error response.
constexpr const char* kRequestErrorTag = "WebRequestError";

nlohmann::json to_json(const HandlerError& err);

// ============================================================================
// Request (one decoded client request and its single response slot)
// ============================================================================

class Request {
 public:
  using ConnPtr = std::shared_ptr<Connection>;

  Request(ConnPtr conn, nlohmann::json id, std::string path, nlohmann::json args);

  // Builds a request from a decoded frame. Accepts "path" or "method" as the
  // dispatch key and "args" or "params" as the argument map (defaults to {}).
  // Returns error(kInvalidRequest) when "id" or the dispatch key is missing,
  // or when the argument map is not a JSON object.
  static expected<Request, ErrorCode> from_json(const nlohmann::json& msg, ConnPtr conn);

  // --- Argument accessors ---
  // Missing or mistyped arguments fail with a command error
  // "Invalid Argument [<name>]".

  expected<nlohmann::json, HandlerError> get(const std::string& name) const;
  nlohmann::json get_or(const std::string& name, const nlohmann::json& default_value) const;
  expected<int64_t, HandlerError> get_int(const std::string& name) const;
  expected<double, HandlerError> get_float(const std::string& name) const;
  expected<std::string, HandlerError> get_string(const std::string& name) const;

  const nlohmann::json& get_args() const { return args_; }
  const std::string& get_path() const { return path_; }
  const nlohmann::json& get_id() const { return id_; }
  const ConnPtr& get_client_connection() const { return conn_; }

  // --- Response ---

  // Sets the success payload. A second call fails and leaves the first
  // payload in place.
  Outcome send(nlohmann::json data);

  // Replaces the payload with an error body.
  void set_error(const HandlerError& err);

  bool has_response() const { return has_response_; }

  // Returns {"request_id": id, "response": payload}; a request that was
  // never answered responds with "ok".
  nlohmann::json finish();

 private:
  ConnPtr conn_;
  nlohmann::json id_;
  std::string path_;
  nlohmann::json args_;
  nlohmann::json response_;
  bool has_response_ = false;

  static HandlerError invalid_argument(const std::string& name);
};

}  // namespace ctlapi

#endif  // CTLAPI_REQUEST_HPP_
