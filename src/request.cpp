#include "ctlapi/request.hpp"

#include <cmath>
#include <utility>

namespace ctlapi {

nlohmann::json to_json(const HandlerError& err) {
  return {{"error", kRequestErrorTag}, {"message", err.message}};
}

Request::Request(ConnPtr conn, nlohmann::json id, std::string path, nlohmann::json args)
    : conn_(std::move(conn)), id_(std::move(id)), path_(std::move(path)), args_(std::move(args)) {}

expected<Request, ErrorCode> Request::from_json(const nlohmann::json& msg, ConnPtr conn) {
  using Result = expected<Request, ErrorCode>;
  if (!msg.is_object() || !msg.contains("id")) {
    return Result::error(ErrorCode::kInvalidRequest);
  }

  auto path_it = msg.find("path");
  if (path_it == msg.end()) {
    path_it = msg.find("method");
  }
  if (path_it == msg.end() || !path_it->is_string()) {
    return Result::error(ErrorCode::kInvalidRequest);
  }

  nlohmann::json args = nlohmann::json::object();
  auto args_it = msg.find("args");
  if (args_it == msg.end()) {
    args_it = msg.find("params");
  }
  if (args_it != msg.end() && !args_it->is_null()) {
    if (!args_it->is_object()) {
      return Result::error(ErrorCode::kInvalidRequest);
    }
    args = *args_it;
  }

  return Result::success(Request(std::move(conn), msg.at("id"), path_it->get<std::string>(), std::move(args)));
}

HandlerError Request::invalid_argument(const std::string& name) {
  return HandlerError::command("Invalid Argument [" + name + "]");
}

expected<nlohmann::json, HandlerError> Request::get(const std::string& name) const {
  auto it = args_.find(name);
  if (it == args_.end()) {
    return expected<nlohmann::json, HandlerError>::error(invalid_argument(name));
  }
  return expected<nlohmann::json, HandlerError>::success(*it);
}

nlohmann::json Request::get_or(const std::string& name, const nlohmann::json& default_value) const {
  auto it = args_.find(name);
  return it == args_.end() ? default_value : *it;
}

expected<int64_t, HandlerError> Request::get_int(const std::string& name) const {
  using Result = expected<int64_t, HandlerError>;
  auto it = args_.find(name);
  if (it == args_.end()) {
    return Result::error(invalid_argument(name));
  }
  if (it->is_number_integer()) {
    return Result::success(it->get<int64_t>());
  }
  // Integral floats ("3.0") are accepted, anything else is not.
  if (it->is_number_float()) {
    double v = it->get<double>();
    if (std::isfinite(v) && std::trunc(v) == v) {
      return Result::success(static_cast<int64_t>(v));
    }
  }
  return Result::error(invalid_argument(name));
}

expected<double, HandlerError> Request::get_float(const std::string& name) const {
  using Result = expected<double, HandlerError>;
  auto it = args_.find(name);
  if (it == args_.end() || !it->is_number()) {
    return Result::error(invalid_argument(name));
  }
  return Result::success(it->get<double>());
}

expected<std::string, HandlerError> Request::get_string(const std::string& name) const {
  using Result = expected<std::string, HandlerError>;
  auto it = args_.find(name);
  if (it == args_.end() || !it->is_string()) {
    return Result::error(invalid_argument(name));
  }
  return Result::success(it->get<std::string>());
}

Outcome Request::send(nlohmann::json data) {
  if (has_response_) {
    return Outcome::error(HandlerError::command("Multiple calls to send not allowed"));
  }
  response_ = std::move(data);
  has_response_ = true;
  return Outcome::success();
}

void Request::set_error(const HandlerError& err) {
  response_ = to_json(err);
  has_response_ = true;
}

nlohmann::json Request::finish() {
  if (!has_response_) {
    response_ = "ok";
    has_response_ = true;
  }
  return {{"request_id", id_}, {"response", response_}};
}

}  // namespace ctlapi
