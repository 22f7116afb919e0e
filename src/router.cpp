#include "ctlapi/router.hpp"

#include "ctlapi/connection.hpp"
#include "ctlapi/log.hpp"

#include <exception>
#include <unistd.h>
#include <utility>

namespace ctlapi {

namespace {

std::string local_hostname() {
  char buf[256] = {};
  if (::gethostname(buf, sizeof(buf) - 1) != 0) {
    return "";
  }
  return std::string(buf);
}

nlohmann::json optional_arg(const std::string& value) {
  if (value.empty())
    return nullptr;
  return value;
}

}  // namespace

Router::Router(Host& host, StartArgs start_args) : host_(host), start_args_(std::move(start_args)) {
  // Built-ins are registered first; a fresh table cannot hold duplicates.
  (void)register_endpoint("list_endpoints", [this](Request& r) { return handle_list_endpoints(r); });
  (void)register_endpoint("info", [this](Request& r) { return handle_info(r); });
  (void)register_endpoint("emergency_stop", [this](Request& r) { return handle_emergency_stop(r); });
}

expected<void, HandlerError> Router::register_endpoint(const std::string& path, Handler handler) {
  if (endpoints_.count(path) != 0) {
    return expected<void, HandlerError>::error(HandlerError::command("Path already registered to an endpoint"));
  }
  endpoints_.emplace(path, std::move(handler));
  order_.push_back(path);
  return expected<void, HandlerError>::success();
}

expected<const Router::Handler*, HandlerError> Router::get_callback(const std::string& path) const {
  auto it = endpoints_.find(path);
  if (it == endpoints_.end()) {
    std::string msg = "webhooks: No registered callback for path '" + path + "'";
    CTLAPI_LOG_INFO(msg);
    return expected<const Handler*, HandlerError>::error(HandlerError::command(msg));
  }
  return expected<const Handler*, HandlerError>::success(&it->second);
}

Outcome Router::invoke(const Handler& handler, Request& request) {
  try {
    return handler(request);
  } catch (const std::exception& e) {
    return Outcome::error(HandlerError::internal(e.what()));
  } catch (...) {
    return Outcome::error(HandlerError::internal("Unknown exception"));
  }
}

void Router::dispatch(Request& request) {
  auto callback = get_callback(request.get_path());
  Outcome outcome =
      callback.has_value() ? invoke(*callback.value(), request) : Outcome::error(callback.get_error());
  if (outcome.has_value())
    return;

  const HandlerError& err = outcome.get_error();
  request.set_error(err);
  if (!err.is_fatal())
    return;

  std::string msg = "Internal Error on WebRequest: " + request.get_path();
  CTLAPI_LOG_ERROR(msg + " (" + err.message + ")");
  try {
    host_.invoke_shutdown(msg);
  } catch (const std::exception& e) {
    CTLAPI_LOG_ERROR("webhooks: Shutdown request failed: " + std::string(e.what()));
  }
}

void Router::process(Request& request) {
  dispatch(request);
  nlohmann::json result = request.finish();
  CTLAPI_LOG_DEBUG("webhooks: Sending response - " + frame::to_text(result));
  const auto& conn = request.get_client_connection();
  if (conn) {
    conn->send(result);
  }
}

nlohmann::json Router::get_status(TimePoint /* eventtime */) {
  StateMessage state = host_.get_state_message();
  return {{"state", state.state}, {"state_message", state.message}};
}

Outcome Router::handle_list_endpoints(Request& request) {
  return request.send({{"endpoints", order_}});
}

Outcome Router::handle_info(Request& request) {
  StateMessage state = host_.get_state_message();
  nlohmann::json response = {
      {"state", state.state},
      {"state_message", state.message},
      {"hostname", local_hostname()},
      {"install_path", start_args_.install_path},
      {"executable_path", start_args_.executable_path},
      {"log_file", optional_arg(start_args_.log_file)},
      {"config_file", optional_arg(start_args_.config_file)},
      {"software_version", optional_arg(start_args_.software_version)},
      {"cpu_info", optional_arg(start_args_.cpu_info)},
  };
  return request.send(std::move(response));
}

Outcome Router::handle_emergency_stop(Request& /* request */) {
  host_.invoke_shutdown(kEstopReason);
  return Outcome::success();
}

}  // namespace ctlapi
