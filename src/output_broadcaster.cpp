#include "ctlapi/output_broadcaster.hpp"

#include "ctlapi/connection.hpp"
#include "ctlapi/log.hpp"

#include <stdexcept>
#include <utility>

namespace ctlapi {

OutputBroadcaster::OutputBroadcaster(Router& router) {
  auto result =
      router.register_endpoint("subscribe_gcode_output", [this](Request& r) { return handle_subscribe(r); });
  if (!result.has_value()) {
    throw std::logic_error("subscribe_gcode_output: " + result.get_error().message);
  }
}

void OutputBroadcaster::publish(const std::string& message) {
  for (auto it = clients_.begin(); it != clients_.end();) {
    if (it->second.conn->is_closed()) {
      it = clients_.erase(it);
      continue;
    }
    nlohmann::json msg = it->second.response_template;
    msg["params"] = nlohmann::json::object({{"response", message}});
    it->second.conn->send(msg);
    ++it;
  }
}

Outcome OutputBroadcaster::handle_subscribe(Request& request) {
  nlohmann::json response_template = request.get_or("response_template", nlohmann::json::object());
  if (!response_template.is_object()) {
    return Outcome::error(HandlerError::command("Invalid Argument [response_template]"));
  }
  const ConnPtr& conn = request.get_client_connection();
  if (conn) {
    clients_[conn->get_id()] = Client{conn, std::move(response_template)};
    CTLAPI_LOG_DEBUG("webhooks: Connection " + std::to_string(conn->get_id()) + " subscribed to console output");
  }
  return Outcome::success();
}

}  // namespace ctlapi
