#ifndef CTLAPI_OUTPUT_BROADCASTER_HPP_
#define CTLAPI_OUTPUT_BROADCASTER_HPP_

#include "router.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace ctlapi {

class Connection;

// ============================================================================
// OutputBroadcaster (console output push to subscribed clients)
// ============================================================================

// Serves "subscribe_gcode_output". The host calls publish() for every line
// its command processor prints.
class OutputBroadcaster {
 public:
  using ConnPtr = std::shared_ptr<Connection>;

  explicit OutputBroadcaster(Router& router);

  void publish(const std::string& message);

  size_t client_count() const { return clients_.size(); }

 private:
  struct Client {
    ConnPtr conn;
    nlohmann::json response_template;
  };

  std::map<uint64_t, Client> clients_;

  Outcome handle_subscribe(Request& request);
};

}  // namespace ctlapi

#endif  // CTLAPI_OUTPUT_BROADCASTER_HPP_
