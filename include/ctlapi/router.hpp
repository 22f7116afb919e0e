#ifndef CTLAPI_ROUTER_HPP_
#define CTLAPI_ROUTER_HPP_

#include "config.hpp"
#include "host.hpp"
#include "request.hpp"
#include "vocabulary.hpp"

#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace ctlapi {

// ============================================================================
// Router (endpoint registry and dispatch policy)
// ============================================================================

/**
 * @brief Maps request paths to handlers and applies the error policy.
 *
 * A handler answers through Request::send(), or leaves the request alone to
 * answer "ok". Returning a command error (or reaching an unknown path)
 * answers the client with an error body and nothing else happens. Returning
 * an internal error, or throwing, answers the client with an error body and
 * then shuts the host down.
 *
 * The router is also a StatusProvider reporting the host state, so the host
 * can register it in its object registry.
 */
class Router : public StatusProvider {
 public:
  using Handler = std::function<Outcome(Request&)>;

  Router(Host& host, StartArgs start_args);

  Router(const Router&) = delete;
  Router& operator=(const Router&) = delete;

  // Fails with "Path already registered to an endpoint" on a duplicate.
  expected<void, HandlerError> register_endpoint(const std::string& path, Handler handler);

  expected<const Handler*, HandlerError> get_callback(const std::string& path) const;

  // Runs the handler and applies the error policy. Does not reply.
  void dispatch(Request& request);

  // dispatch() followed by finish() and a reply on the request's connection.
  void process(Request& request);

  // Registered paths in registration order.
  const std::vector<std::string>& endpoints() const { return order_; }

  nlohmann::json get_status(TimePoint eventtime) override;

  static constexpr const char* kEstopReason = "Shutdown due to webhooks request";

 private:
  Host& host_;
  StartArgs start_args_;
  std::unordered_map<std::string, Handler> endpoints_;
  std::vector<std::string> order_;

  Outcome invoke(const Handler& handler, Request& request);

  Outcome handle_list_endpoints(Request& request);
  Outcome handle_info(Request& request);
  Outcome handle_emergency_stop(Request& request);
};

}  // namespace ctlapi

#endif  // CTLAPI_ROUTER_HPP_
