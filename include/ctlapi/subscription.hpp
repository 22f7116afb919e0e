#ifndef CTLAPI_SUBSCRIPTION_HPP_
#define CTLAPI_SUBSCRIPTION_HPP_

#include "event_loop.hpp"
#include "host.hpp"
#include "router.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <chrono>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <set>
#include <string>

namespace ctlapi {

class Connection;

// ============================================================================
// SubscriptionEngine (object catalog, merged subscriptions, periodic push)
// ============================================================================

/**
 * @brief Serves the objects/ endpoints and pushes subscribed status.
 *
 * The engine keeps one merged field set per object for all clients, not a
 * per-client list. An empty field set means "all fields" and absorbs any
 * finite set merged into it. Every subscribed connection receives the same
 * snapshot every interval, wrapped in its own response template.
 */
class SubscriptionEngine {
 public:
  using ConnPtr = std::shared_ptr<Connection>;
  using FieldSet = std::set<std::string>;  // empty: all fields
  using ObjectRequest = std::map<std::string, FieldSet>;

  static constexpr std::chrono::milliseconds kDefaultInterval{250};
  static constexpr const char* kTemplateKey = "response_template";
  static constexpr const char* kNotReady = "Host Not Ready";

  SubscriptionEngine(EventLoop& loop, ObjectRegistry& registry, Router& router,
                     std::chrono::milliseconds interval = kDefaultInterval);
  ~SubscriptionEngine();

  SubscriptionEngine(const SubscriptionEngine&) = delete;
  SubscriptionEngine& operator=(const SubscriptionEngine&) = delete;

  // Host became ready: rebuild the catalog from every object with a status.
  void handle_ready();

  // Host restart requested: stop pushing until the next subscription.
  void handle_restart();

  nlohmann::json query_status(const ObjectRequest& requested, TimePoint eventtime);

  // Validates against the catalog and merges into the global table.
  void add_subscription(const ObjectRequest& request);

  // Registers (or replaces) the push template of a connection.
  void add_client(const ConnPtr& conn, nlohmann::json response_template);

  // Converts {"name": [fields] | null, ...} into an ObjectRequest. The
  // response template key is skipped.
  static expected<ObjectRequest, HandlerError> parse_object_request(const nlohmann::json& args);

  // Timer body; public so hosts without a timer can drive it.
  TimePoint handle_tick(TimePoint eventtime);

  bool is_ready() const { return ready_; }
  bool timer_started() const { return timer_started_; }
  const std::map<std::string, FieldSet>& catalog() const { return catalog_; }
  const ObjectRequest& subscriptions() const { return subscriptions_; }
  size_t client_count() const { return clients_.size(); }

 private:
  struct Client {
    ConnPtr conn;
    nlohmann::json response_template;
  };

  EventLoop& loop_;
  ObjectRegistry& registry_;
  std::chrono::milliseconds interval_;

  std::map<std::string, FieldSet> catalog_;
  ObjectRequest subscriptions_;
  std::map<uint64_t, Client> clients_;

  TimerId timer_ = kInvalidTimer;
  bool timer_started_ = false;
  bool ready_ = false;

  Outcome handle_object_list(Request& request);
  Outcome handle_status(Request& request);
  Outcome handle_subscription(Request& request);
  Outcome handle_list_subscription(Request& request);
};

}  // namespace ctlapi

#endif  // CTLAPI_SUBSCRIPTION_HPP_
