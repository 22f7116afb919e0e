#include "ctlapi/subscription.hpp"

#include "ctlapi/connection.hpp"
#include "ctlapi/log.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

namespace ctlapi {

namespace {

std::string join(const std::set<std::string>& items) {
  std::string out;
  for (const auto& item : items) {
    if (!out.empty())
      out += ", ";
    out += item;
  }
  return out;
}

void register_or_throw(Router& router, const std::string& path, Router::Handler handler) {
  auto result = router.register_endpoint(path, std::move(handler));
  if (!result.has_value()) {
    throw std::logic_error(path + ": " + result.get_error().message);
  }
}

}  // namespace

SubscriptionEngine::SubscriptionEngine(EventLoop& loop, ObjectRegistry& registry, Router& router,
                                       std::chrono::milliseconds interval)
    : loop_(loop), registry_(registry), interval_(interval) {
  register_or_throw(router, "objects/list", [this](Request& r) { return handle_object_list(r); });
  register_or_throw(router, "objects/status", [this](Request& r) { return handle_status(r); });
  register_or_throw(router, "objects/subscription", [this](Request& r) { return handle_subscription(r); });
  register_or_throw(router, "objects/list_subscription",
                    [this](Request& r) { return handle_list_subscription(r); });

  timer_ = loop_.register_timer([this](TimePoint eventtime) { return handle_tick(eventtime); }, kNever);
}

SubscriptionEngine::~SubscriptionEngine() {
  loop_.unregister_timer(timer_);
}

void SubscriptionEngine::handle_ready() {
  TimePoint eventtime = loop_.monotonic();
  catalog_.clear();
  for (const auto& obj : registry_.lookup_objects()) {
    if (obj.status == nullptr)
      continue;
    nlohmann::json status = obj.status->get_status(eventtime);
    FieldSet fields;
    if (status.is_object()) {
      for (const auto& item : status.items()) {
        fields.insert(item.key());
      }
    }
    catalog_[obj.name] = std::move(fields);
  }
  ready_ = true;
  CTLAPI_LOG_DEBUG("webhooks: Status catalog holds " + std::to_string(catalog_.size()) + " objects");
}

void SubscriptionEngine::handle_restart() {
  ready_ = false;
  catalog_.clear();
  loop_.update_timer(timer_, kNever);
  timer_started_ = false;
}

nlohmann::json SubscriptionEngine::query_status(const ObjectRequest& requested, TimePoint eventtime) {
  if (!ready_) {
    return {{"status", kNotReady}};
  }

  nlohmann::json result = nlohmann::json::object();
  for (const auto& [name, fields] : requested) {
    if (catalog_.count(name) == 0)
      continue;
    // The object may have been removed since the catalog was built.
    const RegisteredObject* obj = registry_.lookup_object(name);
    if (obj == nullptr || obj->status == nullptr)
      continue;

    nlohmann::json status = obj->status->get_status(eventtime);
    if (!status.is_object())
      continue;
    if (fields.empty()) {
      result[name] = std::move(status);
      continue;
    }
    nlohmann::json filtered = nlohmann::json::object();
    for (const auto& item : status.items()) {
      if (fields.count(item.key()) != 0) {
        filtered[item.key()] = item.value();
      }
    }
    result[name] = std::move(filtered);
  }
  return result;
}

void SubscriptionEngine::add_subscription(const ObjectRequest& request) {
  for (const auto& [name, requested] : request) {
    auto avail = catalog_.find(name);
    if (avail == catalog_.end()) {
      CTLAPI_LOG_INFO("webhooks: Object {" + name + "} not available for subscription");
      continue;
    }

    FieldSet fields;
    if (!requested.empty()) {
      FieldSet invalid;
      for (const auto& field : requested) {
        if (avail->second.count(field) != 0) {
          fields.insert(field);
        } else {
          invalid.insert(field);
        }
      }
      if (!invalid.empty()) {
        CTLAPI_LOG_INFO("webhooks: Removed invalid items [" + join(invalid) + "] from subscription request " + name);
      }
      if (fields.empty())
        continue;
    }

    auto existing = subscriptions_.find(name);
    if (existing == subscriptions_.end()) {
      subscriptions_.emplace(name, std::move(fields));
    } else if (fields.empty() || existing->second.empty()) {
      existing->second.clear();
    } else {
      existing->second.insert(fields.begin(), fields.end());
    }
  }

  if (!timer_started_) {
    loop_.update_timer(timer_, kNow);
    timer_started_ = true;
  }
}

void SubscriptionEngine::add_client(const ConnPtr& conn, nlohmann::json response_template) {
  if (!conn)
    return;
  clients_[conn->get_id()] = Client{conn, std::move(response_template)};
}

expected<SubscriptionEngine::ObjectRequest, HandlerError> SubscriptionEngine::parse_object_request(
    const nlohmann::json& args) {
  using Result = expected<ObjectRequest, HandlerError>;
  ObjectRequest request;
  for (const auto& item : args.items()) {
    if (item.key() == kTemplateKey)
      continue;
    const nlohmann::json& fields = item.value();
    FieldSet set;
    if (fields.is_array()) {
      for (const auto& field : fields) {
        if (!field.is_string()) {
          return Result::error(HandlerError::command("Invalid Argument [" + item.key() + "]"));
        }
        set.insert(field.get<std::string>());
      }
    } else if (!fields.is_null()) {
      return Result::error(HandlerError::command("Invalid Argument [" + item.key() + "]"));
    }
    request.emplace(item.key(), std::move(set));
  }
  return Result::success(std::move(request));
}

TimePoint SubscriptionEngine::handle_tick(TimePoint eventtime) {
  nlohmann::json status;
  try {
    status = query_status(subscriptions_, eventtime);
  } catch (const std::exception& e) {
    CTLAPI_LOG_ERROR("webhooks: Status query failed, skipping push: " + std::string(e.what()));
    return eventtime + interval_;
  }

  for (auto it = clients_.begin(); it != clients_.end();) {
    const ConnPtr& conn = it->second.conn;
    if (conn->is_closed()) {
      it = clients_.erase(it);
      continue;
    }
    nlohmann::json msg = it->second.response_template;
    msg["params"] = nlohmann::json::object({{"status", status}});
    conn->send(msg);
    ++it;
  }
  return eventtime + interval_;
}

Outcome SubscriptionEngine::handle_object_list(Request& request) {
  nlohmann::json objects = nlohmann::json::object();
  for (const auto& [name, fields] : catalog_) {
    objects[name] = fields;
  }
  return request.send(std::move(objects));
}

Outcome SubscriptionEngine::handle_status(Request& request) {
  auto parsed = parse_object_request(request.get_args());
  if (!parsed.has_value()) {
    return Outcome::error(parsed.get_error());
  }
  return request.send(query_status(parsed.value(), loop_.monotonic()));
}

Outcome SubscriptionEngine::handle_subscription(Request& request) {
  auto parsed = parse_object_request(request.get_args());
  if (!parsed.has_value()) {
    return Outcome::error(parsed.get_error());
  }
  if (parsed.value().empty()) {
    return Outcome::error(HandlerError::command("Invalid argument"));
  }
  nlohmann::json response_template = request.get_or(kTemplateKey, nlohmann::json::object());
  if (!response_template.is_object()) {
    return Outcome::error(HandlerError::command("Invalid Argument [" + std::string(kTemplateKey) + "]"));
  }

  add_subscription(parsed.value());
  add_client(request.get_client_connection(), std::move(response_template));
  return Outcome::success();
}

Outcome SubscriptionEngine::handle_list_subscription(Request& request) {
  nlohmann::json subs = nlohmann::json::object();
  for (const auto& [name, fields] : subscriptions_) {
    subs[name] = fields;
  }
  return request.send(std::move(subs));
}

}  // namespace ctlapi
