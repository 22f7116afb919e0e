#ifndef CTLAPI_HOST_HPP_
#define CTLAPI_HOST_HPP_

#include "event_loop.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

namespace ctlapi {

// ============================================================================
// Collaborator interfaces implemented by the embedding host
// ============================================================================

// Implemented by domain objects that can report a status snapshot.
class StatusProvider {
 public:
  virtual ~StatusProvider() = default;

  // Returns a JSON object mapping field name to current value.
  virtual nlohmann::json get_status(TimePoint eventtime) = 0;
};

struct RegisteredObject {
  std::string name;
  StatusProvider* status = nullptr;  // nullptr when the object has no status
};

class ObjectRegistry {
 public:
  virtual ~ObjectRegistry() = default;

  virtual std::vector<RegisteredObject> lookup_objects() const = 0;

  // Returns nullptr when no object of that name exists.
  virtual const RegisteredObject* lookup_object(const std::string& name) const = 0;
};

struct StateMessage {
  std::string state;  // "startup", "ready", "error", "shutdown"
  std::string message;
};

class Host {
 public:
  virtual ~Host() = default;

  // Stops machine control. Must be safe to call from an event-loop task.
  virtual void invoke_shutdown(const std::string& reason) = 0;

  virtual StateMessage get_state_message() const = 0;
};

}  // namespace ctlapi

#endif  // CTLAPI_HOST_HPP_
