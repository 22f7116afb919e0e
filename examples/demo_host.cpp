#include "ctlapi.hpp"

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <map>
#include <string>
#include <vector>

// Minimal host with one moving "toolhead" so the status stream has
// something to show. Connect with e.g.:
//   printf '{"id":1,"method":"list_endpoints"}\x03' | socat - UNIX-CONNECT:/tmp/ctlapi.sock

namespace {

ctlapi::Reactor* g_reactor = nullptr;

void on_signal(int) {
  if (g_reactor)
    g_reactor->stop();
}

class Toolhead : public ctlapi::StatusProvider {
 public:
  nlohmann::json get_status(ctlapi::TimePoint eventtime) override {
    double t = std::chrono::duration<double>(eventtime.time_since_epoch()).count();
    return {{"position", {t, 0.0, 0.0, 0.0}}, {"homed_axes", "xyz"}, {"max_velocity", 300.0}};
  }
};

class DemoHost : public ctlapi::Host, public ctlapi::ObjectRegistry {
 public:
  void add(const std::string& name, ctlapi::StatusProvider* status) { objects_[name] = {name, status}; }

  void invoke_shutdown(const std::string& reason) override {
    state_ = {"shutdown", reason};
    std::cerr << "Shutdown: " << reason << std::endl;
  }

  ctlapi::StateMessage get_state_message() const override { return state_; }

  std::vector<ctlapi::RegisteredObject> lookup_objects() const override {
    std::vector<ctlapi::RegisteredObject> out;
    for (const auto& [name, obj] : objects_) {
      out.push_back(obj);
    }
    return out;
  }

  const ctlapi::RegisteredObject* lookup_object(const std::string& name) const override {
    auto it = objects_.find(name);
    return it == objects_.end() ? nullptr : &it->second;
  }

  void set_ready() { state_ = {"ready", "Printer is ready"}; }

 private:
  ctlapi::StateMessage state_{"startup", "Host is starting"};
  std::map<std::string, ctlapi::RegisteredObject> objects_;
};

}  // namespace

int main(int argc, char* argv[]) {
  std::string path = "/tmp/ctlapi.sock";
  if (argc > 1) {
    path = argv[1];
  }

  try {
    ctlapi::Reactor reactor;
    g_reactor = &reactor;
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    ctlapi::ServerConfig config(path);
    if (const char* level = std::getenv("CTLAPI_LOG_LEVEL")) {
      config.set_log_level(ctlapi::Logger::parse_level(level));
    }
    ctlapi::Logger::set_level(config.log_level());

    ctlapi::StartArgs start_args;
    start_args.install_path = "/opt/demo";
    start_args.executable_path = argv[0];
    start_args.software_version = "demo";

    DemoHost host;
    Toolhead toolhead;

    ctlapi::Router router(host, start_args);
    ctlapi::SubscriptionEngine status(reactor, host, router, config.subscription_interval());
    ctlapi::OutputBroadcaster output(router);
    ctlapi::Listener listener(reactor, config, router);

    host.add("toolhead", &toolhead);
    host.add("webhooks", &router);

    // Echo endpoint that also exercises console output push.
    (void)router.register_endpoint("gcode/script", [&output](ctlapi::Request& request) -> ctlapi::Outcome {
      auto script = request.get_string("script");
      if (!script.has_value()) {
        return ctlapi::Outcome::error(script.get_error());
      }
      output.publish("// " + script.value());
      return ctlapi::Outcome::success();
    });

    listener.open();
    host.set_ready();
    status.handle_ready();

    reactor.run();
    listener.shutdown();
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
