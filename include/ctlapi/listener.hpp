#ifndef CTLAPI_LISTENER_HPP_
#define CTLAPI_LISTENER_HPP_

#include "config.hpp"
#include "connection.hpp"
#include "event_loop.hpp"
#include "router.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <functional>
#include <map>
#include <memory>
#include <sockpp/unix_acceptor.h>
#include <string>

namespace ctlapi {

// ============================================================================
// Listener (bound Unix socket and the set of live client connections)
// ============================================================================

class Listener {
 public:
  using ConnPtr = std::shared_ptr<Connection>;

  Listener(EventLoop& loop, const ServerConfig& config, Router& router);
  ~Listener();

  Listener(const Listener&) = delete;
  Listener& operator=(const Listener&) = delete;

  // Removes a stale socket file, binds, listens and registers with the loop.
  // Does nothing when the config has no socket path or is in debug-input
  // mode. Throws std::system_error when the stale file cannot be removed and
  // std::runtime_error when bind/listen fails.
  void open();

  // Accepts at most one pending connection. An empty accept queue is not an
  // error; other accept failures return error(kSocketError).
  expected<void, ErrorCode> handle_accept();

  // Host disconnect: closes every client, then the listening socket.
  void shutdown();

  // Drops the listener's reference to a connection (called on close).
  void pop_client(uint64_t id);

  bool is_open() const { return fd_handle_ != kInvalidFd; }
  size_t connection_count() const { return clients_.size(); }
  const std::string& socket_path() const { return config_.socket_path(); }

  // Called for each accepted connection after it is registered.
  std::function<void(const ConnPtr&)> on_connect;

 private:
  EventLoop& loop_;
  const ServerConfig& config_;
  Router& router_;

  sockpp::unix_acceptor acceptor_;
  FdHandle fd_handle_ = kInvalidFd;

  std::map<uint64_t, ConnPtr> clients_;
  uint64_t next_conn_id_ = 1;

  static void remove_socket_file(const std::string& path);
};

}  // namespace ctlapi

#endif  // CTLAPI_LISTENER_HPP_
