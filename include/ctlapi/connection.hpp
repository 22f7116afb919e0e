#ifndef CTLAPI_CONNECTION_HPP_
#define CTLAPI_CONNECTION_HPP_

#include "config.hpp"
#include "event_loop.hpp"
#include "frame_codec.hpp"
#include "request.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <sockpp/unix_stream_socket.h>
#include <string>
#include <sys/types.h>

namespace ctlapi {

// ============================================================================
// Connection (one accepted client socket: framing, send queue, flush state)
// ============================================================================

class Connection : public std::enable_shared_from_this<Connection> {
 public:
  using ConnPtr = std::shared_ptr<Connection>;

  Connection(uint64_t id, sockpp::unix_socket&& sock, EventLoop& loop, const ServerConfig& config);
  virtual ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  // Registers the socket with the event loop. Call once after the
  // connection is owned by a shared_ptr.
  void start();

  // --- Reactor I/O API ---

  // Performs one non-blocking receive. Complete frames become Requests that
  // are queued on the event loop; they are never dispatched inline.
  // Returns error(kConnectionClosed) when the peer closed (the connection is
  // closed before returning). Transient errors return success() and are
  // retried on the next readiness event.
  expected<void, ErrorCode> handle_read();

  // --- User API ---

  // Queues one frame for delivery and schedules a flush when none is in
  // progress. Sending on a closed connection is dropped.
  void send(const nlohmann::json& data);

  // Idempotent. Safe from the read path, the flush path and host shutdown.
  void close();

  bool is_closed() const { return closed_; }

  bool is_sending() const { return is_sending_; }

  size_t pending_bytes() const { return send_buffer_.size(); }

  int get_fd() const { return socket_.handle(); }

  uint64_t get_id() const { return id_; }

  // --- Callbacks ---

  // Runs from a deferred loop task, only while the connection is open.
  std::function<void(Request&)> on_request;
  std::function<void(const ConnPtr&)> on_close;

 protected:
  // Sends without blocking. Same contract as send(2): bytes written, or -1
  // with errno set.
  virtual ssize_t write_some(const char* data, size_t len);

 private:
  uint64_t id_;
  sockpp::unix_socket socket_;
  EventLoop& loop_;
  const ServerConfig& config_;

  FdHandle fd_handle_ = kInvalidFd;
  bool closed_ = false;

  FrameDecoder decoder_;
  std::string send_buffer_;
  bool is_sending_ = false;
  int retries_ = 0;

  void flush();
  void schedule_flush(TimePoint waketime);
  void queue_request(Request&& request);
};

}  // namespace ctlapi

#endif  // CTLAPI_CONNECTION_HPP_
