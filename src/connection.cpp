#include "ctlapi/connection.hpp"

#include "ctlapi/log.hpp"

#include <cerrno>
#include <cstring>

#include <sys/socket.h>
#include <utility>
#include <vector>

namespace ctlapi {

namespace {

// Deferred dispatch of one decoded request. Becomes a no-op when the
// connection closed before the loop got to it.
struct RequestTask {
  Request request;

  void operator()(TimePoint /* eventtime */) {
    const auto& conn = request.get_client_connection();
    if (!conn || conn->is_closed()) {
      CTLAPI_LOG_DEBUG("webhooks: Dropping request for closed connection: " + request.get_path());
      return;
    }
    if (conn->on_request) {
      conn->on_request(request);
    }
  }
};

}  // namespace

Connection::Connection(uint64_t id, sockpp::unix_socket&& sock, EventLoop& loop, const ServerConfig& config)
    : id_(id), socket_(std::move(sock)), loop_(loop), config_(config) {
  socket_.set_non_blocking(true);
}

Connection::~Connection() {
  if (socket_.is_open()) {
    socket_.close();
  }
}

void Connection::start() {
  if (closed_ || fd_handle_ != kInvalidFd)
    return;
  std::weak_ptr<Connection> weak = shared_from_this();
  fd_handle_ = loop_.register_fd(socket_.handle(), [weak](TimePoint) {
    if (auto self = weak.lock()) {
      (void)self->handle_read();
    }
  });
  CTLAPI_LOG_INFO("webhooks: New connection established");
}

expected<void, ErrorCode> Connection::handle_read() {
  if (closed_) {
    return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
  }

  std::vector<char> buf(config_.recv_chunk_size());
  ssize_t n = socket_.read(buf.data(), buf.size());

  if (n < 0) {
    int err = socket_.last_error();
    // A bad descriptor is handled like end-of-stream.
    if (err != EBADF) {
      if (err != EAGAIN && err != EWOULDBLOCK) {
        CTLAPI_LOG_DEBUG("webhooks: Read error: " + std::string(strerror(err)));
      }
      return expected<void, ErrorCode>::success();
    }
    n = 0;
  }

  if (n == 0) {
    close();
    return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
  }

  for (auto& body : decoder_.feed(std::string_view(buf.data(), static_cast<size_t>(n)))) {
    CTLAPI_LOG_DEBUG("webhooks: Request received: " + body);
    auto decoded = frame::decode(body);
    if (!decoded.has_value()) {
      CTLAPI_LOG_ERROR("webhooks: Error decoding Server Request " + body);
      continue;
    }
    auto request = Request::from_json(decoded.value(), shared_from_this());
    if (!request.has_value()) {
      CTLAPI_LOG_ERROR("webhooks: Malformed Server Request " + body);
      continue;
    }
    queue_request(std::move(request.value()));
  }
  return expected<void, ErrorCode>::success();
}

void Connection::queue_request(Request&& request) {
  loop_.register_callback(RequestTask{std::move(request)});
}

void Connection::send(const nlohmann::json& data) {
  if (closed_) {
    CTLAPI_LOG_DEBUG("webhooks: Dropping send on closed connection");
    return;
  }
  send_buffer_ += frame::encode(data);
  if (!is_sending_) {
    is_sending_ = true;
    retries_ = config_.send_retries();
    schedule_flush(kNow);
  }
}

void Connection::schedule_flush(TimePoint waketime) {
  auto self = shared_from_this();
  loop_.register_callback([self](TimePoint) { self->flush(); }, waketime);
}

void Connection::flush() {
  if (closed_) {
    is_sending_ = false;
    return;
  }

  while (!send_buffer_.empty()) {
    ssize_t sent = write_some(send_buffer_.data(), send_buffer_.size());
    if (sent < 0) {
      int err = errno;
      if (err != EBADF && err != EPIPE && retries_ > 0) {
        // Yield to the loop instead of spinning; the flush stays in progress.
        --retries_;
        schedule_flush(loop_.monotonic() + config_.send_retry_pause());
        return;
      }
      sent = 0;
    }
    retries_ = config_.send_retries();
    if (sent > 0) {
      send_buffer_.erase(0, static_cast<size_t>(sent));
    } else {
      CTLAPI_LOG_INFO("webhooks: Error sending server data, closing socket");
      close();
      break;
    }
  }
  is_sending_ = false;
}

ssize_t Connection::write_some(const char* data, size_t len) {
  return ::send(socket_.handle(), data, len, MSG_NOSIGNAL | MSG_DONTWAIT);
}

void Connection::close() {
  if (closed_)
    return;

  auto self = shared_from_this();
  closed_ = true;
  CTLAPI_LOG_INFO("webhooks: Client connection closed");

  if (fd_handle_ != kInvalidFd) {
    loop_.unregister_fd(fd_handle_);
    fd_handle_ = kInvalidFd;
  }
  // Errors on close are of no interest at this point.
  (void)socket_.close();

  send_buffer_.clear();
  decoder_.clear();

  if (on_close) {
    on_close(self);
  }
}

}  // namespace ctlapi
