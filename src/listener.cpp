#include "ctlapi/listener.hpp"

#include "ctlapi/log.hpp"

#include <cerrno>
#include <cstring>

#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

namespace ctlapi {

Listener::Listener(EventLoop& loop, const ServerConfig& config, Router& router)
    : loop_(loop), config_(config), router_(router) {}

Listener::~Listener() {
  shutdown();
}

void Listener::remove_socket_file(const std::string& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec && std::filesystem::exists(path)) {
    CTLAPI_LOG_ERROR("webhooks: Unable to delete socket file '" + path + "': " + ec.message());
    throw std::system_error(ec, "Unable to delete socket file '" + path + "'");
  }
}

void Listener::open() {
  if (!config_.enabled()) {
    CTLAPI_LOG_INFO("webhooks: API server disabled");
    return;
  }
  if (is_open())
    return;

  const std::string& path = config_.socket_path();
  remove_socket_file(path);

  if (!acceptor_.open(sockpp::unix_address(path), config_.backlog())) {
    throw std::runtime_error("Failed to bind socket '" + path + "': " + acceptor_.last_error_str());
  }
  acceptor_.set_non_blocking(true);

  fd_handle_ = loop_.register_fd(acceptor_.handle(), [this](TimePoint) { (void)handle_accept(); });
  CTLAPI_LOG_INFO("webhooks: API server listening on " + path);
}

expected<void, ErrorCode> Listener::handle_accept() {
  sockpp::unix_socket sock = acceptor_.accept();
  if (!sock.is_open()) {
    int err = acceptor_.last_error();
    if (err != EAGAIN && err != EWOULDBLOCK) {
      CTLAPI_LOG_DEBUG("webhooks: Accept error: " + std::string(strerror(err)));
      return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
    }
    return expected<void, ErrorCode>::success();
  }

  uint64_t id = next_conn_id_++;
  auto conn = std::make_shared<Connection>(id, std::move(sock), loop_, config_);
  conn->on_request = [this](Request& request) { router_.process(request); };
  conn->on_close = [this](const ConnPtr& closed) { pop_client(closed->get_id()); };
  clients_.emplace(id, conn);
  conn->start();

  if (on_connect) {
    on_connect(conn);
  }
  return expected<void, ErrorCode>::success();
}

void Listener::pop_client(uint64_t id) {
  clients_.erase(id);
}

void Listener::shutdown() {
  // close() pops each client from the map, so walk a snapshot.
  std::vector<ConnPtr> clients;
  clients.reserve(clients_.size());
  for (const auto& [id, conn] : clients_) {
    clients.push_back(conn);
  }
  for (auto& conn : clients) {
    conn->close();
  }
  clients_.clear();

  if (fd_handle_ == kInvalidFd)
    return;
  loop_.unregister_fd(fd_handle_);
  fd_handle_ = kInvalidFd;
  (void)acceptor_.close();

  std::error_code ec;
  std::filesystem::remove(config_.socket_path(), ec);
  if (ec) {
    CTLAPI_LOG_WARN("webhooks: Unable to remove socket file '" + config_.socket_path() + "': " + ec.message());
  }
  CTLAPI_LOG_INFO("webhooks: API server closed");
}

}  // namespace ctlapi
