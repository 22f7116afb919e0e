#ifndef CTLAPI_CONFIG_HPP_
#define CTLAPI_CONFIG_HPP_

#include "log.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <utility>

namespace ctlapi {

// ============================================================================
// StartArgs (process start metadata reported by the "info" endpoint)
// ============================================================================

struct StartArgs {
  std::string install_path;
  std::string executable_path;
  // Empty means "not supplied" and is reported as null.
  std::string log_file;
  std::string config_file;
  std::string software_version;
  std::string cpu_info;
};

// ============================================================================
// ServerConfig
// ============================================================================

class ServerConfig {
 public:
  ServerConfig() = default;
  explicit ServerConfig(std::string socket_path) : socket_path_(std::move(socket_path)) {}

  ServerConfig& set_socket_path(const std::string& path) {
    socket_path_ = path;
    return *this;
  }

  // A host replaying a captured input file does not serve clients.
  ServerConfig& set_debug_input(bool enable) {
    debug_input_ = enable;
    return *this;
  }

  ServerConfig& set_backlog(int backlog) {
    backlog_ = backlog;
    return *this;
  }

  ServerConfig& set_recv_chunk_size(size_t size) {
    recv_chunk_size_ = size;
    return *this;
  }

  ServerConfig& set_send_retries(int retries) {
    send_retries_ = retries;
    return *this;
  }

  ServerConfig& set_send_retry_pause(std::chrono::milliseconds pause) {
    send_retry_pause_ = pause;
    return *this;
  }

  ServerConfig& set_subscription_interval(std::chrono::milliseconds interval) {
    subscription_interval_ = interval;
    return *this;
  }

  ServerConfig& set_log_level(Logger::Level level) {
    log_level_ = level;
    return *this;
  }

  const std::string& socket_path() const { return socket_path_; }
  bool debug_input() const { return debug_input_; }
  bool enabled() const { return !socket_path_.empty() && !debug_input_; }
  int backlog() const { return backlog_; }
  size_t recv_chunk_size() const { return recv_chunk_size_; }
  int send_retries() const { return send_retries_; }
  std::chrono::milliseconds send_retry_pause() const { return send_retry_pause_; }
  std::chrono::milliseconds subscription_interval() const { return subscription_interval_; }
  Logger::Level log_level() const { return log_level_; }

  // Default values
  static constexpr int kDefaultBacklog = 1;
  static constexpr size_t kDefaultRecvChunk = 4096;
  static constexpr int kDefaultSendRetries = 10;

 private:
  std::string socket_path_;
  bool debug_input_ = false;
  int backlog_ = kDefaultBacklog;
  size_t recv_chunk_size_ = kDefaultRecvChunk;
  int send_retries_ = kDefaultSendRetries;
  std::chrono::milliseconds send_retry_pause_{1};
  std::chrono::milliseconds subscription_interval_{250};
  Logger::Level log_level_ = Logger::Level::kInfo;
};

}  // namespace ctlapi

#endif  // CTLAPI_CONFIG_HPP_
