#ifndef CTLAPI_REACTOR_HPP_
#define CTLAPI_REACTOR_HPP_

#include "event_loop.hpp"

#include <cstdint>

#include <atomic>
#include <chrono>
#include <map>
#include <poll.h>
#include <vector>

namespace ctlapi {

// ============================================================================
// Reactor (poll(2) based EventLoop)
// ============================================================================

class Reactor : public EventLoop {
 public:
  Reactor() = default;
  ~Reactor() override = default;

  Reactor(const Reactor&) = delete;
  Reactor& operator=(const Reactor&) = delete;

  TimePoint monotonic() const override { return Clock::now(); }

  FdHandle register_fd(int fd, FdCallback callback) override;
  void unregister_fd(FdHandle handle) override;

  void register_callback(Callback callback, TimePoint waketime = kNow) override;

  TimerId register_timer(TimerCallback callback, TimePoint waketime = kNever) override;
  void update_timer(TimerId id, TimePoint waketime) override;
  void unregister_timer(TimerId id) override;

  // Runs until stop() is called.
  void run();

  // One iteration: wait for readiness (bounded by max_wait and the next due
  // timer or callback), then dispatch fds, due timers and due callbacks.
  void run_once(std::chrono::milliseconds max_wait);

  // May be called from another thread.
  void stop() { is_running_ = false; }

  bool is_running() const { return is_running_; }

  Reactor& set_poll_timeout_ms(int timeout) {
    poll_timeout_ms_ = timeout;
    return *this;
  }

  size_t fd_count() const { return fds_.size(); }
  size_t timer_count() const { return timers_.size(); }
  size_t pending_callbacks() const { return callbacks_.size(); }

 private:
  struct FdEntry {
    int fd;
    FdCallback callback;
  };

  struct TimerEntry {
    TimerCallback callback;
    TimePoint waketime;
  };

  std::map<FdHandle, FdEntry> fds_;
  std::map<TimerId, TimerEntry> timers_;
  // Equal keys keep insertion order, so same-time callbacks run FIFO.
  std::multimap<TimePoint, Callback> callbacks_;

  std::vector<pollfd> poll_fds_;
  std::vector<FdHandle> poll_handles_;

  std::atomic<bool> is_running_{false};
  int poll_timeout_ms_ = 1000;

  FdHandle next_fd_handle_ = 1;
  TimerId next_timer_id_ = 1;

  int compute_timeout_ms(TimePoint now, std::chrono::milliseconds max_wait) const;
  void dispatch_timers(TimePoint now);
  void dispatch_callbacks(TimePoint now);
};

}  // namespace ctlapi

#endif  // CTLAPI_REACTOR_HPP_
