#include "ctlapi/reactor.hpp"

#include "ctlapi/log.hpp"

#include <cerrno>
#include <cstring>

#include <algorithm>
#include <string>
#include <utility>

namespace ctlapi {

FdHandle Reactor::register_fd(int fd, FdCallback callback) {
  FdHandle handle = next_fd_handle_++;
  fds_.emplace(handle, FdEntry{fd, std::move(callback)});
  return handle;
}

void Reactor::unregister_fd(FdHandle handle) {
  fds_.erase(handle);
}

void Reactor::register_callback(Callback callback, TimePoint waketime) {
  callbacks_.emplace(waketime, std::move(callback));
}

TimerId Reactor::register_timer(TimerCallback callback, TimePoint waketime) {
  TimerId id = next_timer_id_++;
  timers_.emplace(id, TimerEntry{std::move(callback), waketime});
  return id;
}

void Reactor::update_timer(TimerId id, TimePoint waketime) {
  auto it = timers_.find(id);
  if (it != timers_.end()) {
    it->second.waketime = waketime;
  }
}

void Reactor::unregister_timer(TimerId id) {
  timers_.erase(id);
}

void Reactor::run() {
  is_running_ = true;
  CTLAPI_LOG_DEBUG("Reactor starting");
  while (is_running_) {
    run_once(std::chrono::milliseconds(poll_timeout_ms_));
  }
  CTLAPI_LOG_DEBUG("Reactor stopped");
}

int Reactor::compute_timeout_ms(TimePoint now, std::chrono::milliseconds max_wait) const {
  TimePoint next = now + max_wait;
  if (!callbacks_.empty()) {
    next = std::min(next, callbacks_.begin()->first);
  }
  for (const auto& [id, timer] : timers_) {
    next = std::min(next, timer.waketime);
  }
  // Compare before subtracting: kNow would overflow the difference.
  if (next <= now)
    return 0;
  auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(next - now).count();
  return static_cast<int>(std::max<int64_t>(1, wait));
}

void Reactor::run_once(std::chrono::milliseconds max_wait) {
  int timeout = compute_timeout_ms(monotonic(), max_wait);

  poll_fds_.clear();
  poll_handles_.clear();
  for (const auto& [handle, entry] : fds_) {
    poll_fds_.push_back({entry.fd, POLLIN, 0});
    poll_handles_.push_back(handle);
  }

  int ret = ::poll(poll_fds_.data(), static_cast<nfds_t>(poll_fds_.size()), timeout);
  if (ret < 0 && errno != EINTR) {
    CTLAPI_LOG_ERROR("Poll error: " + std::string(strerror(errno)));
  }

  TimePoint now = monotonic();

  if (ret > 0) {
    for (size_t i = 0; i < poll_fds_.size(); ++i) {
      if (!(poll_fds_[i].revents & (POLLIN | POLLHUP | POLLERR | POLLNVAL)))
        continue;
      // An earlier callback in this pass may have unregistered the fd.
      auto it = fds_.find(poll_handles_[i]);
      if (it == fds_.end())
        continue;
      // Copy: the callback may unregister itself.
      FdCallback callback = it->second.callback;
      callback(now);
    }
  }

  dispatch_timers(now);
  dispatch_callbacks(now);
}

void Reactor::dispatch_timers(TimePoint now) {
  std::vector<TimerId> due;
  for (const auto& [id, timer] : timers_) {
    if (timer.waketime <= now) {
      due.push_back(id);
    }
  }
  for (TimerId id : due) {
    auto it = timers_.find(id);
    if (it == timers_.end())
      continue;
    TimerCallback callback = it->second.callback;
    // Park while running so a throwing callback cannot refire in a loop.
    it->second.waketime = kNever;
    TimePoint next = callback(now);
    it = timers_.find(id);
    if (it != timers_.end()) {
      it->second.waketime = next;
    }
  }
}

void Reactor::dispatch_callbacks(TimePoint now) {
  // Callbacks registered while these run wait for the next iteration.
  std::vector<Callback> due;
  auto end = callbacks_.upper_bound(now);
  for (auto it = callbacks_.begin(); it != end; ++it) {
    due.push_back(std::move(it->second));
  }
  callbacks_.erase(callbacks_.begin(), end);

  for (auto& callback : due) {
    callback(now);
  }
}

}  // namespace ctlapi
