#ifndef CTLAPI_EVENT_LOOP_HPP_
#define CTLAPI_EVENT_LOOP_HPP_

#include <cstdint>

#include <chrono>
#include <functional>

namespace ctlapi {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

// Timer sentinels: kNow fires on the next loop iteration, kNever parks a timer.
constexpr TimePoint kNow = TimePoint::min();
constexpr TimePoint kNever = TimePoint::max();

using FdHandle = uint64_t;
using TimerId = uint64_t;

constexpr FdHandle kInvalidFd = 0;
constexpr TimerId kInvalidTimer = 0;

// ============================================================================
// EventLoop (cooperative single-threaded scheduler owned by the host)
// ============================================================================

class EventLoop {
 public:
  using FdCallback = std::function<void(TimePoint)>;
  using Callback = std::function<void(TimePoint)>;
  // Returns the next wake time, or kNever to park the timer.
  using TimerCallback = std::function<TimePoint(TimePoint)>;

  virtual ~EventLoop() = default;

  virtual TimePoint monotonic() const = 0;

  // Read readiness (including hangup and error) of a non-blocking fd.
  virtual FdHandle register_fd(int fd, FdCallback callback) = 0;
  virtual void unregister_fd(FdHandle handle) = 0;

  // One-shot callback, run from the loop after waketime. Never invoked
  // inline from the registering call.
  virtual void register_callback(Callback callback, TimePoint waketime = kNow) = 0;

  virtual TimerId register_timer(TimerCallback callback, TimePoint waketime = kNever) = 0;
  virtual void update_timer(TimerId id, TimePoint waketime) = 0;
  virtual void unregister_timer(TimerId id) = 0;
};

}  // namespace ctlapi

#endif  // CTLAPI_EVENT_LOOP_HPP_
