#pragma once

#include <absl/time/time.h>
#include <event2/event.h>
#include <event2/util.h>

#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <string>
#include <thread>

#include "Clock.h"
#include "CtldPublicDefs.h"

namespace PodCtld {

/**
 * Runs the periodic control loops (failure detection, rescheduling, the
 * heartbeat simulator). Tasks are registered before Start().
 */
class TimerDriverInterface {
 public:
  using TaskCb = std::function<void()>;

  virtual ~TimerDriverInterface() = default;

  virtual void AddPeriodicTask(std::string name, absl::Duration interval,
                               TaskCb cb) = 0;

  virtual PodxErr Start() = 0;

  virtual void Stop() = 0;

 protected:
  TimerDriverInterface() = default;

  // An exception thrown by a task is logged. It stops neither the task nor
  // the driver.
  static void RunTaskGuarded_(const std::string& name, const TaskCb& cb);
};

/**
 * Fires the tasks with libevent timers on a dedicated event loop thread.
 */
class LibEventTimerDriver final : public TimerDriverInterface {
 public:
  LibEventTimerDriver();

  ~LibEventTimerDriver() override;

  void AddPeriodicTask(std::string name, absl::Duration interval,
                       TaskCb cb) override;

  PodxErr Start() override;

  // Ask the event loop to exit and wait for it. In-flight tasks finish.
  void Stop() override;

 private:
  struct PeriodicTask {
    std::string name;
    absl::Duration interval;
    TaskCb cb;

    struct event* ev{nullptr};
  };

  static void EvOnTimerCb_(evutil_socket_t, short, void* arg);

  static void EvExitEventCb_(evutil_socket_t efd, short events,
                             void* user_data);

  struct event_base* m_ev_base_;

  // When this event is triggered, the event loop will exit.
  struct event* m_ev_exit_event_;
  int m_ev_exit_fd_;

  std::list<std::unique_ptr<PeriodicTask>> m_tasks_;

  std::atomic_bool m_running_{false};
  std::thread m_ev_loop_thread_;
};

/**
 * Fires the tasks against a ManualClock. Nothing happens until Advance() is
 * called, so tests can drive the control loops deterministically.
 */
class VirtualTimerDriver final : public TimerDriverInterface {
 public:
  explicit VirtualTimerDriver(ManualClock* clock) : m_clock_(clock) {}

  void AddPeriodicTask(std::string name, absl::Duration interval,
                       TaskCb cb) override;

  // Each task first fires one interval after Start().
  PodxErr Start() override;

  void Stop() override { m_running_ = false; }

  /**
   * Move the clock forward by `d`, firing every task that falls due on the
   * way in deadline order. The clock reads each deadline while its task
   * runs. Tasks due at the same instant fire in registration order.
   * @return the number of task runs.
   */
  uint32_t Advance(absl::Duration d);

 private:
  struct PeriodicTask {
    std::string name;
    absl::Duration interval;
    TaskCb cb;

    absl::Time next_fire;
  };

  ManualClock* m_clock_;

  std::list<PeriodicTask> m_tasks_;
  bool m_running_{false};
};

}  // namespace PodCtld
