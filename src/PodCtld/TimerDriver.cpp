#include "TimerDriver.h"

#include <sys/eventfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <exception>

namespace PodCtld {

void TimerDriverInterface::RunTaskGuarded_(const std::string& name,
                                           const TaskCb& cb) {
  try {
    cb();
  } catch (const std::exception& e) {
    PODX_ERROR("Periodic task \"{}\" threw an exception: {}", name, e.what());
  }
}

LibEventTimerDriver::LibEventTimerDriver()
    : m_ev_base_(nullptr), m_ev_exit_event_(nullptr), m_ev_exit_fd_(-1) {
  m_ev_base_ = event_base_new();
  if (!m_ev_base_) {
    PODX_ERROR("Could not initialize libevent!");
    std::terminate();
  }

  {  // Exit Event
    if ((m_ev_exit_fd_ = eventfd(0, EFD_CLOEXEC)) < 0) {
      PODX_ERROR("Failed to init the eventfd!");
      std::terminate();
    }

    m_ev_exit_event_ = event_new(m_ev_base_, m_ev_exit_fd_,
                                 EV_PERSIST | EV_READ, EvExitEventCb_, this);
    if (!m_ev_exit_event_) {
      PODX_ERROR("Failed to create the exit event!");
      std::terminate();
    }

    if (event_add(m_ev_exit_event_, nullptr) < 0) {
      PODX_ERROR("Could not add the exit event to base!");
      std::terminate();
    }
  }
}

LibEventTimerDriver::~LibEventTimerDriver() {
  Stop();

  for (auto& task : m_tasks_) {
    if (task->ev) event_free(task->ev);
  }

  if (m_ev_exit_event_) event_free(m_ev_exit_event_);
  close(m_ev_exit_fd_);

  if (m_ev_base_) event_base_free(m_ev_base_);
}

void LibEventTimerDriver::AddPeriodicTask(std::string name,
                                          absl::Duration interval, TaskCb cb) {
  PODX_ASSERT(!m_running_, "Tasks must be added before Start().");

  auto task = std::make_unique<PeriodicTask>();
  task->name = std::move(name);
  task->interval = interval;
  task->cb = std::move(cb);

  m_tasks_.emplace_back(std::move(task));
}

PodxErr LibEventTimerDriver::Start() {
  if (m_running_) return PodxErr::kOk;

  for (auto& task : m_tasks_) {
    task->ev = event_new(m_ev_base_, -1, EV_PERSIST, EvOnTimerCb_, task.get());
    if (!task->ev) {
      PODX_ERROR("Failed to create the timer of periodic task \"{}\".",
                 task->name);
      return PodxErr::kGenericFailure;
    }

    timeval tv = absl::ToTimeval(task->interval);
    if (evtimer_add(task->ev, &tv) < 0) {
      PODX_ERROR("Could not add the timer of periodic task \"{}\" to base!",
                 task->name);
      return PodxErr::kGenericFailure;
    }

    PODX_DEBUG("Periodic task \"{}\" scheduled every {}.", task->name,
               absl::FormatDuration(task->interval));
  }

  m_running_ = true;
  m_ev_loop_thread_ =
      std::thread([this]() { event_base_dispatch(m_ev_base_); });

  return PodxErr::kOk;
}

void LibEventTimerDriver::Stop() {
  if (!m_running_.exchange(false)) return;

  PODX_TRACE("Triggering exit event...");
  eventfd_t u = 1;
  ssize_t s = eventfd_write(m_ev_exit_fd_, u);
  if (s < 0) {
    PODX_ERROR("Failed to write to the exit event fd: {}", strerror(errno));
  }

  if (m_ev_loop_thread_.joinable()) m_ev_loop_thread_.join();
}

void LibEventTimerDriver::EvOnTimerCb_(evutil_socket_t, short, void* arg) {
  auto* task = reinterpret_cast<PeriodicTask*>(arg);

  PODX_TRACE("Periodic task \"{}\" fired.", task->name);
  RunTaskGuarded_(task->name, task->cb);
}

void LibEventTimerDriver::EvExitEventCb_(evutil_socket_t efd, short events,
                                         void* user_data) {
  auto* this_ = reinterpret_cast<LibEventTimerDriver*>(user_data);

  PODX_TRACE("Exit event triggered. Stop event loop.");

  uint64_t u;
  ssize_t s;
  s = read(efd, &u, sizeof(uint64_t));
  if (s != sizeof(uint64_t)) {
    if (errno != EAGAIN) {
      PODX_ERROR("Failed to read exit_fd: errno {}, {}", errno,
                 strerror(errno));
    }
    return;
  }

  struct timeval delay = {0, 0};
  event_base_loopexit(this_->m_ev_base_, &delay);
}

void VirtualTimerDriver::AddPeriodicTask(std::string name,
                                         absl::Duration interval, TaskCb cb) {
  PeriodicTask task;
  task.name = std::move(name);
  task.interval = interval;
  task.cb = std::move(cb);
  task.next_fire = m_clock_->Now() + interval;

  m_tasks_.emplace_back(std::move(task));
}

PodxErr VirtualTimerDriver::Start() {
  absl::Time now = m_clock_->Now();
  for (auto& task : m_tasks_) task.next_fire = now + task.interval;

  m_running_ = true;
  return PodxErr::kOk;
}

uint32_t VirtualTimerDriver::Advance(absl::Duration d) {
  absl::Time target = m_clock_->Now() + d;
  uint32_t runs = 0;

  while (m_running_) {
    PeriodicTask* next = nullptr;
    for (auto& task : m_tasks_) {
      if (task.next_fire > target) continue;
      if (next == nullptr || task.next_fire < next->next_fire) next = &task;
    }
    if (next == nullptr) break;

    m_clock_->SetTime(next->next_fire);
    next->next_fire += next->interval;

    RunTaskGuarded_(next->name, next->cb);
    runs++;
  }

  m_clock_->SetTime(target);
  return runs;
}

}  // namespace PodCtld
