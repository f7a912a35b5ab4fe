#pragma once

#include <absl/time/clock.h>
#include <absl/time/time.h>

#include "podx/Lock.h"

namespace PodCtld {

/**
 * Source of "now" for every timestamp the control plane records or compares.
 */
class ClockInterface {
 public:
  virtual ~ClockInterface() = default;

  virtual absl::Time Now() = 0;

 protected:
  ClockInterface() = default;
};

class SystemClock final : public ClockInterface {
 public:
  absl::Time Now() override { return absl::Now(); }
};

/**
 * A clock that only moves when told to. Used with VirtualTimerDriver.
 */
class ManualClock final : public ClockInterface {
 public:
  explicit ManualClock(absl::Time start = absl::UnixEpoch()) : m_now_(start) {}

  absl::Time Now() override {
    util::lock_guard guard(m_mtx_);
    return m_now_;
  }

  void Advance(absl::Duration d) {
    util::lock_guard guard(m_mtx_);
    m_now_ += d;
  }

  void SetTime(absl::Time t) {
    util::lock_guard guard(m_mtx_);
    m_now_ = t;
  }

 private:
  absl::Time m_now_;
  util::mutex m_mtx_;
};

}  // namespace PodCtld
