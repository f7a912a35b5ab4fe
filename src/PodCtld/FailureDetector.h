#pragma once

#include <list>
#include <string>

#include "Clock.h"
#include "CtldPublicDefs.h"
#include "StateStore.h"

namespace PodCtld {

/**
 * Turns node silence into rescheduling eligibility. Meant to be run
 * periodically.
 */
class FailureDetector {
 public:
  FailureDetector(StateStoreInterface* store, ClockInterface* clock,
                  absl::Duration liveness_window)
      : m_store_(store), m_clock_(clock), m_liveness_window_(liveness_window) {}

  /**
   * Mark every healthy node whose last heartbeat is older than the liveness
   * window as unhealthy and evict its pods, all in one critical section.
   * @return the ids of the nodes that were marked unhealthy.
   */
  std::list<std::string> Sweep();

 private:
  StateStoreInterface* m_store_;
  ClockInterface* m_clock_;

  absl::Duration m_liveness_window_;
};

}  // namespace PodCtld
