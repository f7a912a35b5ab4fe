#pragma once

#include "PodRegistry.h"
#include "PodScheduler.h"
#include "StateStore.h"

namespace PodCtld {

/**
 * The only retry mechanism for pending pods. Every run tries all of them
 * under the current cluster strategy; there is no backoff and no limit on
 * attempts.
 */
class Rescheduler {
 public:
  Rescheduler(StateStoreInterface* store, PodRegistry* pod_registry,
              PodScheduler* scheduler)
      : m_store_(store),
        m_pod_registry_(pod_registry),
        m_scheduler_(scheduler) {}

  /**
   * @return the number of pods that were placed in this run.
   */
  uint32_t Sweep();

 private:
  StateStoreInterface* m_store_;
  PodRegistry* m_pod_registry_;
  PodScheduler* m_scheduler_;
};

}  // namespace PodCtld
