#pragma once

#include <string>
#include <utility>
#include <vector>

#include "Clock.h"
#include "CtldPublicDefs.h"
#include "StateStore.h"

namespace PodCtld {

class PodRegistry {
 public:
  PodRegistry(StateStoreInterface* store, ClockInterface* clock,
              absl::Duration liveness_window)
      : m_store_(store), m_clock_(clock), m_liveness_window_(liveness_window) {}

  /**
   * Admit a new pod in pending state.
   * The admission check compares cpu_request against the sum of avail_cpu of
   * every node that sent a heartbeat within the liveness window, whatever
   * its recorded status is. Passing it doesn't mean any single node can host
   * the pod.
   * @return kDuplicatePod if the id is taken, kInsufficientClusterCapacity if
   * the admission check fails. Nothing is modified on failure.
   */
  PodxErr Create(const std::string& pod_id, uint32_t cpu_request);

  bool Get(const std::string& pod_id, PodRecord* pod);

  // All pods in creation order.
  std::vector<PodRecord> List();

  // <pod id, cpu request> of every pod without an assigned node, in creation
  // order.
  std::vector<std::pair<std::string, uint32_t>> ListPending();

 private:
  StateStoreInterface* m_store_;
  ClockInterface* m_clock_;

  absl::Duration m_liveness_window_;
};

}  // namespace PodCtld
