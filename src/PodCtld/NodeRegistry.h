#pragma once

#include <list>
#include <string>
#include <vector>

#include "Clock.h"
#include "CtldPublicDefs.h"
#include "StateStore.h"

namespace PodCtld {

/**
 * CRUD over the node table. All public methods are thread-safe.
 */
class NodeRegistry {
 public:
  NodeRegistry(StateStoreInterface* store, ClockInterface* clock)
      : m_store_(store), m_clock_(clock) {}

  /**
   * Create a healthy node with all of its cpu available.
   * @return kDuplicateNode if the id is taken.
   */
  PodxErr Register(const std::string& node_id, uint32_t total_cpu);

  /**
   * Delete a node. The pods running on it are evicted in the same critical
   * section, and the node stops being the leader if it was.
   * @param[out] evicted_pods optional.
   */
  PodxErr Remove(const std::string& node_id,
                 std::list<std::string>* evicted_pods = nullptr);

  /**
   * Refresh the heartbeat of a node and mark it healthy. A heartbeat brings
   * an unhealthy node back.
   */
  PodxErr Heartbeat(const std::string& node_id);

  /**
   * Manual failure. The pods running on the node are evicted.
   * @param[out] evicted_pods optional.
   */
  PodxErr MarkUnhealthy(const std::string& node_id,
                        std::list<std::string>* evicted_pods = nullptr);

  // Manual recovery. Also refreshes the heartbeat to prevent an immediate
  // timeout.
  PodxErr MarkHealthy(const std::string& node_id);

  // Refresh the heartbeat of every node without touching its status.
  void RefreshAllHeartbeats();

  bool Get(const std::string& node_id, NodeRecord* node);

  // All nodes in registration order.
  std::vector<NodeRecord> List();

 private:
  StateStoreInterface* m_store_;
  ClockInterface* m_clock_;
};

}  // namespace PodCtld
