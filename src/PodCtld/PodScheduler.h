#pragma once

#include <array>
#include <memory>
#include <optional>
#include <string>

#include "CtldPublicDefs.h"
#include "StateStore.h"

namespace PodCtld {

class INodeSelectionAlgo {
 public:
  virtual ~INodeSelectionAlgo() = default;

  /**
   * Pick a node for a pod requesting `cpu_request` cpu.
   * Note: During this function call, the cluster state is locked. Only
   * healthy nodes may be returned, and the caller is responsible for the
   * deduction.
   * @param[in] nodes visited in registry order. Ties go to the node visited
   * first.
   * @return the id of the selected node, or nullopt if no healthy node has
   * enough cpu available.
   */
  virtual std::optional<std::string> NodeSelect(
      const RecordTable<NodeRecord>& nodes, uint32_t cpu_request) = 0;
};

// The first healthy node that fits.
class FirstFit : public INodeSelectionAlgo {
 public:
  std::optional<std::string> NodeSelect(const RecordTable<NodeRecord>& nodes,
                                        uint32_t cpu_request) override;
};

// The healthy node that fits with the least cpu left over.
class BestFit : public INodeSelectionAlgo {
 public:
  std::optional<std::string> NodeSelect(const RecordTable<NodeRecord>& nodes,
                                        uint32_t cpu_request) override;
};

// The healthy node that fits with the most cpu left over.
class WorstFit : public INodeSelectionAlgo {
 public:
  std::optional<std::string> NodeSelect(const RecordTable<NodeRecord>& nodes,
                                        uint32_t cpu_request) override;
};

class PodScheduler {
 public:
  explicit PodScheduler(StateStoreInterface* store);

  /**
   * Select a node for a pending pod and bind the pod to it. Selection,
   * deduction of the node's avail_cpu and the pod's transition to running
   * happen in one critical section.
   * @return the selected node id. nullopt if no healthy node fits, in which
   * case the pod is left untouched. Pods that are unknown, already running,
   * or whose recorded request differs from `cpu_request` are not placed.
   */
  std::optional<std::string> Place(const std::string& pod_id,
                                   uint32_t cpu_request,
                                   PlacementStrategy strategy);

  INodeSelectionAlgo* GetNodeSelectionAlgo(PlacementStrategy strategy) {
    return m_algos_[static_cast<size_t>(strategy)].get();
  }

 private:
  StateStoreInterface* m_store_;

  // Indexed by PlacementStrategy.
  std::array<std::unique_ptr<INodeSelectionAlgo>, 3> m_algos_;
};

}  // namespace PodCtld
