#include "FailureDetector.h"

namespace PodCtld {

std::list<std::string> FailureDetector::Sweep() {
  auto state = m_store_->GetClusterStatePtr();

  absl::Time now = m_clock_->Now();
  std::list<std::string> failed_nodes;

  state->nodes.Scan([&](NodeRecord& node) {
    if (node.status != NodeStatus::kHealthy) return;
    if (now - node.last_heartbeat <= m_liveness_window_) return;

    node.status = NodeStatus::kUnhealthy;
    failed_nodes.emplace_back(node.id);
  });

  // Eviction walks the pod table, so it is done outside the node scan.
  for (const auto& node_id : failed_nodes) {
    std::list<std::string> evicted = state->EvictPodsOnNode(node_id);
    PODX_WARN("Node {} failed! No heartbeat for over {}s. {} pod(s) evicted.",
              node_id, absl::ToInt64Seconds(m_liveness_window_),
              evicted.size());
  }

  return failed_nodes;
}

}  // namespace PodCtld
