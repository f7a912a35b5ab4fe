#include "MetricsAggregator.h"

namespace PodCtld {

ClusterMetrics MetricsAggregator::Snapshot() {
  auto state = m_store_->GetClusterStatePtr();

  ClusterMetrics metrics;

  state->nodes.Scan([&](const NodeRecord& node) {
    metrics.node_count++;
    if (node.status != NodeStatus::kHealthy) return;
    metrics.healthy_node_count++;
    metrics.free_cpu += node.avail_cpu;
  });

  state->pods.Scan([&](const PodRecord& pod) {
    if (pod.status == PodStatus::kRunning)
      metrics.running_pod_count++;
    else
      metrics.pending_pod_count++;
  });

  return metrics;
}

}  // namespace PodCtld
