#include "PodScheduler.h"

namespace PodCtld {

std::optional<std::string> FirstFit::NodeSelect(
    const RecordTable<NodeRecord>& nodes, uint32_t cpu_request) {
  std::optional<std::string> selected;

  nodes.Scan([&](const NodeRecord& node) {
    if (selected.has_value()) return;
    if (node.status == NodeStatus::kHealthy && node.avail_cpu >= cpu_request)
      selected = node.id;
  });

  return selected;
}

std::optional<std::string> BestFit::NodeSelect(
    const RecordTable<NodeRecord>& nodes, uint32_t cpu_request) {
  const NodeRecord* best = nullptr;

  nodes.Scan([&](const NodeRecord& node) {
    if (node.status != NodeStatus::kHealthy || node.avail_cpu < cpu_request)
      return;
    if (best == nullptr || node.avail_cpu < best->avail_cpu) best = &node;
  });

  if (best == nullptr) return std::nullopt;
  return best->id;
}

std::optional<std::string> WorstFit::NodeSelect(
    const RecordTable<NodeRecord>& nodes, uint32_t cpu_request) {
  const NodeRecord* worst = nullptr;

  nodes.Scan([&](const NodeRecord& node) {
    if (node.status != NodeStatus::kHealthy || node.avail_cpu < cpu_request)
      return;
    // avail_cpu >= cpu_request here, so the leftover doesn't wrap around.
    if (worst == nullptr ||
        node.avail_cpu - cpu_request > worst->avail_cpu - cpu_request)
      worst = &node;
  });

  if (worst == nullptr) return std::nullopt;
  return worst->id;
}

PodScheduler::PodScheduler(StateStoreInterface* store) : m_store_(store) {
  m_algos_[static_cast<size_t>(PlacementStrategy::kFirstFit)] =
      std::make_unique<FirstFit>();
  m_algos_[static_cast<size_t>(PlacementStrategy::kBestFit)] =
      std::make_unique<BestFit>();
  m_algos_[static_cast<size_t>(PlacementStrategy::kWorstFit)] =
      std::make_unique<WorstFit>();
}

std::optional<std::string> PodScheduler::Place(const std::string& pod_id,
                                               uint32_t cpu_request,
                                               PlacementStrategy strategy) {
  auto state = m_store_->GetClusterStatePtr();

  PodRecord* pod = state->pods.Get(pod_id);
  if (pod == nullptr) {
    PODX_ERROR("Placing unknown pod {}.", pod_id);
    return std::nullopt;
  }
  if (pod->assigned_node.has_value()) {
    PODX_ERROR("Pod {} is already running on node {}.", pod_id,
               pod->assigned_node.value());
    return std::nullopt;
  }
  if (pod->cpu_request != cpu_request) {
    PODX_ERROR("Pod {} requests {} cpu, but {} cpu was asked to be placed.",
               pod_id, pod->cpu_request, cpu_request);
    return std::nullopt;
  }

  std::optional<std::string> node_id =
      GetNodeSelectionAlgo(strategy)->NodeSelect(state->nodes, cpu_request);
  if (!node_id.has_value()) {
    PODX_TRACE("No healthy node fits pod {} ({} cpu) under {}.", pod_id,
               cpu_request, StrategyName(strategy));
    return std::nullopt;
  }

  NodeRecord* node = state->nodes.Get(node_id.value());
  PODX_ASSERT(node != nullptr && node->avail_cpu >= cpu_request,
              "The selected node must exist and fit the pod.");

  node->avail_cpu -= cpu_request;
  pod->assigned_node = node_id;
  pod->status = PodStatus::kRunning;

  PODX_DEBUG("Pod {} placed on node {} using {}. Node cpu left: {}", pod_id,
             node->id, StrategyName(strategy), node->avail_cpu);

  return node_id;
}

}  // namespace PodCtld
