#include "LeaderElector.h"

namespace PodCtld {

std::string LeaderElector::ResolveLeader() {
  auto state = m_store_->GetClusterStatePtr();

  auto& leader = state->settings.leader;
  if (leader.has_value()) {
    const NodeRecord* node = state->nodes.Get(leader.value());
    if (node != nullptr && node->status == NodeStatus::kHealthy)
      return leader.value();
  }

  std::vector<NodeRecord> snapshot;
  snapshot.reserve(state->nodes.Size());
  state->nodes.Scan(
      [&](const NodeRecord& node) { snapshot.emplace_back(node); });

  std::optional<std::string> elected = ElectFrom(snapshot);
  if (elected != leader) {
    PODX_INFO("Leader changed: {} -> {}", leader.value_or(kNoLeader),
              elected.value_or(kNoLeader));
  }
  leader = elected;

  return elected.value_or(kNoLeader);
}

std::optional<std::string> LeaderElector::ElectFrom(
    const std::vector<NodeRecord>& nodes) {
  const NodeRecord* smallest = nullptr;
  for (const auto& node : nodes) {
    if (node.status != NodeStatus::kHealthy) continue;
    if (smallest == nullptr || node.id < smallest->id) smallest = &node;
  }

  if (smallest == nullptr) return std::nullopt;
  return smallest->id;
}

}  // namespace PodCtld
