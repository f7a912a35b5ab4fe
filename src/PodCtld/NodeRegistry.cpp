#include "NodeRegistry.h"

#include <spdlog/fmt/ranges.h>

namespace PodCtld {

PodxErr NodeRegistry::Register(const std::string& node_id,
                               uint32_t total_cpu) {
  auto state = m_store_->GetClusterStatePtr();

  if (state->nodes.Contains(node_id)) {
    PODX_DEBUG("Node {} already exists. Registration rejected.", node_id);
    return PodxErr::kDuplicateNode;
  }

  NodeRecord node;
  node.id = node_id;
  node.total_cpu = total_cpu;
  node.avail_cpu = total_cpu;
  node.last_heartbeat = m_clock_->Now();
  node.status = NodeStatus::kHealthy;
  state->nodes.Put(std::move(node));

  PODX_INFO("Node {} added with {} cpu.", node_id, total_cpu);
  return PodxErr::kOk;
}

PodxErr NodeRegistry::Remove(const std::string& node_id,
                             std::list<std::string>* evicted_pods) {
  auto state = m_store_->GetClusterStatePtr();

  if (!state->nodes.Contains(node_id)) return PodxErr::kNodeNotFound;

  std::list<std::string> evicted = state->EvictPodsOnNode(node_id);
  state->nodes.Erase(node_id);

  if (state->settings.leader == node_id) state->settings.leader.reset();

  if (evicted.empty())
    PODX_INFO("Node {} removed.", node_id);
  else
    PODX_WARN("Node {} removed. Pods evicted to pending: {}", node_id,
              fmt::join(evicted, ", "));

  if (evicted_pods) *evicted_pods = std::move(evicted);
  return PodxErr::kOk;
}

PodxErr NodeRegistry::Heartbeat(const std::string& node_id) {
  auto state = m_store_->GetClusterStatePtr();

  NodeRecord* node = state->nodes.Get(node_id);
  if (node == nullptr) return PodxErr::kNodeNotFound;

  node->last_heartbeat = m_clock_->Now();
  if (node->status != NodeStatus::kHealthy) {
    node->status = NodeStatus::kHealthy;
    PODX_INFO("Node {} is healthy again after a heartbeat.", node_id);
  }

  return PodxErr::kOk;
}

PodxErr NodeRegistry::MarkUnhealthy(const std::string& node_id,
                                    std::list<std::string>* evicted_pods) {
  auto state = m_store_->GetClusterStatePtr();

  NodeRecord* node = state->nodes.Get(node_id);
  if (node == nullptr) return PodxErr::kNodeNotFound;

  node->status = NodeStatus::kUnhealthy;
  std::list<std::string> evicted = state->EvictPodsOnNode(node_id);

  PODX_WARN("Node {} has been manually marked as failed. {} pod(s) evicted.",
            node_id, evicted.size());

  if (evicted_pods) *evicted_pods = std::move(evicted);
  return PodxErr::kOk;
}

PodxErr NodeRegistry::MarkHealthy(const std::string& node_id) {
  auto state = m_store_->GetClusterStatePtr();

  NodeRecord* node = state->nodes.Get(node_id);
  if (node == nullptr) return PodxErr::kNodeNotFound;

  node->status = NodeStatus::kHealthy;
  node->last_heartbeat = m_clock_->Now();

  PODX_INFO("Node {} has been manually recovered.", node_id);
  return PodxErr::kOk;
}

void NodeRegistry::RefreshAllHeartbeats() {
  auto state = m_store_->GetClusterStatePtr();

  absl::Time now = m_clock_->Now();
  state->nodes.Scan([now](NodeRecord& node) { node.last_heartbeat = now; });

  PODX_TRACE("Heartbeats of {} node(s) refreshed.", state->nodes.Size());
}

bool NodeRegistry::Get(const std::string& node_id, NodeRecord* node) {
  auto state = m_store_->GetClusterStatePtr();

  const NodeRecord* record = state->nodes.Get(node_id);
  if (record == nullptr) return false;

  *node = *record;
  return true;
}

std::vector<NodeRecord> NodeRegistry::List() {
  auto state = m_store_->GetClusterStatePtr();

  std::vector<NodeRecord> nodes;
  nodes.reserve(state->nodes.Size());
  state->nodes.Scan([&](const NodeRecord& node) { nodes.emplace_back(node); });

  return nodes;
}

}  // namespace PodCtld
