#include "StateStore.h"

namespace PodCtld {

std::list<std::string> ClusterState::EvictPodsOnNode(
    const std::string& node_id) {
  std::list<std::string> evicted;
  NodeRecord* node = nodes.Get(node_id);

  pods.Scan([&](PodRecord& pod) {
    if (!pod.assigned_node.has_value() || pod.assigned_node.value() != node_id)
      return;

    pod.assigned_node.reset();
    pod.status = PodStatus::kPending;
    if (node) node->avail_cpu += pod.cpu_request;

    evicted.emplace_back(pod.id);
  });

  if (node) {
    PODX_ASSERT(node->avail_cpu == node->total_cpu,
                "A node without pods must have all its cpu available.");
  }

  return evicted;
}

StateStoreInterface::ClusterStatePtr
StateStoreInMemoryImpl::GetClusterStatePtr() {
  m_mtx_.lock();
  return ClusterStatePtr{&m_state_, &m_mtx_};
}

void StateStoreInMemoryImpl::Reset(const ClusterSettings& settings) {
  LockGuard guard(m_mtx_);

  m_state_.nodes.Clear();
  m_state_.pods.Clear();
  m_state_.settings = settings;
}

}  // namespace PodCtld
