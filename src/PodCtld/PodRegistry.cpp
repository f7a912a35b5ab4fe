#include "PodRegistry.h"

namespace PodCtld {

PodxErr PodRegistry::Create(const std::string& pod_id, uint32_t cpu_request) {
  auto state = m_store_->GetClusterStatePtr();

  if (state->pods.Contains(pod_id)) {
    PODX_DEBUG("Pod {} already exists.", pod_id);
    return PodxErr::kDuplicatePod;
  }

  absl::Time now = m_clock_->Now();
  uint64_t live_avail_cpu = 0;
  state->nodes.Scan([&](const NodeRecord& node) {
    if (now - node.last_heartbeat <= m_liveness_window_)
      live_avail_cpu += node.avail_cpu;
  });

  if (live_avail_cpu < cpu_request) {
    PODX_DEBUG(
        "Pod {} rejected by admission: requests {} cpu, {} cpu available "
        "on live nodes.",
        pod_id, cpu_request, live_avail_cpu);
    return PodxErr::kInsufficientClusterCapacity;
  }

  PodRecord pod;
  pod.id = pod_id;
  pod.cpu_request = cpu_request;
  pod.status = PodStatus::kPending;
  state->pods.Put(std::move(pod));

  PODX_DEBUG("Pod {} ({} cpu) admitted as pending.", pod_id, cpu_request);
  return PodxErr::kOk;
}

bool PodRegistry::Get(const std::string& pod_id, PodRecord* pod) {
  auto state = m_store_->GetClusterStatePtr();

  const PodRecord* record = state->pods.Get(pod_id);
  if (record == nullptr) return false;

  *pod = *record;
  return true;
}

std::vector<PodRecord> PodRegistry::List() {
  auto state = m_store_->GetClusterStatePtr();

  std::vector<PodRecord> pods;
  pods.reserve(state->pods.Size());
  state->pods.Scan([&](const PodRecord& pod) { pods.emplace_back(pod); });

  return pods;
}

std::vector<std::pair<std::string, uint32_t>> PodRegistry::ListPending() {
  auto state = m_store_->GetClusterStatePtr();

  std::vector<std::pair<std::string, uint32_t>> pending;
  state->pods.Scan([&](const PodRecord& pod) {
    if (!pod.assigned_node.has_value())
      pending.emplace_back(pod.id, pod.cpu_request);
  });

  return pending;
}

}  // namespace PodCtld
