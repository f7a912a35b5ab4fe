#include "Rescheduler.h"

namespace PodCtld {

uint32_t Rescheduler::Sweep() {
  // Hold the state for the whole run. PodRegistry and PodScheduler lock it
  // again, which the recursive mutex allows.
  auto state = m_store_->GetClusterStatePtr();

  PlacementStrategy strategy = state->settings.strategy;
  auto pending = m_pod_registry_->ListPending();
  if (pending.empty()) return 0;

  uint32_t placed = 0;
  for (auto&& [pod_id, cpu_request] : pending) {
    std::optional<std::string> node_id =
        m_scheduler_->Place(pod_id, cpu_request, strategy);
    if (node_id.has_value()) {
      PODX_INFO("Rescheduled pod {} to node {} using {}", pod_id,
                node_id.value(), StrategyName(strategy));
      placed++;
    }
  }

  PODX_DEBUG("Reschedule run: {} of {} pending pod(s) placed.", placed,
             pending.size());
  return placed;
}

}  // namespace PodCtld
