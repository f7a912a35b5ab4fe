#include "ClusterController.h"

#include "podx/String.h"

namespace PodCtld {

ClusterController::ClusterController(StateStoreInterface* store,
                                     ClockInterface* clock,
                                     const Config::ControllerConf& conf)
    : m_store_(store), m_clock_(clock), m_conf_(conf) {
  ClusterSettings settings;
  settings.strategy = m_conf_.DefaultStrategy;
  m_store_->Reset(settings);

  m_node_registry_ = std::make_unique<NodeRegistry>(m_store_, m_clock_);
  m_pod_registry_ = std::make_unique<PodRegistry>(m_store_, m_clock_,
                                                  m_conf_.LivenessWindow);
  m_scheduler_ = std::make_unique<PodScheduler>(m_store_);
  m_failure_detector_ = std::make_unique<FailureDetector>(
      m_store_, m_clock_, m_conf_.LivenessWindow);
  m_rescheduler_ = std::make_unique<Rescheduler>(
      m_store_, m_pod_registry_.get(), m_scheduler_.get());
  m_leader_elector_ = std::make_unique<LeaderElector>(m_store_);
  m_metrics_ = std::make_unique<MetricsAggregator>(m_store_);
}

PodxErr ClusterController::AddNode(const std::string& node_id,
                                   uint32_t total_cpu) {
  if (node_id.empty()) return PodxErr::kMissingField;
  return m_node_registry_->Register(node_id, total_cpu);
}

PodxErr ClusterController::ScaleUp(uint32_t count,
                                   std::list<std::string>* added_nodes) {
  if (count > kMaxScaleUpCount) {
    PODX_DEBUG("ScaleUp by {} node(s) rejected. At most {} per request.",
               count, kMaxScaleUpCount);
    return PodxErr::kInvalidParam;
  }

  auto state = m_store_->GetClusterStatePtr();

  std::list<std::string> added;
  uint32_t next_n = 1;
  for (uint32_t i = 0; i < count; i++) {
    std::string node_id = NextScaleUpNodeId_(*state, &next_n);
    PodxErr err = m_node_registry_->Register(node_id, m_conf_.ScaleUpNodeCpu);
    if (err != PodxErr::kOk) {
      PODX_ERROR("Failed to register scaled-up node {}: {}", node_id,
                 PodxErrStr(err));
      return err;
    }
    added.emplace_back(std::move(node_id));
  }

  if (!added.empty())
    PODX_INFO("Scaled up by {} node(s): {}", added.size(),
              util::HostNameListToStr(added));

  if (added_nodes) *added_nodes = std::move(added);
  return PodxErr::kOk;
}

PodxErr ClusterController::RemoveNode(const std::string& node_id,
                                      std::list<std::string>* evicted_pods) {
  if (node_id.empty()) return PodxErr::kMissingField;
  return m_node_registry_->Remove(node_id, evicted_pods);
}

PodxErr ClusterController::LaunchPod(const std::string& pod_id,
                                     uint32_t cpu_request,
                                     std::optional<PlacementStrategy> strategy,
                                     std::string* assigned_node,
                                     PlacementStrategy* used_strategy) {
  if (pod_id.empty()) return PodxErr::kMissingField;

  auto state = m_store_->GetClusterStatePtr();

  PodxErr err = m_pod_registry_->Create(pod_id, cpu_request);
  if (err != PodxErr::kOk) return err;

  PlacementStrategy used = strategy.value_or(state->settings.strategy);
  if (used_strategy) *used_strategy = used;
  std::optional<std::string> node_id =
      m_scheduler_->Place(pod_id, cpu_request, used);
  if (!node_id.has_value()) {
    PODX_INFO("Pod {} is pending: no single node fits {} cpu with {}.",
              pod_id, cpu_request, StrategyName(used));
    return PodxErr::kNoFeasibleNode;
  }

  PODX_INFO("Pod {} launched on node {} using {}.", pod_id, node_id.value(),
            StrategyName(used));

  if (assigned_node) *assigned_node = std::move(node_id.value());
  return PodxErr::kOk;
}

PodxErr ClusterController::Heartbeat(const std::string& node_id) {
  if (node_id.empty()) return PodxErr::kMissingField;
  return m_node_registry_->Heartbeat(node_id);
}

PodxErr ClusterController::FailNode(const std::string& node_id,
                                    std::list<std::string>* evicted_pods) {
  if (node_id.empty()) return PodxErr::kMissingField;
  return m_node_registry_->MarkUnhealthy(node_id, evicted_pods);
}

PodxErr ClusterController::RecoverNode(const std::string& node_id) {
  if (node_id.empty()) return PodxErr::kMissingField;
  return m_node_registry_->MarkHealthy(node_id);
}

PlacementStrategy ClusterController::SetStrategy(std::string_view name) {
  PlacementStrategy strategy = ParseStrategyOrDefault(name);

  auto state = m_store_->GetClusterStatePtr();
  if (state->settings.strategy != strategy) {
    PODX_INFO("Cluster strategy changed: {} -> {}",
              StrategyName(state->settings.strategy), StrategyName(strategy));
    state->settings.strategy = strategy;
  }

  return strategy;
}

PlacementStrategy ClusterController::GetStrategy() {
  auto state = m_store_->GetClusterStatePtr();
  return state->settings.strategy;
}

void ClusterController::RegisterPeriodicTasks(TimerDriverInterface* driver) {
  driver->AddPeriodicTask("failure-detection", m_conf_.FailureDetectInterval,
                          [this] { RunFailureDetection(); });
  driver->AddPeriodicTask("rescheduling", m_conf_.RescheduleInterval,
                          [this] { RunRescheduling(); });

  if (m_conf_.HeartbeatSimulation) {
    driver->AddPeriodicTask("heartbeat-simulation",
                            m_conf_.HeartbeatSimulationInterval,
                            [this] { RunHeartbeatSimulation(); });
  } else {
    PODX_INFO("Heartbeat simulation is disabled.");
  }
}

std::string ClusterController::NextScaleUpNodeId_(const ClusterState& state,
                                                  uint32_t* next_n) {
  for (;; (*next_n)++) {
    std::string node_id = fmt::format("{}{}", kScaleUpNodePrefix, *next_n);
    if (!state.nodes.Contains(node_id)) {
      (*next_n)++;
      return node_id;
    }
  }
}

}  // namespace PodCtld
