#pragma once

#include <list>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "Clock.h"
#include "CtldPublicDefs.h"
#include "FailureDetector.h"
#include "LeaderElector.h"
#include "MetricsAggregator.h"
#include "NodeRegistry.h"
#include "PodRegistry.h"
#include "PodScheduler.h"
#include "Rescheduler.h"
#include "StateStore.h"
#include "TimerDriver.h"

namespace PodCtld {

/**
 * The operations exposed to clients, on top of the registries, the scheduler
 * and the control loops. Thread-safe.
 */
class ClusterController {
 public:
  /**
   * The store is reset with conf.DefaultStrategy as the cluster strategy.
   */
  ClusterController(StateStoreInterface* store, ClockInterface* clock,
                    const Config::ControllerConf& conf);

  PodxErr AddNode(const std::string& node_id, uint32_t total_cpu);

  /**
   * Add `count` nodes with ScaleUpNodeCpu cpu each. The ids are "node-<n>"
   * with the smallest unused n starting from 1.
   * @param[out] added_nodes optional.
   * @return kInvalidParam if count exceeds kMaxScaleUpCount. No node is added.
   */
  PodxErr ScaleUp(uint32_t count,
                  std::list<std::string>* added_nodes = nullptr);

  PodxErr RemoveNode(const std::string& node_id,
                     std::list<std::string>* evicted_pods = nullptr);

  /**
   * Admit a pod and try to place it right away. Admission and placement are
   * done under one critical section.
   * @param strategy if absent, the cluster strategy is used.
   * @param[out] assigned_node set when the pod is placed.
   * @param[out] used_strategy optional. Set to the strategy placement ran
   * with once the pod is admitted.
   * @return kNoFeasibleNode if the pod was admitted but no single node fits
   * it. The pod stays pending and is retried by the rescheduler.
   */
  PodxErr LaunchPod(const std::string& pod_id, uint32_t cpu_request,
                    std::optional<PlacementStrategy> strategy,
                    std::string* assigned_node,
                    PlacementStrategy* used_strategy = nullptr);

  PodxErr Heartbeat(const std::string& node_id);

  PodxErr FailNode(const std::string& node_id,
                   std::list<std::string>* evicted_pods = nullptr);

  PodxErr RecoverNode(const std::string& node_id);

  std::vector<NodeRecord> ListNodes() { return m_node_registry_->List(); }

  std::vector<PodRecord> ListPods() { return m_pod_registry_->List(); }

  std::string GetLeader() { return m_leader_elector_->ResolveLeader(); }

  // An unrecognized name sets the default strategy.
  PlacementStrategy SetStrategy(std::string_view name);

  PlacementStrategy GetStrategy();

  ClusterMetrics GetMetrics() { return m_metrics_->Snapshot(); }

  // Control loop entry points. Exposed for the timer driver and tests.
  std::list<std::string> RunFailureDetection() {
    return m_failure_detector_->Sweep();
  }
  uint32_t RunRescheduling() { return m_rescheduler_->Sweep(); }
  void RunHeartbeatSimulation() { m_node_registry_->RefreshAllHeartbeats(); }

  /**
   * Register failure detection, rescheduling and, if enabled, the heartbeat
   * simulator on `driver` with the configured intervals.
   */
  void RegisterPeriodicTasks(TimerDriverInterface* driver);

 private:
  // The first unused id from "node-<*next_n>" on. *next_n moves past it.
  std::string NextScaleUpNodeId_(const ClusterState& state, uint32_t* next_n);

  StateStoreInterface* m_store_;
  ClockInterface* m_clock_;
  Config::ControllerConf m_conf_;

  std::unique_ptr<NodeRegistry> m_node_registry_;
  std::unique_ptr<PodRegistry> m_pod_registry_;
  std::unique_ptr<PodScheduler> m_scheduler_;
  std::unique_ptr<FailureDetector> m_failure_detector_;
  std::unique_ptr<Rescheduler> m_rescheduler_;
  std::unique_ptr<LeaderElector> m_leader_elector_;
  std::unique_ptr<MetricsAggregator> m_metrics_;
};

}  // namespace PodCtld

inline std::unique_ptr<PodCtld::ClusterController> g_cluster_controller;
