#pragma once

#include <absl/time/time.h>  // NOLINT(modernize-deprecated-headers)

#include <cstdint>
#include <list>
#include <optional>
#include <string>
#include <string_view>

#include "podx/PublicHeader.h"

namespace PodCtld {

constexpr int64_t kDefaultLivenessWindowSec = 30;
constexpr int64_t kDefaultFailureDetectIntervalSec = 10;
constexpr int64_t kDefaultRescheduleIntervalSec = 15;
constexpr int64_t kDefaultHeartbeatSimulationIntervalSec = 5;
constexpr uint32_t kDefaultScaleUpNodeCpu = 4;

// Upper bound of the node count of one ScaleUp request.
constexpr uint32_t kMaxScaleUpCount = 1024;

// Returned by leader resolution when there is no healthy node.
inline const char* kNoLeader = "none";

// Prefix of the node ids generated by ScaleUp.
inline const char* kScaleUpNodePrefix = "node-";

enum class NodeStatus : uint8_t { kHealthy = 0, kUnhealthy };

enum class PodStatus : uint8_t { kPending = 0, kRunning };

enum class PlacementStrategy : uint8_t { kFirstFit = 0, kBestFit, kWorstFit };

constexpr PlacementStrategy kDefaultStrategy = PlacementStrategy::kBestFit;

std::string_view NodeStatusStr(NodeStatus status);

std::string_view PodStatusStr(PodStatus status);

std::string_view StrategyName(PlacementStrategy strategy);

/**
 * @return false if `name` is not one of first_fit, best_fit or worst_fit.
 * Matching ignores case and surrounding whitespace.
 */
bool TryParseStrategy(std::string_view name, PlacementStrategy* strategy);

// Unrecognized names fall back to kDefaultStrategy.
PlacementStrategy ParseStrategyOrDefault(std::string_view name);

/**
 * A worker node. Only CPU is modeled.
 * Invariant: avail_cpu == total_cpu - sum of cpu_request of the pods whose
 * assigned_node is this node.
 */
struct NodeRecord {
  std::string id;
  uint64_t seq{0};  // Registration order. Set by the store.

  uint32_t total_cpu{0};
  uint32_t avail_cpu{0};

  absl::Time last_heartbeat;
  NodeStatus status{NodeStatus::kHealthy};
};

/**
 * A workload unit.
 * Invariant: status == kRunning <=> assigned_node has a value.
 */
struct PodRecord {
  std::string id;
  uint64_t seq{0};  // Creation order. Set by the store.

  uint32_t cpu_request{0};

  std::optional<std::string> assigned_node;
  PodStatus status{PodStatus::kPending};
};

struct ClusterSettings {
  PlacementStrategy strategy{kDefaultStrategy};

  // Sticky. Re-elected only when the recorded leader is gone or unhealthy.
  std::optional<std::string> leader;
};

struct ClusterMetrics {
  uint32_t healthy_node_count{0};
  uint64_t free_cpu{0};  // Sum of avail_cpu over healthy nodes.
  uint32_t running_pod_count{0};

  uint32_t node_count{0};
  uint32_t pending_pod_count{0};
};

struct Config {
  struct Node {
    uint32_t cpu;
  };

  struct PodCtldListenConf {
    std::string PodCtldListenAddr;
    std::string PodCtldListenPort;
  };

  struct ControllerConf {
    PlacementStrategy DefaultStrategy{kDefaultStrategy};

    absl::Duration LivenessWindow{absl::Seconds(kDefaultLivenessWindowSec)};
    absl::Duration FailureDetectInterval{
        absl::Seconds(kDefaultFailureDetectIntervalSec)};
    absl::Duration RescheduleInterval{
        absl::Seconds(kDefaultRescheduleIntervalSec)};

    bool HeartbeatSimulation{true};
    absl::Duration HeartbeatSimulationInterval{
        absl::Seconds(kDefaultHeartbeatSimulationIntervalSec)};

    uint32_t ScaleUpNodeCpu{kDefaultScaleUpNodeCpu};
  };

  PodCtldListenConf ListenConf;
  ControllerConf CtlConf;

  std::string PodCtldDebugLevel{"info"};
  std::string PodCtldLogFile{"/tmp/podctld/podctld.log"};
  bool PodCtldForeground{false};

  // Registered in this order at startup.
  std::list<std::pair<std::string /*node id*/, Node>> Nodes;
};

}  // namespace PodCtld

inline PodCtld::Config g_config;
