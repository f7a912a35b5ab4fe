#include "PodxCtlClient.h"

#include <absl/time/time.h>
#include <spdlog/fmt/ranges.h>

namespace PodxCtl {

namespace {

std::string_view NodeStatusName(PodxGrpc::NodeStatus status) {
  return status == PodxGrpc::NodeStatus::Healthy ? "healthy" : "unhealthy";
}

std::string_view PodStatusName(PodxGrpc::PodStatus status) {
  return status == PodxGrpc::PodStatus::Running ? "running" : "pending";
}

std::string_view StrategyName(PodxGrpc::PlacementStrategy strategy) {
  switch (strategy) {
    case PodxGrpc::PlacementStrategy::FirstFit:
      return "first_fit";
    case PodxGrpc::PlacementStrategy::WorstFit:
      return "worst_fit";
    default:
      return "best_fit";
  }
}

}  // namespace

PodxErr PodxCtlClient::Init(const std::string& ctld_addr_port) {
  m_channel_ =
      grpc::CreateChannel(ctld_addr_port, grpc::InsecureChannelCredentials());

  m_stub_ = PodCtld::NewStub(m_channel_);
  return PodxErr::kOk;
}

PodxErr PodxCtlClient::RpcFailed_(const Status& status) {
  PODX_DEBUG("{}:{}\nPodCtld RPC failed", status.error_code(),
             status.error_message());
  fmt::print("Failed to reach podctld: {}\n", status.error_message());
  return PodxErr::kRpcFailure;
}

template <typename Reply>
PodxErr PodxCtlClient::ReplyErr_(const Reply& reply) {
  if (reply.ok()) return PodxErr::kOk;

  if (reply.err_code() == 0 ||
      reply.err_code() >= static_cast<uint32_t>(PodxErr::__ERR_SIZE))
    return PodxErr::kGenericFailure;
  return static_cast<PodxErr>(reply.err_code());
}

PodxErr PodxCtlClient::AddNode(const std::string& node_id, uint32_t cpu) {
  PodxGrpc::AddNodeRequest request;
  request.set_node_id(node_id);
  request.set_cpu(cpu);

  PodxGrpc::AddNodeReply reply;
  ClientContext context;
  Status status = m_stub_->AddNode(&context, request, &reply);
  if (!status.ok()) return RpcFailed_(status);

  if (reply.ok())
    fmt::print("Node {} added\n", node_id);
  else
    fmt::print("Failed to add node {}: {}\n", node_id, reply.reason());

  return ReplyErr_(reply);
}

PodxErr PodxCtlClient::ScaleUp(uint32_t count) {
  PodxGrpc::ScaleUpRequest request;
  request.set_count(count);

  PodxGrpc::ScaleUpReply reply;
  ClientContext context;
  Status status = m_stub_->ScaleUp(&context, request, &reply);
  if (!status.ok()) return RpcFailed_(status);

  if (reply.ok())
    fmt::print("Added {} node(s): {}\n", reply.added_nodes_size(),
               fmt::join(reply.added_nodes(), ", "));
  else
    fmt::print("Failed to scale up: {}\n", reply.reason());

  return ReplyErr_(reply);
}

PodxErr PodxCtlClient::RemoveNode(const std::string& node_id) {
  PodxGrpc::RemoveNodeRequest request;
  request.set_node_id(node_id);

  PodxGrpc::RemoveNodeReply reply;
  ClientContext context;
  Status status = m_stub_->RemoveNode(&context, request, &reply);
  if (!status.ok()) return RpcFailed_(status);

  if (reply.ok()) {
    fmt::print("Node {} removed\n", node_id);
    if (reply.evicted_pods_size() > 0)
      fmt::print("Evicted to pending: {}\n",
                 fmt::join(reply.evicted_pods(), ", "));
  } else {
    fmt::print("Failed to remove node {}: {}\n", node_id, reply.reason());
  }

  return ReplyErr_(reply);
}

PodxErr PodxCtlClient::LaunchPod(const std::string& pod_id, uint32_t cpu,
                                 const std::optional<std::string>& strategy) {
  PodxGrpc::LaunchPodRequest request;
  request.set_pod_id(pod_id);
  request.set_cpu(cpu);
  if (strategy.has_value()) request.set_strategy(strategy.value());

  PodxGrpc::LaunchPodReply reply;
  ClientContext context;
  Status status = m_stub_->LaunchPod(&context, request, &reply);
  if (!status.ok()) return RpcFailed_(status);

  std::string_view strategy_name = StrategyName(reply.strategy());

  if (reply.ok())
    fmt::print("Pod {} launched on Node {} using {}\n", pod_id,
               reply.assigned_node(), strategy_name);
  else if (static_cast<PodxErr>(reply.err_code()) == PodxErr::kNoFeasibleNode)
    fmt::print("{} with {}. Pod {} is pending.\n", reply.reason(),
               strategy_name, pod_id);
  else
    fmt::print("Failed to launch pod {}: {}\n", pod_id, reply.reason());

  return ReplyErr_(reply);
}

PodxErr PodxCtlClient::Heartbeat(const std::string& node_id) {
  PodxGrpc::HeartbeatRequest request;
  request.set_node_id(node_id);

  PodxGrpc::HeartbeatReply reply;
  ClientContext context;
  Status status = m_stub_->Heartbeat(&context, request, &reply);
  if (!status.ok()) return RpcFailed_(status);

  if (reply.ok())
    fmt::print("Heartbeat received\n");
  else
    fmt::print("Heartbeat of node {} rejected: {}\n", node_id, reply.reason());

  return ReplyErr_(reply);
}

PodxErr PodxCtlClient::FailNode(const std::string& node_id) {
  PodxGrpc::FailNodeRequest request;
  request.set_node_id(node_id);

  PodxGrpc::FailNodeReply reply;
  ClientContext context;
  Status status = m_stub_->FailNode(&context, request, &reply);
  if (!status.ok()) return RpcFailed_(status);

  if (reply.ok()) {
    fmt::print("Node {} marked as failed\n", node_id);
    if (reply.evicted_pods_size() > 0)
      fmt::print("Evicted to pending: {}\n",
                 fmt::join(reply.evicted_pods(), ", "));
  } else {
    fmt::print("Failed to fail node {}: {}\n", node_id, reply.reason());
  }

  return ReplyErr_(reply);
}

PodxErr PodxCtlClient::RecoverNode(const std::string& node_id) {
  PodxGrpc::RecoverNodeRequest request;
  request.set_node_id(node_id);

  PodxGrpc::RecoverNodeReply reply;
  ClientContext context;
  Status status = m_stub_->RecoverNode(&context, request, &reply);
  if (!status.ok()) return RpcFailed_(status);

  if (reply.ok())
    fmt::print("Node {} marked as healthy\n", node_id);
  else
    fmt::print("Failed to recover node {}: {}\n", node_id, reply.reason());

  return ReplyErr_(reply);
}

PodxErr PodxCtlClient::ListNodes() {
  PodxGrpc::ListNodesRequest request;
  PodxGrpc::ListNodesReply reply;
  ClientContext context;
  Status status = m_stub_->ListNodes(&context, request, &reply);
  if (!status.ok()) return RpcFailed_(status);

  fmt::print("{: <16}{: >6}{: >8}  {: <26}{: >10}\n", "NODE", "CPU", "AVAIL",
             "LAST HEARTBEAT", "STATUS");
  for (auto&& node : reply.node_list()) {
    absl::Time last_heartbeat =
        absl::FromUnixSeconds(node.last_heartbeat().seconds()) +
        absl::Nanoseconds(node.last_heartbeat().nanos());
    fmt::print("{: <16}{: >6}{: >8}  {: <26}{: >10}\n", node.node_id(),
               node.total_cpu(), node.avail_cpu(),
               absl::FormatTime("%Y-%m-%d %H:%M:%S", last_heartbeat,
                                absl::LocalTimeZone()),
               NodeStatusName(node.status()));
  }

  return PodxErr::kOk;
}

PodxErr PodxCtlClient::ListPods() {
  PodxGrpc::ListPodsRequest request;
  PodxGrpc::ListPodsReply reply;
  ClientContext context;
  Status status = m_stub_->ListPods(&context, request, &reply);
  if (!status.ok()) return RpcFailed_(status);

  fmt::print("{: <16}{: >6}  {: <16}{: >10}\n", "POD", "CPU", "NODE",
             "STATUS");
  for (auto&& pod : reply.pod_list()) {
    fmt::print("{: <16}{: >6}  {: <16}{: >10}\n", pod.pod_id(),
               pod.cpu_request(),
               pod.assigned_node().empty() ? "-" : pod.assigned_node(),
               PodStatusName(pod.status()));
  }

  return PodxErr::kOk;
}

PodxErr PodxCtlClient::GetLeader() {
  PodxGrpc::GetLeaderRequest request;
  PodxGrpc::GetLeaderReply reply;
  ClientContext context;
  Status status = m_stub_->GetLeader(&context, request, &reply);
  if (!status.ok()) return RpcFailed_(status);

  fmt::print("Leader: {}\n", reply.leader());
  return PodxErr::kOk;
}

PodxErr PodxCtlClient::SetStrategy(const std::string& strategy) {
  PodxGrpc::SetStrategyRequest request;
  request.set_strategy(strategy);

  PodxGrpc::SetStrategyReply reply;
  ClientContext context;
  Status status = m_stub_->SetStrategy(&context, request, &reply);
  if (!status.ok()) return RpcFailed_(status);

  fmt::print("Strategy set to {}\n", reply.strategy_name());
  return PodxErr::kOk;
}

PodxErr PodxCtlClient::GetStrategy() {
  PodxGrpc::GetStrategyRequest request;
  PodxGrpc::GetStrategyReply reply;
  ClientContext context;
  Status status = m_stub_->GetStrategy(&context, request, &reply);
  if (!status.ok()) return RpcFailed_(status);

  fmt::print("Strategy: {}\n", reply.strategy_name());
  return PodxErr::kOk;
}

PodxErr PodxCtlClient::GetMetrics() {
  PodxGrpc::GetMetricsRequest request;
  PodxGrpc::GetMetricsReply reply;
  ClientContext context;
  Status status = m_stub_->GetMetrics(&context, request, &reply);
  if (!status.ok()) return RpcFailed_(status);

  fmt::print("Healthy nodes: {} / {}\n", reply.healthy_node_count(),
             reply.node_count());
  fmt::print("Free cpu:      {}\n", reply.free_cpu());
  fmt::print("Running pods:  {}\n", reply.running_pod_count());
  fmt::print("Pending pods:  {}\n", reply.pending_pod_count());

  return PodxErr::kOk;
}

}  // namespace PodxCtl
