#include "CtldGrpcServer.h"

#include <csignal>

namespace PodCtld {

namespace {

PodxGrpc::NodeStatus ToGrpcNodeStatus(NodeStatus status) {
  return status == NodeStatus::kHealthy ? PodxGrpc::NodeStatus::Healthy
                                        : PodxGrpc::NodeStatus::Unhealthy;
}

PodxGrpc::PodStatus ToGrpcPodStatus(PodStatus status) {
  return status == PodStatus::kRunning ? PodxGrpc::PodStatus::Running
                                       : PodxGrpc::PodStatus::Pending;
}

PodxGrpc::PlacementStrategy ToGrpcStrategy(PlacementStrategy strategy) {
  switch (strategy) {
    case PlacementStrategy::kFirstFit:
      return PodxGrpc::PlacementStrategy::FirstFit;
    case PlacementStrategy::kWorstFit:
      return PodxGrpc::PlacementStrategy::WorstFit;
    case PlacementStrategy::kBestFit:
    default:
      return PodxGrpc::PlacementStrategy::BestFit;
  }
}

void SetTimestamp(absl::Time t, google::protobuf::Timestamp *timestamp) {
  int64_t secs = absl::ToUnixSeconds(t);
  timestamp->set_seconds(secs);
  timestamp->set_nanos(static_cast<int32_t>(
      (t - absl::FromUnixSeconds(secs)) / absl::Nanoseconds(1)));
}

template <typename Reply>
void SetErr(PodxErr err, Reply *response) {
  response->set_ok(err == PodxErr::kOk);
  response->set_err_code(static_cast<uint32_t>(err));
  if (err != PodxErr::kOk) response->set_reason(std::string(PodxErrStr(err)));
}

}  // namespace

grpc::Status PodCtldServiceImpl::AddNode(
    grpc::ServerContext *context, const PodxGrpc::AddNodeRequest *request,
    PodxGrpc::AddNodeReply *response) {
  if (request->node_id().empty() || !request->has_cpu()) {
    SetErr(PodxErr::kMissingField, response);
    return grpc::Status::OK;
  }

  SetErr(m_controller_->AddNode(request->node_id(), request->cpu()), response);
  return grpc::Status::OK;
}

grpc::Status PodCtldServiceImpl::ScaleUp(
    grpc::ServerContext *context, const PodxGrpc::ScaleUpRequest *request,
    PodxGrpc::ScaleUpReply *response) {
  std::list<std::string> added_nodes;
  PodxErr err = m_controller_->ScaleUp(request->count(), &added_nodes);

  SetErr(err, response);
  for (auto &&node_id : added_nodes) response->add_added_nodes(node_id);

  return grpc::Status::OK;
}

grpc::Status PodCtldServiceImpl::RemoveNode(
    grpc::ServerContext *context, const PodxGrpc::RemoveNodeRequest *request,
    PodxGrpc::RemoveNodeReply *response) {
  if (request->node_id().empty()) {
    SetErr(PodxErr::kMissingField, response);
    return grpc::Status::OK;
  }

  std::list<std::string> evicted_pods;
  PodxErr err = m_controller_->RemoveNode(request->node_id(), &evicted_pods);

  SetErr(err, response);
  for (auto &&pod_id : evicted_pods) response->add_evicted_pods(pod_id);

  return grpc::Status::OK;
}

grpc::Status PodCtldServiceImpl::LaunchPod(
    grpc::ServerContext *context, const PodxGrpc::LaunchPodRequest *request,
    PodxGrpc::LaunchPodReply *response) {
  if (request->pod_id().empty() || !request->has_cpu()) {
    SetErr(PodxErr::kMissingField, response);
    return grpc::Status::OK;
  }

  std::optional<PlacementStrategy> strategy;
  if (request->has_strategy())
    strategy = ParseStrategyOrDefault(request->strategy());

  std::string assigned_node;
  PlacementStrategy used_strategy = strategy.value_or(kDefaultStrategy);
  PodxErr err =
      m_controller_->LaunchPod(request->pod_id(), request->cpu(), strategy,
                               &assigned_node, &used_strategy);

  SetErr(err, response);
  response->set_assigned_node(assigned_node);
  response->set_strategy(ToGrpcStrategy(used_strategy));

  return grpc::Status::OK;
}

grpc::Status PodCtldServiceImpl::Heartbeat(
    grpc::ServerContext *context, const PodxGrpc::HeartbeatRequest *request,
    PodxGrpc::HeartbeatReply *response) {
  if (request->node_id().empty()) {
    SetErr(PodxErr::kMissingField, response);
    return grpc::Status::OK;
  }

  SetErr(m_controller_->Heartbeat(request->node_id()), response);
  return grpc::Status::OK;
}

grpc::Status PodCtldServiceImpl::FailNode(
    grpc::ServerContext *context, const PodxGrpc::FailNodeRequest *request,
    PodxGrpc::FailNodeReply *response) {
  if (request->node_id().empty()) {
    SetErr(PodxErr::kMissingField, response);
    return grpc::Status::OK;
  }

  std::list<std::string> evicted_pods;
  PodxErr err = m_controller_->FailNode(request->node_id(), &evicted_pods);

  SetErr(err, response);
  for (auto &&pod_id : evicted_pods) response->add_evicted_pods(pod_id);

  return grpc::Status::OK;
}

grpc::Status PodCtldServiceImpl::RecoverNode(
    grpc::ServerContext *context, const PodxGrpc::RecoverNodeRequest *request,
    PodxGrpc::RecoverNodeReply *response) {
  if (request->node_id().empty()) {
    SetErr(PodxErr::kMissingField, response);
    return grpc::Status::OK;
  }

  SetErr(m_controller_->RecoverNode(request->node_id()), response);
  return grpc::Status::OK;
}

grpc::Status PodCtldServiceImpl::ListNodes(
    grpc::ServerContext *context, const PodxGrpc::ListNodesRequest *request,
    PodxGrpc::ListNodesReply *response) {
  for (auto &&node : m_controller_->ListNodes()) {
    auto *node_info = response->add_node_list();
    node_info->set_node_id(node.id);
    node_info->set_total_cpu(node.total_cpu);
    node_info->set_avail_cpu(node.avail_cpu);
    SetTimestamp(node.last_heartbeat, node_info->mutable_last_heartbeat());
    node_info->set_status(ToGrpcNodeStatus(node.status));
  }

  return grpc::Status::OK;
}

grpc::Status PodCtldServiceImpl::ListPods(
    grpc::ServerContext *context, const PodxGrpc::ListPodsRequest *request,
    PodxGrpc::ListPodsReply *response) {
  for (auto &&pod : m_controller_->ListPods()) {
    auto *pod_info = response->add_pod_list();
    pod_info->set_pod_id(pod.id);
    pod_info->set_cpu_request(pod.cpu_request);
    if (pod.assigned_node.has_value())
      pod_info->set_assigned_node(pod.assigned_node.value());
    pod_info->set_status(ToGrpcPodStatus(pod.status));
  }

  return grpc::Status::OK;
}

grpc::Status PodCtldServiceImpl::GetLeader(
    grpc::ServerContext *context, const PodxGrpc::GetLeaderRequest *request,
    PodxGrpc::GetLeaderReply *response) {
  response->set_leader(m_controller_->GetLeader());
  return grpc::Status::OK;
}

grpc::Status PodCtldServiceImpl::SetStrategy(
    grpc::ServerContext *context, const PodxGrpc::SetStrategyRequest *request,
    PodxGrpc::SetStrategyReply *response) {
  PlacementStrategy strategy = m_controller_->SetStrategy(request->strategy());

  response->set_strategy(ToGrpcStrategy(strategy));
  response->set_strategy_name(std::string(StrategyName(strategy)));
  return grpc::Status::OK;
}

grpc::Status PodCtldServiceImpl::GetStrategy(
    grpc::ServerContext *context, const PodxGrpc::GetStrategyRequest *request,
    PodxGrpc::GetStrategyReply *response) {
  PlacementStrategy strategy = m_controller_->GetStrategy();

  response->set_strategy(ToGrpcStrategy(strategy));
  response->set_strategy_name(std::string(StrategyName(strategy)));
  return grpc::Status::OK;
}

grpc::Status PodCtldServiceImpl::GetMetrics(
    grpc::ServerContext *context, const PodxGrpc::GetMetricsRequest *request,
    PodxGrpc::GetMetricsReply *response) {
  ClusterMetrics metrics = m_controller_->GetMetrics();

  response->set_healthy_node_count(metrics.healthy_node_count);
  response->set_free_cpu(metrics.free_cpu);
  response->set_running_pod_count(metrics.running_pod_count);
  response->set_node_count(metrics.node_count);
  response->set_pending_pod_count(metrics.pending_pod_count);

  return grpc::Status::OK;
}

CtldServer::CtldServer(const Config::PodCtldListenConf &listen_conf,
                       ClusterController *controller) {
  m_service_impl_ = std::make_unique<PodCtldServiceImpl>(controller);

  std::string listen_addr_port = fmt::format(
      "{}:{}", listen_conf.PodCtldListenAddr, listen_conf.PodCtldListenPort);

  grpc::ServerBuilder builder;
  builder.AddListeningPort(listen_addr_port, grpc::InsecureServerCredentials());
  builder.RegisterService(m_service_impl_.get());

  m_server_ = builder.BuildAndStart();
  if (!m_server_) {
    PODX_ERROR("Cannot start gRPC server!");
    std::exit(1);
  }

  PODX_INFO("PodCtld is listening on {}", listen_addr_port);

  std::thread sigint_waiting_thread([p_server = m_server_.get()] {
    std::unique_lock<std::mutex> lk(s_sigint_mtx);
    s_sigint_cv.wait(lk);

    PODX_TRACE("SIGINT captured. Calling Shutdown() on grpc server...");
    p_server->Shutdown();
  });
  sigint_waiting_thread.detach();

  signal(SIGINT, &CtldServer::signal_handler_func);
}

}  // namespace PodCtld
