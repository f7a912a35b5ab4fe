#pragma once

#include <grpc++/grpc++.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "ClusterController.h"
#include "CtldPublicDefs.h"
#include "protos/PodX.grpc.pb.h"
#include "protos/PodX.pb.h"

namespace PodCtld {

using grpc::Server;

/**
 * Translates PodxGrpc requests into ClusterController calls. Requests with an
 * empty id or an unset cpu are answered with kMissingField without reaching
 * the controller.
 */
class PodCtldServiceImpl final : public PodxGrpc::PodCtld::Service {
 public:
  explicit PodCtldServiceImpl(ClusterController *controller)
      : m_controller_(controller) {}

  grpc::Status AddNode(grpc::ServerContext *context,
                       const PodxGrpc::AddNodeRequest *request,
                       PodxGrpc::AddNodeReply *response) override;

  grpc::Status ScaleUp(grpc::ServerContext *context,
                       const PodxGrpc::ScaleUpRequest *request,
                       PodxGrpc::ScaleUpReply *response) override;

  grpc::Status RemoveNode(grpc::ServerContext *context,
                          const PodxGrpc::RemoveNodeRequest *request,
                          PodxGrpc::RemoveNodeReply *response) override;

  grpc::Status LaunchPod(grpc::ServerContext *context,
                         const PodxGrpc::LaunchPodRequest *request,
                         PodxGrpc::LaunchPodReply *response) override;

  grpc::Status Heartbeat(grpc::ServerContext *context,
                         const PodxGrpc::HeartbeatRequest *request,
                         PodxGrpc::HeartbeatReply *response) override;

  grpc::Status FailNode(grpc::ServerContext *context,
                        const PodxGrpc::FailNodeRequest *request,
                        PodxGrpc::FailNodeReply *response) override;

  grpc::Status RecoverNode(grpc::ServerContext *context,
                           const PodxGrpc::RecoverNodeRequest *request,
                           PodxGrpc::RecoverNodeReply *response) override;

  grpc::Status ListNodes(grpc::ServerContext *context,
                         const PodxGrpc::ListNodesRequest *request,
                         PodxGrpc::ListNodesReply *response) override;

  grpc::Status ListPods(grpc::ServerContext *context,
                        const PodxGrpc::ListPodsRequest *request,
                        PodxGrpc::ListPodsReply *response) override;

  grpc::Status GetLeader(grpc::ServerContext *context,
                         const PodxGrpc::GetLeaderRequest *request,
                         PodxGrpc::GetLeaderReply *response) override;

  grpc::Status SetStrategy(grpc::ServerContext *context,
                           const PodxGrpc::SetStrategyRequest *request,
                           PodxGrpc::SetStrategyReply *response) override;

  grpc::Status GetStrategy(grpc::ServerContext *context,
                           const PodxGrpc::GetStrategyRequest *request,
                           PodxGrpc::GetStrategyReply *response) override;

  grpc::Status GetMetrics(grpc::ServerContext *context,
                          const PodxGrpc::GetMetricsRequest *request,
                          PodxGrpc::GetMetricsReply *response) override;

 private:
  ClusterController *m_controller_;
};

/***
 * Note: There should be only ONE instance of CtldServer!!!!
 */
class CtldServer {
 public:
  /***
   * User must make sure that this constructor is called only once!
   * @param listen_conf The address and port of PodCtld.
   */
  CtldServer(const Config::PodCtldListenConf &listen_conf,
             ClusterController *controller);

  inline void Wait() { m_server_->Wait(); }

 private:
  std::unique_ptr<PodCtldServiceImpl> m_service_impl_;
  std::unique_ptr<Server> m_server_;

  inline static std::mutex s_sigint_mtx;
  inline static std::condition_variable s_sigint_cv;
  static void signal_handler_func(int) { s_sigint_cv.notify_one(); };
};

}  // namespace PodCtld

inline std::unique_ptr<PodCtld::CtldServer> g_ctld_server;
