#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <optional>
#include <string>

#include "podx/PublicHeader.h"
#include "protos/PodX.grpc.pb.h"

namespace PodxCtl {

using grpc::Channel;
using grpc::ClientContext;
using grpc::Status;

using PodxGrpc::PodCtld;

/**
 * Issues one RPC per call against podctld and prints the result to stdout.
 * Errors reported by podctld come back as PodxErr; a broken channel is
 * kRpcFailure.
 */
class PodxCtlClient {
 public:
  PodxCtlClient() = default;

  PodxErr Init(const std::string& ctld_addr_port);

  PodxErr AddNode(const std::string& node_id, uint32_t cpu);

  PodxErr ScaleUp(uint32_t count);

  PodxErr RemoveNode(const std::string& node_id);

  PodxErr LaunchPod(const std::string& pod_id, uint32_t cpu,
                    const std::optional<std::string>& strategy);

  PodxErr Heartbeat(const std::string& node_id);

  PodxErr FailNode(const std::string& node_id);

  PodxErr RecoverNode(const std::string& node_id);

  PodxErr ListNodes();

  PodxErr ListPods();

  PodxErr GetLeader();

  PodxErr SetStrategy(const std::string& strategy);

  PodxErr GetStrategy();

  PodxErr GetMetrics();

 private:
  static PodxErr RpcFailed_(const Status& status);

  // err_code in the reply is a PodxErr.
  template <typename Reply>
  static PodxErr ReplyErr_(const Reply& reply);

  std::unique_ptr<PodCtld::Stub> m_stub_;
  std::shared_ptr<Channel> m_channel_;
};

}  // namespace PodxCtl
