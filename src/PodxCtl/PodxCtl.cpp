#include <cxxopts.hpp>
#include <optional>
#include <string>
#include <vector>

#include "PodxCtlClient.h"
#include "podx/PublicHeader.h"

namespace {

constexpr const char* kUsage = R"(Commands:
  add-node <node id> <cpu>
  scale-up <count>
  remove-node <node id>
  launch-pod <pod id> <cpu> [strategy]
  heartbeat <node id>
  fail-node <node id>
  recover-node <node id>
  list-nodes
  list-pods
  leader
  set-strategy <first_fit|best_fit|worst_fit>
  get-strategy
  metrics
)";

bool ParseCpu(const std::string& str, uint32_t* cpu) {
  try {
    size_t pos;
    unsigned long value = std::stoul(str, &pos);
    if (pos != str.size() || value > UINT32_MAX) return false;
    *cpu = static_cast<uint32_t>(value);
    return true;
  } catch (const std::logic_error&) {
    return false;
  }
}

PodxErr RunCommand(PodxCtl::PodxCtlClient* client, const std::string& command,
                   const std::vector<std::string>& args) {
  auto nargs_is = [&](size_t min, size_t max) {
    if (args.size() >= min && args.size() <= max) return true;
    fmt::print("Wrong number of arguments for {}.\n{}", command, kUsage);
    return false;
  };

  uint32_t cpu;

  if (command == "add-node") {
    if (!nargs_is(2, 2)) return PodxErr::kInvalidParam;
    if (!ParseCpu(args[1], &cpu)) {
      fmt::print("Illegal cpu: {}\n", args[1]);
      return PodxErr::kInvalidParam;
    }
    return client->AddNode(args[0], cpu);
  }
  if (command == "scale-up") {
    if (!nargs_is(1, 1)) return PodxErr::kInvalidParam;
    uint32_t count;
    if (!ParseCpu(args[0], &count)) {
      fmt::print("Illegal count: {}\n", args[0]);
      return PodxErr::kInvalidParam;
    }
    return client->ScaleUp(count);
  }
  if (command == "remove-node") {
    if (!nargs_is(1, 1)) return PodxErr::kInvalidParam;
    return client->RemoveNode(args[0]);
  }
  if (command == "launch-pod") {
    if (!nargs_is(2, 3)) return PodxErr::kInvalidParam;
    if (!ParseCpu(args[1], &cpu)) {
      fmt::print("Illegal cpu: {}\n", args[1]);
      return PodxErr::kInvalidParam;
    }
    std::optional<std::string> strategy;
    if (args.size() == 3) strategy = args[2];
    return client->LaunchPod(args[0], cpu, strategy);
  }
  if (command == "heartbeat") {
    if (!nargs_is(1, 1)) return PodxErr::kInvalidParam;
    return client->Heartbeat(args[0]);
  }
  if (command == "fail-node") {
    if (!nargs_is(1, 1)) return PodxErr::kInvalidParam;
    return client->FailNode(args[0]);
  }
  if (command == "recover-node") {
    if (!nargs_is(1, 1)) return PodxErr::kInvalidParam;
    return client->RecoverNode(args[0]);
  }
  if (command == "list-nodes") return client->ListNodes();
  if (command == "list-pods") return client->ListPods();
  if (command == "leader") return client->GetLeader();
  if (command == "set-strategy") {
    if (!nargs_is(1, 1)) return PodxErr::kInvalidParam;
    return client->SetStrategy(args[0]);
  }
  if (command == "get-strategy") return client->GetStrategy();
  if (command == "metrics") return client->GetMetrics();

  fmt::print("Unknown command: {}\n{}", command, kUsage);
  return PodxErr::kInvalidParam;
}

}  // namespace

int main(int argc, char** argv) {
#ifndef NDEBUG
  spdlog::set_level(spdlog::level::trace);
#else
  spdlog::set_level(spdlog::level::warn);
#endif

  cxxopts::Options options("podxctl", "Control a podctld instance");

  // clang-format off
  options.add_options()
      ("s,server", "address of podctld",
       cxxopts::value<std::string>()->default_value("127.0.0.1"))
      ("p,port", "port of podctld",
       cxxopts::value<std::string>()->default_value(kCtldDefaultPort))
      ("h,help", "print usage")
      ("command", "command to run", cxxopts::value<std::string>())
      ("args", "arguments of the command",
       cxxopts::value<std::vector<std::string>>())
      ;
  // clang-format on

  options.parse_positional({"command", "args"});
  options.positional_help("<command> [args...]");

  std::string ctld_addr_port;
  std::string command;
  std::vector<std::string> args;

  try {
    auto parsed_args = options.parse(argc, argv);

    if (parsed_args.count("help") > 0 || parsed_args.count("command") == 0) {
      fmt::print("{}\n{}", options.help(), kUsage);
      return parsed_args.count("help") > 0 ? 0 : 1;
    }

    ctld_addr_port =
        fmt::format("{}:{}", parsed_args["server"].as<std::string>(),
                    parsed_args["port"].as<std::string>());
    command = parsed_args["command"].as<std::string>();
    if (parsed_args.count("args") > 0)
      args = parsed_args["args"].as<std::vector<std::string>>();
  } catch (const cxxopts::OptionException& e) {
    fmt::print("Invalid arguments: {}\n", e.what());
    return 1;
  }

  PodxCtl::PodxCtlClient client;

  PodxErr err = client.Init(ctld_addr_port);
  if (err != PodxErr::kOk) {
    PODX_ERROR("{}", PodxErrStr(err));
    return 1;
  }

  err = RunCommand(&client, command, args);
  if (err != PodxErr::kOk) {
    PODX_DEBUG("{}", PodxErrStr(err));
    return 1;
  } else
    return 0;
}
