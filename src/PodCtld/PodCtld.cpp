#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <sys/stat.h>
#include <unistd.h>
#include <yaml-cpp/yaml.h>

#include <cxxopts.hpp>
#include <filesystem>
#include <memory>

#include "ClusterController.h"
#include "CtldConfig.h"
#include "CtldGrpcServer.h"
#include "TimerDriver.h"
#include "podx/PublicHeader.h"

namespace {

std::unique_ptr<PodCtld::StateStoreInterface> g_state_store;
std::unique_ptr<PodCtld::ClockInterface> g_clock;
std::unique_ptr<PodCtld::TimerDriverInterface> g_timer_driver;

}  // namespace

void InitializeCtldGlobalVariables() {
  using namespace PodCtld;

  auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      g_config.PodCtldLogFile, 1048576 * 5, 3);

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();

  if (g_config.PodCtldDebugLevel == "trace") {
    file_sink->set_level(spdlog::level::trace);
    console_sink->set_level(spdlog::level::trace);
  } else if (g_config.PodCtldDebugLevel == "debug") {
    file_sink->set_level(spdlog::level::debug);
    console_sink->set_level(spdlog::level::debug);
  } else if (g_config.PodCtldDebugLevel == "info") {
    file_sink->set_level(spdlog::level::info);
    console_sink->set_level(spdlog::level::info);
  } else if (g_config.PodCtldDebugLevel == "warn") {
    file_sink->set_level(spdlog::level::warn);
    console_sink->set_level(spdlog::level::warn);
  } else if (g_config.PodCtldDebugLevel == "error") {
    file_sink->set_level(spdlog::level::err);
    console_sink->set_level(spdlog::level::err);
  } else {
    PODX_ERROR("Illegal debug-level format.");
    std::exit(1);
  }

  spdlog::init_thread_pool(256, 1);
  auto logger = std::make_shared<spdlog::async_logger>(
      "default", spdlog::sinks_init_list{file_sink, console_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);

  spdlog::flush_on(spdlog::level::err);
  spdlog::flush_every(std::chrono::seconds(1));

  spdlog::set_level(spdlog::level::trace);

  g_state_store = std::make_unique<StateStoreInMemoryImpl>();
  g_clock = std::make_unique<SystemClock>();

  g_cluster_controller = std::make_unique<ClusterController>(
      g_state_store.get(), g_clock.get(), g_config.CtlConf);
  PODX_INFO("Cluster strategy: {}",
            StrategyName(g_config.CtlConf.DefaultStrategy));

  for (auto&& [node_id, node] : g_config.Nodes) {
    PodxErr err = g_cluster_controller->AddNode(node_id, node.cpu);
    if (err != PodxErr::kOk)
      PODX_ERROR("Failed to register node {} from the config file: {}",
                 node_id, PodxErrStr(err));
  }

  g_timer_driver = std::make_unique<LibEventTimerDriver>();
  g_cluster_controller->RegisterPeriodicTasks(g_timer_driver.get());
  if (g_timer_driver->Start() != PodxErr::kOk) {
    PODX_ERROR("Failed to start the timer driver.");
    std::exit(1);
  }
}

void DestroyCtldGlobalVariables() {
  g_timer_driver->Stop();
  g_timer_driver.reset();

  g_ctld_server.reset();
  g_cluster_controller.reset();
  g_clock.reset();
  g_state_store.reset();
}

int StartServer() {
  // Create log directory recursively.
  try {
    std::filesystem::path log_path{g_config.PodCtldLogFile};
    auto log_dir = log_path.parent_path();
    if (!log_dir.empty()) std::filesystem::create_directories(log_dir);
  } catch (const std::exception& e) {
    PODX_ERROR("Invalid PodCtldLogFile path {}: {}", g_config.PodCtldLogFile,
               e.what());
  }

  InitializeCtldGlobalVariables();

  g_ctld_server = std::make_unique<PodCtld::CtldServer>(
      g_config.ListenConf, g_cluster_controller.get());

  g_ctld_server->Wait();

  DestroyCtldGlobalVariables();

  return 0;
}

void StartDaemon() {
  /* Our process ID and Session ID */
  pid_t pid, sid;

  /* Fork off the parent process */
  pid = fork();
  if (pid < 0) {
    PODX_ERROR("Error: fork()");
    exit(1);
  }
  /* If we got a good PID, then
     we can exit the parent process. */
  if (pid > 0) {
    exit(0);
  }

  /* Change the file mode mask */
  umask(0);

  /* Create a new SID for the child process */
  sid = setsid();
  if (sid < 0) {
    PODX_ERROR("Error: setsid()");
    exit(1);
  }

  /* Change the current working directory */
  if ((chdir("/")) < 0) {
    PODX_ERROR("Error: chdir()");
    exit(1);
  }

  /* Close out the standard file descriptors */
  close(STDIN_FILENO);
  close(STDOUT_FILENO);
  close(STDERR_FILENO);

  StartServer();

  exit(EXIT_SUCCESS);
}

int main(int argc, char** argv) {
#ifndef NDEBUG
  spdlog::set_level(spdlog::level::trace);
#endif

  cxxopts::Options options("podctld");

  // clang-format off
  options.add_options()
      ("C,config", "path of the config file",
       cxxopts::value<std::string>()->default_value(kDefaultConfigPath))
      ("l,listen", "listening address",
       cxxopts::value<std::string>()->default_value("0.0.0.0"))
      ("p,port", "listening port",
       cxxopts::value<std::string>()->default_value(kCtldDefaultPort))
      ("D,debug-level", "trace, debug, info, warn or error",
       cxxopts::value<std::string>()->default_value("info"))
      ("f,foreground", "do not daemonize")
      ("h,help", "print usage")
      ;
  // clang-format on

  auto parsed_args = options.parse(argc, argv);

  if (parsed_args.count("help") > 0) {
    fmt::print("{}", options.help());
    return 0;
  }

  std::string config_path = parsed_args["config"].as<std::string>();
  if (std::filesystem::exists(config_path)) {
    try {
      YAML::Node config = YAML::LoadFile(config_path);
      if (!PodCtld::ParseConfig(config, &g_config)) std::exit(1);
    } catch (YAML::BadFile& e) {
      PODX_ERROR("Can't open config file {}: {}", config_path, e.what());
      std::exit(1);
    } catch (YAML::ParserException& e) {
      PODX_ERROR("Can't parse config file {}: {}", config_path, e.what());
      std::exit(1);
    }
  } else {
    g_config.ListenConf.PodCtldListenAddr =
        parsed_args["listen"].as<std::string>();
    g_config.ListenConf.PodCtldListenPort =
        parsed_args["port"].as<std::string>();
    g_config.PodCtldDebugLevel = parsed_args["debug-level"].as<std::string>();

    if (!PodCtld::IsValidDebugLevel(g_config.PodCtldDebugLevel)) {
      fmt::print("Illegal debug-level format.\n");
      std::exit(1);
    }
  }

  if (parsed_args.count("foreground") > 0) g_config.PodCtldForeground = true;

  if (!PodCtld::ValidateListenConf(g_config.ListenConf)) {
    fmt::print("Listening address or port is invalid.\n");
    std::exit(1);
  }

  if (g_config.PodCtldForeground)
    StartServer();
  else
    StartDaemon();

  return 0;
}
