#include "CtldConfig.h"

#include <spdlog/fmt/ranges.h>

#include <regex>

#include "podx/String.h"

namespace PodCtld {

namespace {

bool ParseSeconds(const YAML::Node& config, const char* key,
                  absl::Duration* duration) {
  if (!config[key]) return true;

  auto secs = config[key].as<int64_t>();
  if (secs <= 0) {
    PODX_ERROR("{} must be positive, but it's {}.", key, secs);
    return false;
  }

  *duration = absl::Seconds(secs);
  return true;
}

}  // namespace

bool ParseConfig(const YAML::Node& config, Config* conf) {
  try {
    if (config["PodCtldListenAddr"])
      conf->ListenConf.PodCtldListenAddr =
          config["PodCtldListenAddr"].as<std::string>();
    else
      conf->ListenConf.PodCtldListenAddr = "0.0.0.0";

    if (config["PodCtldListenPort"])
      conf->ListenConf.PodCtldListenPort =
          config["PodCtldListenPort"].as<std::string>();
    else
      conf->ListenConf.PodCtldListenPort = kCtldDefaultPort;

    if (config["PodCtldDebugLevel"]) {
      conf->PodCtldDebugLevel = config["PodCtldDebugLevel"].as<std::string>();
      if (!IsValidDebugLevel(conf->PodCtldDebugLevel)) {
        PODX_ERROR("Illegal debug-level format: {}", conf->PodCtldDebugLevel);
        return false;
      }
    }

    if (config["PodCtldLogFile"])
      conf->PodCtldLogFile = config["PodCtldLogFile"].as<std::string>();

    if (config["PodCtldForeground"])
      conf->PodCtldForeground = config["PodCtldForeground"].as<bool>();

    auto& ctl_conf = conf->CtlConf;

    if (config["DefaultStrategy"]) {
      auto name = config["DefaultStrategy"].as<std::string>();
      if (!TryParseStrategy(name, &ctl_conf.DefaultStrategy)) {
        PODX_WARN("Unknown DefaultStrategy \"{}\". Using {}.", name,
                  StrategyName(kDefaultStrategy));
        ctl_conf.DefaultStrategy = kDefaultStrategy;
      }
    }

    if (!ParseSeconds(config, "LivenessWindowSec", &ctl_conf.LivenessWindow))
      return false;
    if (!ParseSeconds(config, "FailureDetectIntervalSec",
                      &ctl_conf.FailureDetectInterval))
      return false;
    if (!ParseSeconds(config, "RescheduleIntervalSec",
                      &ctl_conf.RescheduleInterval))
      return false;
    if (!ParseSeconds(config, "HeartbeatSimulationIntervalSec",
                      &ctl_conf.HeartbeatSimulationInterval))
      return false;

    if (config["HeartbeatSimulation"])
      ctl_conf.HeartbeatSimulation = config["HeartbeatSimulation"].as<bool>();

    if (config["ScaleUpNodeCpu"])
      ctl_conf.ScaleUpNodeCpu = config["ScaleUpNodeCpu"].as<uint32_t>();

    if (config["Nodes"]) {
      for (auto it = config["Nodes"].begin(); it != config["Nodes"].end();
           ++it) {
        auto node = it->as<YAML::Node>();
        Config::Node node_conf{};
        std::list<std::string> name_list;

        if (node["name"]) {
          if (!util::ParseHostList(node["name"].Scalar(), &name_list)) {
            PODX_ERROR("Illegal node name string format: {}",
                       node["name"].Scalar());
            return false;
          }

          PODX_TRACE("node name list parsed: {}", fmt::join(name_list, ", "));
        } else {
          PODX_ERROR("A node entry in the config file has no name.");
          return false;
        }

        if (node["cpu"]) {
          node_conf.cpu = node["cpu"].as<uint32_t>();
        } else {
          PODX_ERROR("Node {} has no cpu in the config file.",
                     node["name"].Scalar());
          return false;
        }

        for (auto&& name : name_list)
          conf->Nodes.emplace_back(std::move(name), node_conf);
      }
    }
  } catch (const YAML::Exception& e) {
    PODX_ERROR("Illegal config file: {}", e.what());
    return false;
  }

  return true;
}

bool ValidateListenConf(const Config::PodCtldListenConf& listen_conf) {
  std::regex regex_addr(
      R"(^((25[0-5]|(2[0-4]|1[0-9]|[1-9]|)[0-9])(\.(?!$)|$)){4}$)");

  std::regex regex_port(R"(^([0-9]{1,4}|[1-5][0-9]{4}|6[0-4][0-9]{3}|)"
                        R"(65[0-4][0-9]{2}|655[0-2][0-9]|6553[0-5])$)");

  if (!std::regex_match(listen_conf.PodCtldListenAddr, regex_addr)) {
    PODX_ERROR("Listening address {} is invalid.",
               listen_conf.PodCtldListenAddr);
    return false;
  }

  if (!std::regex_match(listen_conf.PodCtldListenPort, regex_port)) {
    PODX_ERROR("Listening port {} is invalid.", listen_conf.PodCtldListenPort);
    return false;
  }

  return true;
}

bool IsValidDebugLevel(const std::string& level) {
  return level == "trace" || level == "debug" || level == "info" ||
         level == "warn" || level == "error";
}

}  // namespace PodCtld
