#pragma once

#include <yaml-cpp/yaml.h>

#include "CtldPublicDefs.h"

namespace PodCtld {

/**
 * Fill `conf` from a parsed podctld config file. Absent keys keep the
 * defaults of Config.
 * @return false if a key has an illegal value. The reason is logged.
 */
bool ParseConfig(const YAML::Node& config, Config* conf);

/**
 * Check the listening address (dotted IPv4) and port.
 */
bool ValidateListenConf(const Config::PodCtldListenConf& listen_conf);

// trace, debug, info, warn or error.
bool IsValidDebugLevel(const std::string& level);

}  // namespace PodCtld
