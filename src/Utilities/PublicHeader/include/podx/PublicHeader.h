#pragma once

#include <spdlog/spdlog.h>

#include <array>
#include <cstdint>
#include <string_view>

// For better logging inside lambda functions
#if defined(__clang__) || defined(__GNUC__) || defined(__GNUG__)
#define __FUNCTION__ __PRETTY_FUNCTION__
#endif

#define PODX_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define PODX_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define PODX_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define PODX_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define PODX_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#define PODX_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)

#ifndef NDEBUG
#define PODX_ASSERT(condition, message)                                 \
  do {                                                                  \
    if (!(condition)) {                                                 \
      PODX_CRITICAL("Assertion failed: \"" #condition "\": " #message); \
      std::terminate();                                                 \
    }                                                                   \
  } while (false)
#else
#define PODX_ASSERT(condition, message) \
  do {                                  \
  } while (false)
#endif

enum class PodxErr : uint16_t {
  kOk = 0,
  kGenericFailure,
  kDuplicateNode,
  kDuplicatePod,
  kNodeNotFound,
  kPodNotFound,
  kMissingField,
  kInsufficientClusterCapacity,
  kNoFeasibleNode,
  kInvalidParam,
  kRpcFailure,

  __ERR_SIZE  // NOLINT(bugprone-reserved-identifier)
};

inline const char* kCtldDefaultPort = "10021";
inline const char* kDefaultConfigPath = "/etc/podx/config.yaml";

namespace Internal {

constexpr std::array<std::string_view, uint16_t(PodxErr::__ERR_SIZE)>
    PodxErrStrArr = {
        "Success",
        "Generic failure",
        "Node already exists",
        "Pod already exists",
        "The node doesn't exist",
        "The pod doesn't exist",
        "A required field is missing",
        "Insufficient cluster-wide resources to schedule pod",
        "No single node has enough resources right now",
        "Invalid Parameter",
        "RPC call failed",
};

}  // namespace Internal

inline std::string_view PodxErrStr(PodxErr err) {
  return Internal::PodxErrStrArr[uint16_t(err)];
}

namespace Internal {

struct StaticLogFormatSetter {
  StaticLogFormatSetter() { spdlog::set_pattern("[%^%L%$ %C-%m-%d %s:%#] %v"); }
};

// Set the global spdlog pattern in global variable initialization.
[[maybe_unused]] inline StaticLogFormatSetter _static_formatter_setter;

}  // namespace Internal
