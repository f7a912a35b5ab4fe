#include "CtldPublicDefs.h"

#include "podx/String.h"

namespace PodCtld {

std::string_view NodeStatusStr(NodeStatus status) {
  switch (status) {
    case NodeStatus::kHealthy:
      return "healthy";
    case NodeStatus::kUnhealthy:
      return "unhealthy";
  }
  return "unknown";
}

std::string_view PodStatusStr(PodStatus status) {
  switch (status) {
    case PodStatus::kPending:
      return "pending";
    case PodStatus::kRunning:
      return "running";
  }
  return "unknown";
}

std::string_view StrategyName(PlacementStrategy strategy) {
  switch (strategy) {
    case PlacementStrategy::kFirstFit:
      return "first_fit";
    case PlacementStrategy::kBestFit:
      return "best_fit";
    case PlacementStrategy::kWorstFit:
      return "worst_fit";
  }
  return "unknown";
}

bool TryParseStrategy(std::string_view name, PlacementStrategy* strategy) {
  std::string canonical = util::CanonicalName(name);

  for (auto s : {PlacementStrategy::kFirstFit, PlacementStrategy::kBestFit,
                 PlacementStrategy::kWorstFit}) {
    if (canonical == StrategyName(s)) {
      *strategy = s;
      return true;
    }
  }

  return false;
}

PlacementStrategy ParseStrategyOrDefault(std::string_view name) {
  PlacementStrategy strategy;
  if (TryParseStrategy(name, &strategy)) return strategy;

  PODX_DEBUG("Unrecognized strategy \"{}\". Falling back to {}.", name,
             StrategyName(kDefaultStrategy));
  return kDefaultStrategy;
}

}  // namespace PodCtld
