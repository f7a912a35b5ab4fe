#pragma once

#include <optional>
#include <string>
#include <vector>

#include "CtldPublicDefs.h"
#include "StateStore.h"

namespace PodCtld {

/**
 * Sticky leader selection among healthy nodes. This is selection, not
 * consensus: there are no terms and no quorum.
 */
class LeaderElector {
 public:
  explicit LeaderElector(StateStoreInterface* store) : m_store_(store) {}

  /**
   * Keep the recorded leader while it exists and is healthy. Otherwise elect
   * with ElectFrom() and record the result.
   * @return the leader id, or kNoLeader if no node is healthy.
   */
  std::string ResolveLeader();

  // The healthy node with the lexicographically smallest id.
  static std::optional<std::string> ElectFrom(
      const std::vector<NodeRecord>& nodes);

 private:
  StateStoreInterface* m_store_;
};

}  // namespace PodCtld
