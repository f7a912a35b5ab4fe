#pragma once

#include "CtldPublicDefs.h"
#include "StateStore.h"

namespace PodCtld {

class MetricsAggregator {
 public:
  explicit MetricsAggregator(StateStoreInterface* store) : m_store_(store) {}

  // Read-only. Node and pod figures come from the same locked view.
  ClusterMetrics Snapshot();

 private:
  StateStoreInterface* m_store_;
};

}  // namespace PodCtld
