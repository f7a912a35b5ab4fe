#include "MetricsAggregator.h"

#include <gtest/gtest.h>

#include <memory>

#include "NodeRegistry.h"
#include "PodRegistry.h"
#include "PodScheduler.h"

using namespace PodCtld;

TEST(MetricsAggregator, EmptyCluster) {
  StateStoreInMemoryImpl store;
  MetricsAggregator metrics(&store);

  ClusterMetrics snapshot = metrics.Snapshot();
  EXPECT_EQ(snapshot.healthy_node_count, 0);
  EXPECT_EQ(snapshot.free_cpu, 0);
  EXPECT_EQ(snapshot.running_pod_count, 0);
  EXPECT_EQ(snapshot.node_count, 0);
  EXPECT_EQ(snapshot.pending_pod_count, 0);
}

TEST(MetricsAggregator, CountsOnlyHealthyCapacity) {
  StateStoreInMemoryImpl store;
  ManualClock clock;
  NodeRegistry nodes(&store, &clock);
  PodRegistry pods(&store, &clock, absl::Seconds(30));
  PodScheduler scheduler(&store);
  MetricsAggregator metrics(&store);

  ASSERT_EQ(nodes.Register("a", 10), PodxErr::kOk);
  ASSERT_EQ(nodes.Register("b", 4), PodxErr::kOk);
  ASSERT_EQ(nodes.Register("c", 6), PodxErr::kOk);

  ASSERT_EQ(pods.Create("p1", 3), PodxErr::kOk);
  ASSERT_EQ(scheduler.Place("p1", 3, PlacementStrategy::kFirstFit), "a");
  ASSERT_EQ(pods.Create("p2", 5), PodxErr::kOk);
  ASSERT_EQ(scheduler.Place("p2", 5, PlacementStrategy::kFirstFit), "a");
  ASSERT_EQ(pods.Create("p3", 8), PodxErr::kOk);

  ASSERT_EQ(nodes.MarkUnhealthy("c"), PodxErr::kOk);

  ClusterMetrics snapshot = metrics.Snapshot();
  EXPECT_EQ(snapshot.node_count, 3);
  EXPECT_EQ(snapshot.healthy_node_count, 2);
  EXPECT_EQ(snapshot.free_cpu, 2 + 4);
  EXPECT_EQ(snapshot.running_pod_count, 2);
  EXPECT_EQ(snapshot.pending_pod_count, 1);
}
