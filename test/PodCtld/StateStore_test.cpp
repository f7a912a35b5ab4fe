#include "StateStore.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace PodCtld;
using testing::ElementsAre;

namespace {

NodeRecord MakeNode(const std::string& id, uint32_t cpu) {
  NodeRecord node;
  node.id = id;
  node.total_cpu = cpu;
  node.avail_cpu = cpu;
  return node;
}

std::vector<std::string> ScanIds(const RecordTable<NodeRecord>& table) {
  std::vector<std::string> ids;
  table.Scan([&](const NodeRecord& node) { ids.emplace_back(node.id); });
  return ids;
}

}  // namespace

TEST(RecordTable, ScanFollowsInsertionOrder) {
  RecordTable<NodeRecord> table;
  table.Put(MakeNode("b", 1));
  table.Put(MakeNode("a", 2));
  table.Put(MakeNode("c", 3));

  EXPECT_THAT(ScanIds(table), ElementsAre("b", "a", "c"));
  EXPECT_EQ(table.Size(), 3);
}

TEST(RecordTable, OverwriteKeepsPosition) {
  RecordTable<NodeRecord> table;
  uint64_t b_seq = table.Put(MakeNode("b", 1)).seq;
  table.Put(MakeNode("a", 2));

  NodeRecord& b = table.Put(MakeNode("b", 8));
  EXPECT_EQ(b.seq, b_seq);
  EXPECT_EQ(b.total_cpu, 8);

  EXPECT_THAT(ScanIds(table), ElementsAre("b", "a"));
  EXPECT_EQ(table.Size(), 2);
}

TEST(RecordTable, EraseAndReinsertMovesToTheEnd) {
  RecordTable<NodeRecord> table;
  table.Put(MakeNode("a", 1));
  table.Put(MakeNode("b", 1));

  EXPECT_TRUE(table.Erase("a"));
  EXPECT_FALSE(table.Erase("a"));
  EXPECT_FALSE(table.Contains("a"));
  EXPECT_EQ(table.Get("a"), nullptr);

  table.Put(MakeNode("a", 1));
  EXPECT_THAT(ScanIds(table), ElementsAre("b", "a"));
}

TEST(RecordTable, ClearResetsSequence) {
  RecordTable<NodeRecord> table;
  table.Put(MakeNode("a", 1));
  table.Put(MakeNode("b", 1));
  table.Clear();

  EXPECT_EQ(table.Size(), 0);
  EXPECT_EQ(table.Put(MakeNode("c", 1)).seq, 0);
}

TEST(ClusterState, EvictionReturnsCpuToTheNode) {
  ClusterState state;
  NodeRecord& node = state.nodes.Put(MakeNode("a", 10));
  node.avail_cpu = 3;

  for (auto&& [id, cpu] : {std::pair{"p1", 3u}, std::pair{"p2", 4u}}) {
    PodRecord pod;
    pod.id = id;
    pod.cpu_request = cpu;
    pod.assigned_node = "a";
    pod.status = PodStatus::kRunning;
    state.pods.Put(std::move(pod));
  }

  PodRecord other;
  other.id = "p3";
  other.cpu_request = 1;
  state.pods.Put(std::move(other));

  std::list<std::string> evicted = state.EvictPodsOnNode("a");
  EXPECT_THAT(evicted, ElementsAre("p1", "p2"));

  EXPECT_EQ(state.nodes.Get("a")->avail_cpu, 10);
  for (auto&& id : {"p1", "p2", "p3"}) {
    const PodRecord* pod = state.pods.Get(id);
    EXPECT_EQ(pod->status, PodStatus::kPending) << id;
    EXPECT_FALSE(pod->assigned_node.has_value()) << id;
  }
}

TEST(StateStoreInMemory, TokenIsReentrant) {
  StateStoreInMemoryImpl store;

  auto outer = store.GetClusterStatePtr();
  outer->nodes.Put(MakeNode("a", 4));
  {
    auto inner = store.GetClusterStatePtr();
    EXPECT_TRUE(inner->nodes.Contains("a"));
    inner->settings.strategy = PlacementStrategy::kWorstFit;
  }
  EXPECT_EQ(outer->settings.strategy, PlacementStrategy::kWorstFit);
}

TEST(StateStoreInMemory, ResetDropsEverything) {
  StateStoreInMemoryImpl store;
  {
    auto state = store.GetClusterStatePtr();
    state->nodes.Put(MakeNode("a", 4));
    state->settings.leader = "a";
  }

  ClusterSettings settings;
  settings.strategy = PlacementStrategy::kFirstFit;
  store.Reset(settings);

  auto state = store.GetClusterStatePtr();
  EXPECT_EQ(state->nodes.Size(), 0);
  EXPECT_EQ(state->pods.Size(), 0);
  EXPECT_EQ(state->settings.strategy, PlacementStrategy::kFirstFit);
  EXPECT_FALSE(state->settings.leader.has_value());
}
