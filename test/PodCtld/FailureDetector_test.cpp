#include "FailureDetector.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>

#include "NodeRegistry.h"
#include "PodRegistry.h"
#include "PodScheduler.h"
#include "Rescheduler.h"
#include "SharedTestImpl/CtldTestUtil.h"

using namespace PodCtld;
using testing::ElementsAre;
using testing::IsEmpty;
using TestUtil::AvailCpuOf;

class ControlLoopTest : public ::testing::Test {
 public:
  void SetUp() override {
    m_store_ = std::make_unique<StateStoreInMemoryImpl>();
    m_clock_ = std::make_unique<ManualClock>();
    m_nodes_ = std::make_unique<NodeRegistry>(m_store_.get(), m_clock_.get());
    m_pods_ = std::make_unique<PodRegistry>(m_store_.get(), m_clock_.get(),
                                            absl::Seconds(30));
    m_scheduler_ = std::make_unique<PodScheduler>(m_store_.get());
    m_detector_ = std::make_unique<FailureDetector>(
        m_store_.get(), m_clock_.get(), absl::Seconds(30));
    m_rescheduler_ = std::make_unique<Rescheduler>(
        m_store_.get(), m_pods_.get(), m_scheduler_.get());
  }

  void LaunchOn(const std::string& pod_id, uint32_t cpu,
                const std::string& expected_node) {
    ASSERT_EQ(m_pods_->Create(pod_id, cpu), PodxErr::kOk);
    ASSERT_EQ(m_scheduler_->Place(pod_id, cpu, PlacementStrategy::kFirstFit),
              expected_node);
  }

  void SetClusterStrategy(PlacementStrategy strategy) {
    m_store_->GetClusterStatePtr()->settings.strategy = strategy;
  }

  std::optional<std::string> AssignedNodeOf(const std::string& pod_id) {
    PodRecord pod;
    if (!m_pods_->Get(pod_id, &pod)) return std::nullopt;
    return pod.assigned_node;
  }

  std::unique_ptr<StateStoreInMemoryImpl> m_store_;
  std::unique_ptr<ManualClock> m_clock_;
  std::unique_ptr<NodeRegistry> m_nodes_;
  std::unique_ptr<PodRegistry> m_pods_;
  std::unique_ptr<PodScheduler> m_scheduler_;
  std::unique_ptr<FailureDetector> m_detector_;
  std::unique_ptr<Rescheduler> m_rescheduler_;
};

TEST_F(ControlLoopTest, StaleNodeIsMarkedUnhealthyAndDrained) {
  ASSERT_EQ(m_nodes_->Register("a", 8), PodxErr::kOk);
  ASSERT_EQ(m_nodes_->Register("b", 8), PodxErr::kOk);
  LaunchOn("p1", 5, "a");
  LaunchOn("p2", 5, "b");

  m_clock_->Advance(absl::Seconds(20));
  ASSERT_EQ(m_nodes_->Heartbeat("b"), PodxErr::kOk);

  // Exactly at the window is still alive.
  m_clock_->Advance(absl::Seconds(10));
  EXPECT_THAT(m_detector_->Sweep(), IsEmpty());

  m_clock_->Advance(absl::Milliseconds(1));
  EXPECT_THAT(m_detector_->Sweep(), ElementsAre("a"));

  NodeRecord node;
  ASSERT_TRUE(m_nodes_->Get("a", &node));
  EXPECT_EQ(node.status, NodeStatus::kUnhealthy);
  EXPECT_EQ(node.avail_cpu, 8);

  EXPECT_EQ(AssignedNodeOf("p1"), std::nullopt);
  EXPECT_EQ(AssignedNodeOf("p2"), "b");
  EXPECT_TRUE(TestUtil::ClusterInvariantsHold(m_store_.get()));
}

TEST_F(ControlLoopTest, UnhealthyNodesAreNotReportedAgain) {
  ASSERT_EQ(m_nodes_->Register("a", 8), PodxErr::kOk);

  m_clock_->Advance(absl::Seconds(31));
  EXPECT_THAT(m_detector_->Sweep(), ElementsAre("a"));

  m_clock_->Advance(absl::Seconds(10));
  EXPECT_THAT(m_detector_->Sweep(), IsEmpty());
}

TEST_F(ControlLoopTest, ManuallyFailedNodeIsNotSwept) {
  ASSERT_EQ(m_nodes_->Register("a", 8), PodxErr::kOk);
  ASSERT_EQ(m_nodes_->MarkUnhealthy("a"), PodxErr::kOk);

  m_clock_->Advance(absl::Minutes(2));
  EXPECT_THAT(m_detector_->Sweep(), IsEmpty());
}

TEST_F(ControlLoopTest, ReschedulerPlacesEvictedPodOnSurvivor) {
  ASSERT_EQ(m_nodes_->Register("A", 10), PodxErr::kOk);
  ASSERT_EQ(m_nodes_->Register("B", 4), PodxErr::kOk);
  LaunchOn("p1", 3, "A");

  ASSERT_EQ(m_nodes_->MarkUnhealthy("A"), PodxErr::kOk);
  EXPECT_EQ(AssignedNodeOf("p1"), std::nullopt);

  EXPECT_EQ(m_rescheduler_->Sweep(), 1);
  EXPECT_EQ(AssignedNodeOf("p1"), "B");
  EXPECT_EQ(AvailCpuOf(m_store_.get(), "A"), 10);
  EXPECT_EQ(AvailCpuOf(m_store_.get(), "B"), 1);
  EXPECT_TRUE(TestUtil::ClusterInvariantsHold(m_store_.get()));
}

TEST_F(ControlLoopTest, ReschedulerUsesClusterStrategy) {
  ASSERT_EQ(m_nodes_->Register("small", 4), PodxErr::kOk);
  ASSERT_EQ(m_nodes_->Register("large", 12), PodxErr::kOk);
  ASSERT_EQ(m_pods_->Create("p1", 2), PodxErr::kOk);
  ASSERT_EQ(m_pods_->Create("p2", 2), PodxErr::kOk);

  SetClusterStrategy(PlacementStrategy::kWorstFit);
  EXPECT_EQ(m_rescheduler_->Sweep(), 2);
  EXPECT_EQ(AssignedNodeOf("p1"), "large");
  EXPECT_EQ(AssignedNodeOf("p2"), "large");

  ASSERT_EQ(m_pods_->Create("p3", 2), PodxErr::kOk);
  SetClusterStrategy(PlacementStrategy::kBestFit);
  EXPECT_EQ(m_rescheduler_->Sweep(), 1);
  EXPECT_EQ(AssignedNodeOf("p3"), "small");
}

TEST_F(ControlLoopTest, UnplaceablePodStaysPendingAcrossRuns) {
  ASSERT_EQ(m_nodes_->Register("a", 6), PodxErr::kOk);
  ASSERT_EQ(m_nodes_->Register("b", 6), PodxErr::kOk);
  ASSERT_EQ(m_pods_->Create("big", 10), PodxErr::kOk);
  ASSERT_EQ(m_pods_->Create("small", 1), PodxErr::kOk);

  for (int i = 0; i < 3; i++) {
    // "big" never fits, but it doesn't block the pods after it.
    EXPECT_EQ(m_rescheduler_->Sweep(), i == 0 ? 1 : 0);
  }

  EXPECT_EQ(AssignedNodeOf("big"), std::nullopt);
  EXPECT_THAT(m_pods_->ListPending(),
              ElementsAre(std::pair<std::string, uint32_t>{"big", 10}));
}

TEST_F(ControlLoopTest, NothingPending) {
  ASSERT_EQ(m_nodes_->Register("a", 6), PodxErr::kOk);
  EXPECT_EQ(m_rescheduler_->Sweep(), 0);
}
