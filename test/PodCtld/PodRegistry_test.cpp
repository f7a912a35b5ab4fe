#include "PodRegistry.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>

#include "NodeRegistry.h"
#include "SharedTestImpl/CtldTestUtil.h"

using namespace PodCtld;
using testing::ElementsAre;
using testing::IsEmpty;

class PodRegistryTest : public ::testing::Test {
 public:
  void SetUp() override {
    m_store_ = std::make_unique<StateStoreInMemoryImpl>();
    m_clock_ = std::make_unique<ManualClock>();
    m_nodes_ = std::make_unique<NodeRegistry>(m_store_.get(), m_clock_.get());
    m_pods_ = std::make_unique<PodRegistry>(m_store_.get(), m_clock_.get(),
                                            absl::Seconds(30));
  }

  std::unique_ptr<StateStoreInMemoryImpl> m_store_;
  std::unique_ptr<ManualClock> m_clock_;
  std::unique_ptr<NodeRegistry> m_nodes_;
  std::unique_ptr<PodRegistry> m_pods_;
};

TEST_F(PodRegistryTest, AdmissionRejectsMoreThanClusterCapacity) {
  ASSERT_EQ(m_nodes_->Register("a", 5), PodxErr::kOk);
  ASSERT_EQ(m_nodes_->Register("b", 5), PodxErr::kOk);

  EXPECT_EQ(m_pods_->Create("big", 11),
            PodxErr::kInsufficientClusterCapacity);

  PodRecord pod;
  EXPECT_FALSE(m_pods_->Get("big", &pod));
  EXPECT_THAT(m_pods_->List(), IsEmpty());
}

TEST_F(PodRegistryTest, AdmissionUsesClusterWideSum) {
  ASSERT_EQ(m_nodes_->Register("a", 5), PodxErr::kOk);
  ASSERT_EQ(m_nodes_->Register("b", 5), PodxErr::kOk);

  // No single node can host it, but admission only looks at the sum.
  ASSERT_EQ(m_pods_->Create("p", 10), PodxErr::kOk);

  PodRecord pod;
  ASSERT_TRUE(m_pods_->Get("p", &pod));
  EXPECT_EQ(pod.cpu_request, 10);
  EXPECT_EQ(pod.status, PodStatus::kPending);
  EXPECT_FALSE(pod.assigned_node.has_value());
}

TEST_F(PodRegistryTest, AdmissionIgnoresStaleNodes) {
  ASSERT_EQ(m_nodes_->Register("old", 8), PodxErr::kOk);
  m_clock_->Advance(absl::Seconds(20));
  ASSERT_EQ(m_nodes_->Register("new", 2), PodxErr::kOk);

  // "old" is exactly at the edge of the window and still counts.
  m_clock_->Advance(absl::Seconds(10));
  EXPECT_EQ(m_pods_->Create("p1", 10), PodxErr::kOk);

  m_clock_->Advance(absl::Seconds(1));
  EXPECT_EQ(m_pods_->Create("p2", 3), PodxErr::kInsufficientClusterCapacity);
  EXPECT_EQ(m_pods_->Create("p3", 2), PodxErr::kOk);
}

TEST_F(PodRegistryTest, AdmissionIgnoresRecordedStatus) {
  ASSERT_EQ(m_nodes_->Register("a", 4), PodxErr::kOk);
  ASSERT_EQ(m_nodes_->MarkUnhealthy("a"), PodxErr::kOk);

  // Recent heartbeat is all that matters for admission.
  EXPECT_EQ(m_pods_->Create("p", 4), PodxErr::kOk);
}

TEST_F(PodRegistryTest, DuplicatePodIsRejectedFirst) {
  ASSERT_EQ(m_nodes_->Register("a", 4), PodxErr::kOk);
  ASSERT_EQ(m_pods_->Create("p", 2), PodxErr::kOk);

  // Duplicate wins over the admission failure.
  EXPECT_EQ(m_pods_->Create("p", 100), PodxErr::kDuplicatePod);

  PodRecord pod;
  ASSERT_TRUE(m_pods_->Get("p", &pod));
  EXPECT_EQ(pod.cpu_request, 2);
  EXPECT_EQ(TestUtil::AvailCpuOf(m_store_.get(), "a"), 4);
}

TEST_F(PodRegistryTest, ListPendingInCreationOrder) {
  ASSERT_EQ(m_nodes_->Register("a", 16), PodxErr::kOk);
  ASSERT_EQ(m_pods_->Create("z", 1), PodxErr::kOk);
  ASSERT_EQ(m_pods_->Create("x", 2), PodxErr::kOk);
  ASSERT_EQ(m_pods_->Create("y", 3), PodxErr::kOk);

  {
    auto state = m_store_->GetClusterStatePtr();
    PodRecord* x = state->pods.Get("x");
    x->assigned_node = "a";
    x->status = PodStatus::kRunning;
    state->nodes.Get("a")->avail_cpu -= x->cpu_request;
  }

  EXPECT_THAT(m_pods_->ListPending(),
              ElementsAre(std::pair<std::string, uint32_t>{"z", 1},
                          std::pair<std::string, uint32_t>{"y", 3}));

  std::vector<std::string> ids;
  for (auto&& pod : m_pods_->List()) ids.emplace_back(pod.id);
  EXPECT_THAT(ids, ElementsAre("z", "x", "y"));
  EXPECT_TRUE(TestUtil::ClusterInvariantsHold(m_store_.get()));
}
