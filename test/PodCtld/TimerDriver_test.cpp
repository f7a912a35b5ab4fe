#include "TimerDriver.h"

#include <fmt/format.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace PodCtld;
using testing::ElementsAre;
using testing::MockFunction;

class VirtualTimerDriverTest : public ::testing::Test {
 public:
  void SetUp() override {
    m_clock_ = std::make_unique<ManualClock>();
    m_driver_ = std::make_unique<VirtualTimerDriver>(m_clock_.get());
  }

  absl::Duration Elapsed() { return m_clock_->Now() - absl::UnixEpoch(); }

  std::unique_ptr<ManualClock> m_clock_;
  std::unique_ptr<VirtualTimerDriver> m_driver_;
};

TEST_F(VirtualTimerDriverTest, FiresOncePerInterval) {
  MockFunction<void()> task;
  m_driver_->AddPeriodicTask("task", absl::Seconds(10), task.AsStdFunction());
  ASSERT_EQ(m_driver_->Start(), PodxErr::kOk);

  EXPECT_CALL(task, Call()).Times(0);
  EXPECT_EQ(m_driver_->Advance(absl::Seconds(9)), 0);
  testing::Mock::VerifyAndClearExpectations(&task);

  EXPECT_CALL(task, Call()).Times(1);
  EXPECT_EQ(m_driver_->Advance(absl::Seconds(1)), 1);
  testing::Mock::VerifyAndClearExpectations(&task);

  EXPECT_CALL(task, Call()).Times(3);
  EXPECT_EQ(m_driver_->Advance(absl::Seconds(35)), 3);
  EXPECT_EQ(Elapsed(), absl::Seconds(45));
}

TEST_F(VirtualTimerDriverTest, NothingFiresBeforeStart) {
  MockFunction<void()> task;
  m_driver_->AddPeriodicTask("task", absl::Seconds(1), task.AsStdFunction());

  EXPECT_CALL(task, Call()).Times(0);
  EXPECT_EQ(m_driver_->Advance(absl::Seconds(5)), 0);
  EXPECT_EQ(Elapsed(), absl::Seconds(5));
}

TEST_F(VirtualTimerDriverTest, TasksFireInDeadlineOrderAtTheirDeadline) {
  std::vector<std::string> log;
  auto record = [&](const char* name) {
    return [&, name] {
      log.emplace_back(fmt::format(
          "{}@{}", name, absl::ToInt64Seconds(Elapsed())));
    };
  };

  m_driver_->AddPeriodicTask("slow", absl::Seconds(15), record("slow"));
  m_driver_->AddPeriodicTask("fast", absl::Seconds(5), record("fast"));
  m_driver_->AddPeriodicTask("mid", absl::Seconds(10), record("mid"));
  ASSERT_EQ(m_driver_->Start(), PodxErr::kOk);

  m_driver_->Advance(absl::Seconds(15));

  // Simultaneous deadlines fire in registration order.
  EXPECT_THAT(log, ElementsAre("fast@5", "fast@10", "mid@10", "slow@15",
                               "fast@15"));
}

TEST_F(VirtualTimerDriverTest, ThrowingTaskKeepsRunning) {
  int runs = 0;
  m_driver_->AddPeriodicTask("flaky", absl::Seconds(1), [&] {
    runs++;
    throw std::runtime_error("boom");
  });
  ASSERT_EQ(m_driver_->Start(), PodxErr::kOk);

  EXPECT_EQ(m_driver_->Advance(absl::Seconds(3)), 3);
  EXPECT_EQ(runs, 3);
}

TEST_F(VirtualTimerDriverTest, StopHaltsFiring) {
  MockFunction<void()> task;
  m_driver_->AddPeriodicTask("task", absl::Seconds(1), task.AsStdFunction());
  ASSERT_EQ(m_driver_->Start(), PodxErr::kOk);

  EXPECT_CALL(task, Call()).Times(2);
  m_driver_->Advance(absl::Seconds(2));
  m_driver_->Stop();
  EXPECT_EQ(m_driver_->Advance(absl::Seconds(10)), 0);
}

TEST(LibEventTimerDriver, StartAndStop) {
  MockFunction<void()> task;
  EXPECT_CALL(task, Call()).Times(0);

  LibEventTimerDriver driver;
  driver.AddPeriodicTask("hourly", absl::Hours(1), task.AsStdFunction());

  ASSERT_EQ(driver.Start(), PodxErr::kOk);
  driver.Stop();
  // A second Stop() is a no-op.
  driver.Stop();
}

TEST(LibEventTimerDriver, ThrowingTaskKeepsFiring) {
  std::atomic_int runs{0};

  LibEventTimerDriver driver;
  driver.AddPeriodicTask("flaky", absl::Milliseconds(10), [&] {
    runs++;
    throw std::runtime_error("boom");
  });

  ASSERT_EQ(driver.Start(), PodxErr::kOk);
  std::this_thread::sleep_for(std::chrono::milliseconds(150));
  driver.Stop();

  int fired = runs.load();
  EXPECT_GE(fired, 2);

  // Nothing fires once the loop has exited.
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  EXPECT_EQ(runs.load(), fired);
}

TEST(LibEventTimerDriver, DestroyWithoutStart) {
  LibEventTimerDriver driver;
  driver.AddPeriodicTask("never", absl::Seconds(1), [] {});
}
