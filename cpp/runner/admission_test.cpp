#include "runner/admission.hpp"

#include <vector>

#include <kj/async.h>

#include "gtest/gtest.h"

namespace {

using runner::Admission;

// A task that starts when admitted and completes when fulfilled.
struct Task {
  bool started = false;
  kj::PromiseFulfillerPair<int> pf = kj::newPromiseAndFulfiller<int>();

  kj::Promise<int> Schedule(Admission* admission) {
    return admission->Schedule<int>([this]() {
      started = true;
      return kj::mv(pf.promise);
    });
  }
};

// NOLINTNEXTLINE
TEST(AdmissionTest, RunsImmediately) {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  Admission admission(1, 1);
  int value = admission.Schedule<int>([]() { return kj::Promise<int>(42); })
                  .wait(waitScope);
  EXPECT_EQ(value, 42);
  EXPECT_EQ(admission.Running(), 0u);
  EXPECT_EQ(admission.Waiting(), 0u);
}

// NOLINTNEXTLINE
TEST(AdmissionTest, QueuesOverLimit) {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  Admission admission(1, 10);
  Task a, b;
  auto pa = a.Schedule(&admission);
  auto pb = b.Schedule(&admission);
  waitScope.poll();
  EXPECT_TRUE(a.started);
  EXPECT_FALSE(b.started);
  EXPECT_EQ(admission.Running(), 1u);
  EXPECT_EQ(admission.Waiting(), 1u);

  a.pf.fulfiller->fulfill(1);
  EXPECT_EQ(pa.wait(waitScope), 1);
  waitScope.poll();
  EXPECT_TRUE(b.started);
  EXPECT_EQ(admission.Running(), 1u);
  EXPECT_EQ(admission.Waiting(), 0u);

  b.pf.fulfiller->fulfill(2);
  EXPECT_EQ(pb.wait(waitScope), 2);
  EXPECT_EQ(admission.Running(), 0u);
}

// NOLINTNEXTLINE
TEST(AdmissionTest, FifoOrder) {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  Admission admission(1, 10);
  Task a, b, c;
  auto pa = a.Schedule(&admission);
  auto pb = b.Schedule(&admission);
  auto pc = c.Schedule(&admission);
  waitScope.poll();
  a.pf.fulfiller->fulfill(1);
  pa.wait(waitScope);
  waitScope.poll();
  EXPECT_TRUE(b.started);
  EXPECT_FALSE(c.started);
}

// NOLINTNEXTLINE
TEST(AdmissionTest, RejectsWhenQueueIsFull) {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  Admission admission(1, 1);
  Task a, b, c;
  auto pa = a.Schedule(&admission);
  auto pb = b.Schedule(&admission);
  auto pc = c.Schedule(&admission);
  waitScope.poll();
  EXPECT_FALSE(c.started);
  kj::Maybe<kj::Exception> error;
  pc.then([](int) {}, [&](kj::Exception e) { error = kj::mv(e); })
      .wait(waitScope);
  KJ_IF_MAYBE(e, error) {
    EXPECT_EQ(e->getType(), kj::Exception::Type::OVERLOADED);
  }
  else {
    ADD_FAILURE() << "not rejected";
  }
}

// NOLINTNEXTLINE
TEST(AdmissionTest, DroppedWaiterLeavesQueue) {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  Admission admission(1, 1);
  Task a, b, c;
  auto pa = a.Schedule(&admission);
  {
    auto pb = b.Schedule(&admission);
    waitScope.poll();
  }
  auto pc = c.Schedule(&admission);
  a.pf.fulfiller->fulfill(1);
  pa.wait(waitScope);
  waitScope.poll();
  EXPECT_FALSE(b.started);
  EXPECT_TRUE(c.started);
  EXPECT_EQ(admission.Running(), 1u);
}

// NOLINTNEXTLINE
TEST(AdmissionTest, DroppedTaskFreesSlot) {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  Admission admission(1, 1);
  Task a, b;
  auto pb = kj::Promise<int>(0);
  {
    auto pa = a.Schedule(&admission);
    pb = b.Schedule(&admission);
    waitScope.poll();
    EXPECT_TRUE(a.started);
  }
  waitScope.poll();
  EXPECT_TRUE(b.started);
  EXPECT_EQ(admission.Running(), 1u);
}

// NOLINTNEXTLINE
TEST(AdmissionTest, FailingTaskFreesSlot) {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  Admission admission(1, 1);
  auto failing = admission.Schedule<int>([]() -> kj::Promise<int> {
    KJ_FAIL_REQUIRE("cannot start");
  });
  EXPECT_ANY_THROW(failing.wait(waitScope));
  EXPECT_EQ(admission.Running(), 0u);
  EXPECT_EQ(
      admission.Schedule<int>([]() { return kj::Promise<int>(3); })
          .wait(waitScope),
      3);
}

// NOLINTNEXTLINE
TEST(AdmissionTest, Unbounded) {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  Admission admission(0, 0);
  std::vector<Task> tasks(100);
  std::vector<kj::Promise<int>> promises;
  for (Task& task : tasks) promises.push_back(task.Schedule(&admission));
  waitScope.poll();
  for (const Task& task : tasks) EXPECT_TRUE(task.started);
  EXPECT_EQ(admission.Running(), 100u);
}

}  // namespace
