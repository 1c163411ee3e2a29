#include <atomic>
#include <chrono>
#include <condition_variable>
#include <fcntl.h>
#include <memory>
#include <mutex>
#include <thread>
#include <unistd.h>
#include <vector>

#include <gtest/gtest.h>

#include "conduit/event/event_loop.h"
#include "conduit/event/libevent_dispatcher.h"
#include "conduit/event/worker_pool.h"

using namespace conduit::event;
using namespace std::chrono_literals;

class EventLoopTest : public ::testing::Test {
 protected:
  void SetUp() override {
    factory_ = createLibeventDispatcherFactory();
    dispatcher_ = factory_->createDispatcher("test");
  }

  void TearDown() override {
    dispatcher_.reset();
    factory_.reset();
  }

  std::thread runInBackground(RunType type = RunType::RunUntilExit) {
    return std::thread([this, type]() { dispatcher_->run(type); });
  }

  // Turn the loop until pred holds or the timeout passes
  bool runUntil(const std::function<bool()>& pred,
                std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
      if (std::chrono::steady_clock::now() > deadline) {
        return false;
      }
      dispatcher_->run(RunType::NonBlock);
    }
    return true;
  }

  DispatcherFactoryPtr factory_;
  DispatcherPtr dispatcher_;
};

TEST_F(EventLoopTest, BasicProperties) {
  EXPECT_EQ("test", dispatcher_->name());
  EXPECT_FALSE(dispatcher_->isThreadSafe());  // Not in dispatcher thread yet

  dispatcher_->run(RunType::NonBlock);
  EXPECT_TRUE(dispatcher_->isThreadSafe());
}

TEST_F(EventLoopTest, PostCallbackRunsOnDispatcherThread) {
  std::atomic<bool> called{false};
  std::atomic<bool> on_loop_thread{false};
  std::mutex mutex;
  std::condition_variable cv;

  dispatcher_->post([&]() {
    on_loop_thread = dispatcher_->isThreadSafe();
    called = true;
    cv.notify_one();
  });

  auto thread = runInBackground();

  {
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait_for(lock, 2s, [&]() { return called.load(); });
  }

  dispatcher_->exit();
  thread.join();

  EXPECT_TRUE(called);
  EXPECT_TRUE(on_loop_thread);
  EXPECT_FALSE(dispatcher_->isThreadSafe());
}

TEST_F(EventLoopTest, PostsRunInOrder) {
  std::vector<int> order;
  for (int i = 0; i < 5; ++i) {
    dispatcher_->post([&order, i]() { order.push_back(i); });
  }
  ASSERT_TRUE(runUntil([&]() { return order.size() == 5; }));
  EXPECT_EQ((std::vector<int>{0, 1, 2, 3, 4}), order);
}

TEST_F(EventLoopTest, TimerFiresOncePerArm) {
  int fired = 0;
  auto timer = dispatcher_->createTimer([&]() { ++fired; });
  timer->enableTimer(10ms);

  ASSERT_TRUE(runUntil([&]() { return fired > 0; }));
  // Re-arming after it fired schedules it again
  timer->enableTimer(1ms);
  ASSERT_TRUE(runUntil([&]() { return fired > 1; }));

  dispatcher_->run(RunType::NonBlock);
  EXPECT_EQ(2, fired);
}

TEST_F(EventLoopTest, DisabledTimerNeverFires) {
  bool fired = false;
  auto timer = dispatcher_->createTimer([&]() { fired = true; });
  timer->enableTimer(5ms);
  timer->disableTimer();

  EXPECT_FALSE(runUntil([&]() { return fired; }, 50ms));
}

struct DeleteFlag : public DeferredDeletable {
  explicit DeleteFlag(bool& deleted) : deleted_(deleted) {}
  ~DeleteFlag() override { deleted_ = true; }
  bool& deleted_;
};

TEST_F(EventLoopTest, DeferredDeleteRunsOnLaterIteration) {
  dispatcher_->run(RunType::NonBlock);
  bool first = false;
  bool second = false;
  dispatcher_->deferredDelete(std::make_unique<DeleteFlag>(first));
  dispatcher_->deferredDelete(std::make_unique<DeleteFlag>(second));
  EXPECT_FALSE(first);

  ASSERT_TRUE(runUntil([&]() { return first && second; }));

  // Scheduling again after a pass works
  bool third = false;
  dispatcher_->deferredDelete(std::make_unique<DeleteFlag>(third));
  EXPECT_TRUE(runUntil([&]() { return third; }));
}

TEST_F(EventLoopTest, PendingDeferredDeletesRunOnDestruction) {
  bool deleted = false;
  dispatcher_->deferredDelete(std::make_unique<DeleteFlag>(deleted));
  dispatcher_.reset();
  EXPECT_TRUE(deleted);
}

TEST_F(EventLoopTest, FileEventReportsReadable) {
  int fds[2];
  ASSERT_EQ(0, pipe(fds));
  fcntl(fds[0], F_SETFL, O_NONBLOCK);

  uint32_t seen = 0;
  auto file_event = dispatcher_->createFileEvent(
      fds[0], [&](uint32_t events) { seen |= events; },
      static_cast<uint32_t>(FileReadyType::Read));

  char byte = 'x';
  ASSERT_EQ(1, ::write(fds[1], &byte, 1));

  EXPECT_TRUE(runUntil([&]() {
    return (seen & static_cast<uint32_t>(FileReadyType::Read)) != 0;
  }));

  file_event.reset();
  close(fds[0]);
  close(fds[1]);
}

TEST_F(EventLoopTest, ExitBeforeRunStillStopsLoop) {
  dispatcher_->exit();
  auto thread = runInBackground();
  thread.join();
  SUCCEED();
}

TEST(WorkerPoolTest, WorkersRunOwnDispatchers) {
  auto factory = createLibeventDispatcherFactory();
  WorkerPool pool(3, *factory);
  ASSERT_EQ(3u, pool.size());
  pool.start();

  std::mutex mutex;
  std::condition_variable cv;
  int done = 0;
  std::vector<std::thread::id> ids(3);
  for (size_t i = 0; i < pool.size(); ++i) {
    Dispatcher& dispatcher = pool.getWorker(i).dispatcher();
    dispatcher.post([&, i]() {
      std::lock_guard<std::mutex> lock(mutex);
      ids[i] = std::this_thread::get_id();
      ++done;
      cv.notify_one();
    });
  }

  {
    std::unique_lock<std::mutex> lock(mutex);
    ASSERT_TRUE(cv.wait_for(lock, 2s, [&]() { return done == 3; }));
  }
  pool.stop();

  EXPECT_NE(ids[0], ids[1]);
  EXPECT_NE(ids[1], ids[2]);
  EXPECT_NE(std::this_thread::get_id(), ids[0]);
  EXPECT_FALSE(pool.getWorker(0).running());
}

TEST(WorkerPoolTest, NextDispatcherRoundRobin) {
  auto factory = createLibeventDispatcherFactory();
  WorkerPool pool(2, *factory);

  Dispatcher* first = &pool.nextDispatcher();
  Dispatcher* second = &pool.nextDispatcher();
  Dispatcher* third = &pool.nextDispatcher();

  EXPECT_NE(first, second);
  EXPECT_EQ(first, third);
}

TEST(WorkerPoolTest, ZeroWorkersRejected) {
  auto factory = createLibeventDispatcherFactory();
  EXPECT_THROW(WorkerPool(0, *factory), std::invalid_argument);
}
