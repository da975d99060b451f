#include <atomic>
#include <memory>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "internal/dispatch/task_queue.hpp"
#include "internal/dispatch/worker_pool_dispatcher.hpp"

namespace {

using rdsync::dispatch::InlineDispatcher;
using rdsync::dispatch::TaskQueue;
using rdsync::dispatch::WorkerPoolDispatcher;

void TestInlineRunsImmediately() {
  InlineDispatcher dispatcher;
  int              ran = 0;
  dispatcher.Dispatch([&ran] { ++ran; });
  assert(ran == 1);
}

void TestQueueRejectsAfterShutdown() {
  TaskQueue queue;
  assert(queue.Enqueue([] {}));
  queue.Shutdown();
  assert(!queue.Enqueue([] {}));

  // queued work is still handed out after shutdown
  assert(queue.Dequeue().has_value());
  assert(!queue.Dequeue().has_value());
}

void TestSingleWorkerKeepsOrder() {
  WorkerPoolDispatcher dispatcher(1);
  dispatcher.Start();

  std::mutex       mutex;
  std::vector<int> order;
  for (int i = 0; i < 100; ++i) {
    dispatcher.Dispatch([&, i] {
      std::lock_guard lock(mutex);
      order.push_back(i);
    });
  }
  dispatcher.Stop();

  assert(order.size() == 100);
  for (int i = 0; i < 100; ++i) assert(order[i] == i);
}

void TestPoolRunsEverythingAndSurvivesThrowingTasks() {
  WorkerPoolDispatcher dispatcher(4);
  dispatcher.Start();

  std::atomic<int> ran{0};
  for (int i = 0; i < 200; ++i) {
    dispatcher.Dispatch([&ran, i] {
      ++ran;
      if (i % 50 == 0) throw std::runtime_error("task failed");
    });
  }
  dispatcher.Stop();

  assert(ran == 200);
}

void TestDispatchAfterStopIsDropped() {
  WorkerPoolDispatcher dispatcher(2);
  dispatcher.Start();
  dispatcher.Stop();

  bool ran = false;
  dispatcher.Dispatch([&ran] { ran = true; });
  std::this_thread::sleep_for(std::chrono::milliseconds(10));
  assert(!ran);
}

void TestStopFromWorkerDoesNotDeadlock() {
  auto dispatcher = std::make_shared<WorkerPoolDispatcher>(1);
  dispatcher->Start();

  std::mutex              mutex;
  std::condition_variable cv;
  bool                    stopped = false;

  dispatcher->Dispatch([&] {
    dispatcher->Stop();
    std::lock_guard lock(mutex);
    stopped = true;
    cv.notify_one();
  });

  std::unique_lock lock(mutex);
  const bool       finished = cv.wait_for(lock, std::chrono::seconds(5), [&] { return stopped; });
  assert(finished);
}

} // namespace

int main() {
  TestInlineRunsImmediately();
  TestQueueRejectsAfterShutdown();
  TestSingleWorkerKeepsOrder();
  TestPoolRunsEverythingAndSurvivesThrowingTasks();
  TestDispatchAfterStopIsDropped();
  TestStopFromWorkerDoesNotDeadlock();

  std::cout << "rdsync_unit_dispatcher: pass\n";
  return 0;
}
