#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

#include "dispatcher.hpp"

namespace rdsync::dispatch {

/*
  Thread-safe blocking queue for dispatcher workers.
*/
class TaskQueue {
 public:
  // false once shut down; the task is dropped
  bool Enqueue(Task task);

  // blocking wait; nullopt after Shutdown() once drained
  std::optional<Task> Dequeue();

  void Shutdown();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<Task>        queue_;
  bool                    shutdown_ = false;
};

} // namespace rdsync::dispatch
