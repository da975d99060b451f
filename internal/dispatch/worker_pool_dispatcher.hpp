#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include "dispatcher.hpp"
#include "task_queue.hpp"

namespace rdsync::dispatch {

/*
  Background workers draining a shared TaskQueue.

  With one thread, tasks run in dispatch order.
*/
class WorkerPoolDispatcher final : public Dispatcher {
 public:
  explicit WorkerPoolDispatcher(std::size_t threads);
  ~WorkerPoolDispatcher() override;

  WorkerPoolDispatcher(const WorkerPoolDispatcher&)            = delete;
  WorkerPoolDispatcher& operator=(const WorkerPoolDispatcher&) = delete;

  void Start();

  // Runs the queued tasks, then joins the workers.
  void Stop();

  void Dispatch(Task task) override;

 private:
  // Owns its queue reference; a worker may outlive a Stop() it ran itself.
  static void Run(std::shared_ptr<TaskQueue> queue);

  std::size_t                threads_;
  std::shared_ptr<TaskQueue> queue_;
  std::vector<std::thread>   workers_;
  std::atomic<bool>          running_{false};
};

} // namespace rdsync::dispatch
