#include "worker_pool_dispatcher.hpp"

#include "internal/observability/logging.hpp"

namespace rdsync::dispatch {

WorkerPoolDispatcher::WorkerPoolDispatcher(std::size_t threads)
    : threads_(threads == 0 ? 1 : threads), queue_(std::make_shared<TaskQueue>()) {
}

WorkerPoolDispatcher::~WorkerPoolDispatcher() {
  Stop();
}

void WorkerPoolDispatcher::Start() {
  if (running_.exchange(true)) return;

  workers_.reserve(threads_);
  for (std::size_t i = 0; i < threads_; ++i) {
    workers_.emplace_back(&WorkerPoolDispatcher::Run, queue_);
  }
}

void WorkerPoolDispatcher::Stop() {
  queue_->Shutdown();
  running_ = false;
  for (auto& worker : workers_) {
    if (!worker.joinable()) continue;
    if (worker.get_id() == std::this_thread::get_id()) {
      worker.detach();
    } else {
      worker.join();
    }
  }
  workers_.clear();
}

void WorkerPoolDispatcher::Dispatch(Task task) {
  if (!queue_->Enqueue(std::move(task))) {
    RDSYNC_LOG_WARN("Dispatcher stopped, task dropped");
  }
}

void WorkerPoolDispatcher::Run(std::shared_ptr<TaskQueue> queue) {
  while (true) {
    auto task = queue->Dequeue();
    if (!task) break;

    try {
      (*task)();
    } catch (const std::exception& e) {
      RDSYNC_LOG_ERROR("Dispatched task failed", {rdsync::observability::StringField("error", e.what())});
    }
  }
}

} // namespace rdsync::dispatch
