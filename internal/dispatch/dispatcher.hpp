#pragma once

#include <functional>

namespace rdsync::dispatch {

using Task = std::function<void()>;

/*
  Execution context for continuations.

  The sync core never assumes which thread a task runs on; it only requires
  that every dispatched task eventually runs exactly once (or is dropped at
  shutdown).
*/
class Dispatcher {
 public:
  virtual ~Dispatcher() = default;

  virtual void Dispatch(Task task) = 0;
};

// Runs the task on the calling thread before returning.
class InlineDispatcher final : public Dispatcher {
 public:
  void Dispatch(Task task) override {
    task();
  }
};

} // namespace rdsync::dispatch
