#include "internal/sync/refresh_coordinator.hpp"

#include <atomic>

#include "internal/observability/logging.hpp"
#include "internal/sync/staleness_tracker.hpp"

namespace rdsync::sync {

using rdsync::observability::IntField;
using rdsync::observability::StringField;

const char* ToString(CycleStatus status) {
  switch (status) {
    case CycleStatus::kApplied:
      return "applied";
    case CycleStatus::kStale:
      return "stale";
    case CycleStatus::kFailed:
      return "failed";
    case CycleStatus::kAbandoned:
      return "abandoned";
  }
  return "unknown";
}

RefreshCoordinator::RefreshCoordinator(std::shared_ptr<StalenessTracker> tracker, std::shared_ptr<dispatch::Dispatcher> dispatcher,
                                       CycleRunner runner, ScheduleLookup lookup)
    : tracker_(std::move(tracker)), dispatcher_(std::move(dispatcher)), runner_(std::move(runner)), lookup_(std::move(lookup)) {
}

void RefreshCoordinator::Activate() {
  std::lock_guard lock(mutex_);
  active_ = true;
}

bool RefreshCoordinator::IsActive() const {
  std::lock_guard lock(mutex_);
  return active_;
}

void RefreshCoordinator::AbandonAll() {
  std::vector<Waiter> released;
  {
    std::lock_guard lock(mutex_);
    active_ = false;
    for (auto& [_, state] : sources_) {
      // completions of the cycles running now will no longer match
      ++state.generation;
      if (state.phase == Phase::kFetchInFlight) state.phase = Phase::kIdle;
      state.rerun = false;
      for (auto& waiter : state.waiters) released.push_back(std::move(waiter));
      state.waiters.clear();
    }
  }

  if (!released.empty()) {
    RDSYNC_LOG_DEBUG("Refresh waiters abandoned", {IntField("count", static_cast<int64_t>(released.size()))});
  }
  for (auto& waiter : released) Deliver(std::move(waiter.done), false);
}

uint64_t RefreshCoordinator::BeginCycleLocked(SourceState& state) {
  state.phase = Phase::kFetchInFlight;
  state.rerun = false;
  return ++state.generation;
}

bool RefreshCoordinator::RequestCycle(const std::string& source) {
  uint64_t generation = 0;
  {
    std::lock_guard lock(mutex_);
    if (!active_) return false;

    auto& state = sources_[source];
    if (state.phase == Phase::kFetchInFlight) {
      state.rerun = true;
      return false;
    }
    generation = BeginCycleLocked(state);
  }

  Launch(source, generation);
  return true;
}

void RefreshCoordinator::BestEffortRefresh(const rdsync::v1::Schedule& schedule, Completion done) {
  Refresh(schedule, WaitMode::kBestEffort, std::move(done));
}

void RefreshCoordinator::WaitFullRefresh(const rdsync::v1::Schedule& schedule, Completion done) {
  Refresh(schedule, WaitMode::kFull, std::move(done));
}

void RefreshCoordinator::Refresh(const rdsync::v1::Schedule& schedule, WaitMode mode, Completion done) {
  if (tracker_->IsUpToDate(schedule)) {
    Deliver(std::move(done), true);
    return;
  }

  const auto& source           = schedule.remote_data_info().source();
  const bool  requires_refresh = tracker_->RequiresRefresh(schedule);

  uint64_t generation = 0;
  {
    std::unique_lock lock(mutex_);
    if (!active_) {
      lock.unlock();
      Deliver(std::move(done), false);
      return;
    }

    auto& state = sources_[source];
    if (state.phase == Phase::kFetchInFlight) {
      state.waiters.push_back({schedule, mode, false, std::move(done)});
      return;
    }

    if (mode == WaitMode::kBestEffort && !requires_refresh) {
      // newer data is already known locally; no fetch can help
      lock.unlock();
      Deliver(std::move(done), false);
      return;
    }

    state.waiters.push_back({schedule, mode, true, std::move(done)});
    generation = BeginCycleLocked(state);
  }

  Launch(source, generation);
}

void RefreshCoordinator::Launch(const std::string& source, uint64_t generation) {
  RDSYNC_LOG_DEBUG("Refresh cycle started", {StringField("source", source), IntField("generation", static_cast<int64_t>(generation))});

  std::weak_ptr<RefreshCoordinator> weak      = weak_from_this();
  auto                              completed = std::make_shared<std::atomic<bool>>(false);

  CycleDone done = [weak, source, generation, completed](CycleOutcome outcome) {
    if (completed->exchange(true)) return;
    if (auto self = weak.lock()) self->OnCycleComplete(source, generation, std::move(outcome));
  };

  try {
    runner_(source, done);
  } catch (const std::exception& e) {
    RDSYNC_LOG_ERROR("Refresh cycle threw", {StringField("source", source), StringField("error", e.what())});
    done(CycleOutcome::Failed());
  }
}

void RefreshCoordinator::OnCycleComplete(const std::string& source, uint64_t generation, CycleOutcome outcome) {
  std::vector<Waiter> waiters;
  bool                succeeded = false;
  bool                rerun     = false;
  uint64_t            rerun_gen = 0;
  {
    std::lock_guard lock(mutex_);
    auto            it = sources_.find(source);
    if (it == sources_.end()) return;

    auto& state = it->second;
    if (state.generation != generation) return;

    switch (outcome.status) {
      case CycleStatus::kApplied:
      case CycleStatus::kStale:
        state.phase = Phase::kSettled;
        if (outcome.metadata) state.settled = outcome.metadata;
        succeeded = true;
        break;
      case CycleStatus::kFailed:
      case CycleStatus::kAbandoned:
        state.phase = Phase::kIdle;
        break;
    }

    waiters.swap(state.waiters);

    if (state.rerun && active_) {
      rerun_gen = BeginCycleLocked(state);
      rerun     = true;
    }
    state.rerun = false;
  }

  RDSYNC_LOG_DEBUG("Refresh cycle finished", {StringField("source", source), StringField("status", ToString(outcome.status)),
                                              IntField("waiters", static_cast<int64_t>(waiters.size()))});

  std::vector<Waiter> retry;
  for (auto& waiter : waiters) {
    if (tracker_->IsUpToDate(Current(waiter.schedule))) {
      Deliver(std::move(waiter.done), true);
    } else if (succeeded && waiter.mode == WaitMode::kFull && !waiter.fresh) {
      // the joined cycle predates this waiter; insist on one brand-new cycle
      waiter.fresh = true;
      retry.push_back(std::move(waiter));
    } else {
      Deliver(std::move(waiter.done), false);
    }
  }

  if (rerun) Launch(source, rerun_gen);

  if (retry.empty()) return;

  bool     launch    = false;
  uint64_t retry_gen = 0;
  bool     inactive  = false;
  {
    std::lock_guard lock(mutex_);
    if (!active_) {
      inactive = true;
    } else {
      auto& state = sources_[source];
      for (auto& waiter : retry) state.waiters.push_back(std::move(waiter));
      if (state.phase != Phase::kFetchInFlight) {
        retry_gen = BeginCycleLocked(state);
        launch    = true;
      }
    }
  }

  if (inactive) {
    for (auto& waiter : retry) Deliver(std::move(waiter.done), false);
    return;
  }
  if (launch) Launch(source, retry_gen);
}

void RefreshCoordinator::Deliver(Completion done, bool up_to_date) {
  if (!done) return;
  dispatcher_->Dispatch([done = std::move(done), up_to_date]() { done(up_to_date); });
}

rdsync::v1::Schedule RefreshCoordinator::Current(const rdsync::v1::Schedule& schedule) const {
  if (!lookup_ || schedule.id().empty()) return schedule;

  auto found = lookup_(schedule.id());
  if (!found || found->remote_data_info().source() != schedule.remote_data_info().source()) return schedule;
  return std::move(*found);
}

RefreshCoordinator::Phase RefreshCoordinator::PhaseOf(const std::string& source) const {
  std::lock_guard lock(mutex_);
  auto            it = sources_.find(source);
  return it == sources_.end() ? Phase::kIdle : it->second.phase;
}

std::optional<rdsync::v1::RemoteDataMetadata> RefreshCoordinator::SettledMetadata(const std::string& source) const {
  std::lock_guard lock(mutex_);
  auto            it = sources_.find(source);
  if (it == sources_.end()) return std::nullopt;
  return it->second.settled;
}

} // namespace rdsync::sync
