#include "internal/sync/refresh_coordinator.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include "internal/db/memory/memory_preference_store.hpp"
#include "internal/sync/staleness_tracker.hpp"
#include "internal/sync/version_store.hpp"
#include "sync_test_support.hpp"

namespace {

using rdsync::sync::CycleOutcome;
using rdsync::sync::RefreshCoordinator;
using rdsync::sync::StalenessTracker;
using rdsync::sync::VersionStore;
using rdsync::testing::MakeMetadata;
using rdsync::testing::MakeRemoteSchedule;
using rdsync::testing::Outcome;

using Phase = RefreshCoordinator::Phase;

// Records started cycles; the test decides when and how they finish.
class ScriptedRunner {
 public:
  RefreshCoordinator::CycleRunner Runner() {
    return [this](const std::string& source, RefreshCoordinator::CycleDone done) {
      std::lock_guard lock(mutex_);
      if (throw_next_) {
        throw_next_ = false;
        throw std::runtime_error("runner exploded");
      }
      cycles_.push_back({source, std::move(done)});
    };
  }

  std::size_t Started() {
    std::lock_guard lock(mutex_);
    return cycles_.size();
  }

  void Finish(std::size_t index, CycleOutcome outcome) {
    RefreshCoordinator::CycleDone done;
    {
      std::lock_guard lock(mutex_);
      done = cycles_.at(index).second;
    }
    done(std::move(outcome));
  }

  void ThrowNext() {
    std::lock_guard lock(mutex_);
    throw_next_ = true;
  }

 private:
  std::mutex                                                         mutex_;
  std::vector<std::pair<std::string, RefreshCoordinator::CycleDone>> cycles_;
  bool                                                               throw_next_ = false;
};

struct Fixture {
  std::shared_ptr<VersionStore>       versions = std::make_shared<VersionStore>(std::make_shared<rdsync::db::memory::MemoryPreferenceStore>());
  std::shared_ptr<StalenessTracker>   tracker  = std::make_shared<StalenessTracker>(versions);
  ScriptedRunner                      runner;
  std::shared_ptr<RefreshCoordinator> coordinator =
      std::make_shared<RefreshCoordinator>(tracker, std::make_shared<rdsync::dispatch::InlineDispatcher>(), runner.Runner());

  Fixture() {
    coordinator->Activate();
  }

  // Simulates a cycle that applied `seconds` for "app".
  void Apply(std::size_t index, int64_t seconds) {
    assert(versions->Commit("app", MakeMetadata("app", seconds), {"s"}));
    runner.Finish(index, CycleOutcome::Applied(MakeMetadata("app", seconds)));
  }
};

void TestUpToDateScheduleNeedsNoCycle() {
  Fixture f;
  assert(f.versions->Commit("app", MakeMetadata("app", 100), {"s"}));

  Outcome best;
  Outcome full;
  f.coordinator->BestEffortRefresh(MakeRemoteSchedule("s", "app", 100), best.Callback());
  f.coordinator->WaitFullRefresh(MakeRemoteSchedule("s", "app", 100), full.Callback());

  assert(best.called && best.up_to_date);
  assert(full.called && full.up_to_date);
  assert(f.runner.Started() == 0);
}

void TestInactiveCoordinatorResolvesImmediately() {
  Fixture f;
  f.coordinator->AbandonAll();

  Outcome outcome;
  f.coordinator->WaitFullRefresh(MakeRemoteSchedule("s", "app", 100), outcome.Callback());

  assert(outcome.called && !outcome.up_to_date);
  assert(f.runner.Started() == 0);
  assert(!f.coordinator->RequestCycle("app"));
}

void TestConcurrentCallersShareOneFetch() {
  Fixture f;
  const auto schedule = MakeRemoteSchedule("s", "app", 100);

  constexpr int            kCallers = 16;
  std::vector<Outcome>     outcomes(kCallers);
  std::vector<std::thread> threads;
  for (int i = 0; i < kCallers; ++i) {
    threads.emplace_back([&, i] { f.coordinator->BestEffortRefresh(schedule, outcomes[i].Callback()); });
  }
  for (auto& thread : threads) thread.join();

  assert(f.runner.Started() == 1);
  assert(f.coordinator->PhaseOf("app") == Phase::kFetchInFlight);
  for (const auto& outcome : outcomes) assert(!outcome.called);

  f.Apply(0, 100);

  assert(f.coordinator->PhaseOf("app") == Phase::kSettled);
  assert(f.coordinator->SettledMetadata("app")->last_modified().seconds() == 100);
  for (const auto& outcome : outcomes) {
    assert(outcome.calls == 1);
    assert(outcome.up_to_date);
  }
}

void TestFailedFetchReturnsToIdle() {
  Fixture f;
  const auto schedule = MakeRemoteSchedule("s", "app", 100);

  Outcome first;
  f.coordinator->WaitFullRefresh(schedule, first.Callback());
  f.runner.Finish(0, CycleOutcome::Failed());

  assert(first.called && !first.up_to_date);
  assert(f.coordinator->PhaseOf("app") == Phase::kIdle);

  // nothing was settled, so the next call fetches again
  Outcome second;
  f.coordinator->BestEffortRefresh(schedule, second.Callback());
  assert(f.runner.Started() == 2);
  f.Apply(1, 100);
  assert(second.called && second.up_to_date);
}

void TestAbandonReleasesWaiters() {
  Fixture f;
  const auto schedule = MakeRemoteSchedule("s", "app", 100);

  Outcome best;
  Outcome full;
  f.coordinator->BestEffortRefresh(schedule, best.Callback());
  f.coordinator->WaitFullRefresh(schedule, full.Callback());

  f.coordinator->AbandonAll();
  assert(best.called && !best.up_to_date);
  assert(full.called && !full.up_to_date);
  assert(f.coordinator->PhaseOf("app") == Phase::kIdle);

  // the abandoned cycle finishing late changes nothing
  f.Apply(0, 100);
  assert(best.calls == 1 && full.calls == 1);
  assert(f.coordinator->PhaseOf("app") == Phase::kIdle);
}

void TestWaitFullJoiningOldCycleGetsFreshOne() {
  Fixture f;
  const auto schedule = MakeRemoteSchedule("s", "app", 200);

  Outcome best;
  Outcome full;
  f.coordinator->BestEffortRefresh(schedule, best.Callback());
  f.coordinator->WaitFullRefresh(schedule, full.Callback());
  assert(f.runner.Started() == 1);

  // the joined cycle only had older data
  f.Apply(0, 100);
  assert(best.called && !best.up_to_date);
  assert(!full.called);
  assert(f.runner.Started() == 2);
  assert(f.coordinator->PhaseOf("app") == Phase::kFetchInFlight);

  f.Apply(1, 200);
  assert(full.called && full.up_to_date);
}

void TestWaitFullOwnCycleIsNotRetried() {
  Fixture f;

  Outcome full;
  f.coordinator->WaitFullRefresh(MakeRemoteSchedule("s", "app", 200), full.Callback());
  f.Apply(0, 100);

  assert(full.called && !full.up_to_date);
  assert(f.runner.Started() == 1);
}

void TestBestEffortSkipsFetchWhenNewerDataIsKnown() {
  Fixture f;
  assert(f.versions->Commit("app", MakeMetadata("app", 300), {"s"}));

  Outcome best;
  f.coordinator->BestEffortRefresh(MakeRemoteSchedule("s", "app", 100), best.Callback());
  assert(best.called && !best.up_to_date);
  assert(f.runner.Started() == 0);

  // a full refresh still insists on a fetch
  Outcome full;
  f.coordinator->WaitFullRefresh(MakeRemoteSchedule("s", "app", 100), full.Callback());
  assert(f.runner.Started() == 1);
  f.runner.Finish(0, CycleOutcome::Stale(MakeMetadata("app", 300)));
  assert(full.called && !full.up_to_date);
}

void TestChangeNotificationsCoalesce() {
  Fixture f;

  assert(f.coordinator->RequestCycle("app"));
  assert(!f.coordinator->RequestCycle("app"));
  assert(!f.coordinator->RequestCycle("app"));
  assert(f.runner.Started() == 1);

  // exactly one follow-up for all notifications seen while in flight
  f.Apply(0, 100);
  assert(f.runner.Started() == 2);
  f.Apply(1, 100);
  assert(f.runner.Started() == 2);
  assert(f.coordinator->PhaseOf("app") == Phase::kSettled);

  // other sources are independent
  assert(f.coordinator->RequestCycle("contact"));
  assert(f.runner.Started() == 3);
}

void TestCycleCompletionIsDeliveredOnce() {
  Fixture f;

  Outcome best;
  f.coordinator->BestEffortRefresh(MakeRemoteSchedule("s", "app", 100), best.Callback());
  f.Apply(0, 100);
  f.runner.Finish(0, CycleOutcome::Failed());

  assert(best.calls == 1 && best.up_to_date);
  assert(f.coordinator->PhaseOf("app") == Phase::kSettled);
}

void TestThrowingRunnerFailsTheCycle() {
  Fixture f;
  f.runner.ThrowNext();

  Outcome best;
  f.coordinator->BestEffortRefresh(MakeRemoteSchedule("s", "app", 100), best.Callback());
  assert(best.called && !best.up_to_date);
  assert(f.coordinator->PhaseOf("app") == Phase::kIdle);
}

void TestWaitersSeeTheUpdatedLocalCopy() {
  auto versions = std::make_shared<VersionStore>(std::make_shared<rdsync::db::memory::MemoryPreferenceStore>());
  auto tracker  = std::make_shared<StalenessTracker>(versions);

  ScriptedRunner runner;
  auto           coordinator = std::make_shared<RefreshCoordinator>(
      tracker, std::make_shared<rdsync::dispatch::InlineDispatcher>(), runner.Runner(),
      [](const std::string& id) -> std::optional<rdsync::v1::Schedule> { return MakeRemoteSchedule(id, "app", 200); });
  coordinator->Activate();

  // caller holds a copy from before the update
  Outcome best;
  coordinator->BestEffortRefresh(MakeRemoteSchedule("s", "app", 100), best.Callback());

  assert(versions->Commit("app", MakeMetadata("app", 200), {"s"}));
  runner.Finish(0, CycleOutcome::Applied(MakeMetadata("app", 200)));
  assert(best.called && best.up_to_date);
}

} // namespace

int main() {
  TestUpToDateScheduleNeedsNoCycle();
  TestInactiveCoordinatorResolvesImmediately();
  TestConcurrentCallersShareOneFetch();
  TestFailedFetchReturnsToIdle();
  TestAbandonReleasesWaiters();
  TestWaitFullJoiningOldCycleGetsFreshOne();
  TestWaitFullOwnCycleIsNotRetried();
  TestBestEffortSkipsFetchWhenNewerDataIsKnown();
  TestChangeNotificationsCoalesce();
  TestCycleCompletionIsDeliveredOnce();
  TestThrowingRunnerFailsTheCycle();
  TestWaitersSeeTheUpdatedLocalCopy();

  std::cout << "rdsync_unit_refresh_coordinator: pass\n";
  return 0;
}
