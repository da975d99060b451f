#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/dispatch/dispatcher.hpp"
#include "rdsync/v1.hpp"

namespace rdsync::sync {

class StalenessTracker;

enum class CycleStatus {
  kApplied,   // payload reconciled and committed
  kStale,     // discarded, a newer payload was already committed
  kFailed,    // fetch or store failure; nothing settled
  kAbandoned, // engine unsubscribed while the cycle ran
};

struct CycleOutcome {
  CycleStatus                                   status = CycleStatus::kFailed;
  std::optional<rdsync::v1::RemoteDataMetadata> metadata;

  static CycleOutcome Applied(rdsync::v1::RemoteDataMetadata metadata) {
    return {CycleStatus::kApplied, std::move(metadata)};
  }

  static CycleOutcome Stale(std::optional<rdsync::v1::RemoteDataMetadata> current) {
    return {CycleStatus::kStale, std::move(current)};
  }

  static CycleOutcome Failed() {
    return {CycleStatus::kFailed, std::nullopt};
  }

  static CycleOutcome Abandoned() {
    return {CycleStatus::kAbandoned, std::nullopt};
  }
};

const char* ToString(CycleStatus status);

/*
  Per-source refresh state machine.

      Idle --(fetch)--> FetchInFlight --(applied/stale)--> Settled
                              |                              |
                              +--(failed/abandoned)--> Idle  +--(change)--> FetchInFlight

  At most one cycle per source runs at a time. Refresh requests arriving
  while a cycle runs join it instead of starting another one; a change
  notification arriving meanwhile schedules exactly one follow-up cycle.

  Waiter completions are delivered through the dispatcher, outside the lock,
  exactly once.
*/
class RefreshCoordinator : public std::enable_shared_from_this<RefreshCoordinator> {
 public:
  enum class Phase {
    kIdle,
    kFetchInFlight,
    kSettled,
  };

  using Completion  = std::function<void(bool up_to_date)>;
  using CycleDone   = std::function<void(CycleOutcome)>;
  using CycleRunner = std::function<void(const std::string& source, CycleDone done)>;

  // Current local copy of a schedule, used to re-evaluate waiters after a
  // cycle applied new data to it.
  using ScheduleLookup = std::function<std::optional<rdsync::v1::Schedule>(const std::string& id)>;

  RefreshCoordinator(std::shared_ptr<StalenessTracker> tracker, std::shared_ptr<dispatch::Dispatcher> dispatcher, CycleRunner runner,
                     ScheduleLookup lookup = {});

  void Activate();

  // Deactivates and releases every waiter with `false`.
  void AbandonAll();

  bool IsActive() const;

  // Change notification path. Returns true when a new cycle was started.
  bool RequestCycle(const std::string& source);

  void BestEffortRefresh(const rdsync::v1::Schedule& schedule, Completion done);

  void WaitFullRefresh(const rdsync::v1::Schedule& schedule, Completion done);

  Phase PhaseOf(const std::string& source) const;

  std::optional<rdsync::v1::RemoteDataMetadata> SettledMetadata(const std::string& source) const;

 private:
  enum class WaitMode {
    kBestEffort,
    kFull,
  };

  struct Waiter {
    rdsync::v1::Schedule schedule;
    WaitMode             mode;
    bool                 fresh; // waits on a cycle started after it arrived
    Completion           done;
  };

  struct SourceState {
    Phase                                         phase = Phase::kIdle;
    std::optional<rdsync::v1::RemoteDataMetadata> settled;
    std::vector<Waiter>                           waiters;
    uint64_t                                      generation = 0;
    bool                                          rerun      = false;
  };

  void Refresh(const rdsync::v1::Schedule& schedule, WaitMode mode, Completion done);

  static uint64_t BeginCycleLocked(SourceState& state);

  void Launch(const std::string& source, uint64_t generation);

  void OnCycleComplete(const std::string& source, uint64_t generation, CycleOutcome outcome);

  void Deliver(Completion done, bool up_to_date);

  rdsync::v1::Schedule Current(const rdsync::v1::Schedule& schedule) const;

  std::shared_ptr<StalenessTracker>     tracker_;
  std::shared_ptr<dispatch::Dispatcher> dispatcher_;
  CycleRunner                           runner_;
  ScheduleLookup                        lookup_;

  mutable std::mutex                           mutex_;
  std::unordered_map<std::string, SourceState> sources_;
  bool                                         active_ = false;
};

} // namespace rdsync::sync
