#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/preference_store.hpp"
#include "internal/dispatch/dispatcher.hpp"
#include "internal/sync/refresh_coordinator.hpp"
#include "internal/sync/remote_data_provider.hpp"
#include "internal/sync/schedule_delegate.hpp"
#include "internal/util/time.hpp"
#include "rdsync/v1.hpp"

namespace rdsync::sync {

class CutoffPolicy;
class StalenessTracker;
class VersionStore;

/*
  Keeps the delegate's remote-sourced schedules coherent with remote data.

  On every change notification each affected source runs one cycle:
  fetch -> reconcile -> delegate applies create/update/delete -> commit.
  Refresh calls only ever complete with a bool; failures mean "not yet up to
  date".

  Always created through Create(): callbacks handed to the provider and the
  dispatcher hold weak references to the engine.
*/
class RemoteDataSyncEngine : public std::enable_shared_from_this<RemoteDataSyncEngine> {
 public:
  using Completion = std::function<void(bool)>;

  static std::shared_ptr<RemoteDataSyncEngine> Create(std::shared_ptr<RemoteDataProvider> provider, std::shared_ptr<ScheduleDelegate> delegate,
                                                      std::shared_ptr<db::PreferenceStore> prefs,
                                                      std::shared_ptr<dispatch::Dispatcher> dispatcher, std::string sdk_version);

  ~RemoteDataSyncEngine();

  RemoteDataSyncEngine(const RemoteDataSyncEngine&)            = delete;
  RemoteDataSyncEngine& operator=(const RemoteDataSyncEngine&) = delete;

  // Registers for change notifications and reconciles every known source.
  void Subscribe();

  // Deregisters; pending refresh waiters complete with false.
  void Unsubscribe();

  bool IsSubscribed() const;

  bool IsScheduleUpToDate(const rdsync::v1::Schedule& schedule) const;

  bool ScheduleRequiresRefresh(const rdsync::v1::Schedule& schedule) const;

  void BestEffortRefresh(const rdsync::v1::Schedule& schedule, Completion done);

  void WaitFullRefresh(const rdsync::v1::Schedule& schedule, Completion done);

  // Reports the schedule's remote data as outdated and requests a cycle for
  // its source. `done` fires once the request is issued.
  void NotifyOutdatedSchedule(const rdsync::v1::Schedule& schedule, std::function<void()> done);

  std::optional<rdsync::v1::RemoteDataInfo> RemoteDataInfoFromSchedule(const rdsync::v1::Schedule& schedule) const;

  util::TimePoint NewUserCutoffTime() const;

  RefreshCoordinator::Phase SourcePhase(const std::string& source) const;

 private:
  RemoteDataSyncEngine(std::shared_ptr<RemoteDataProvider> provider, std::shared_ptr<ScheduleDelegate> delegate,
                       std::shared_ptr<db::PreferenceStore> prefs, std::shared_ptr<dispatch::Dispatcher> dispatcher, std::string sdk_version);

  void OnSourcesChanged(const std::vector<std::string>& sources);

  void RunCycle(const std::string& source, RefreshCoordinator::CycleDone done);

  CycleOutcome ProcessFetch(const std::string& source, const FetchResult& result);

  CycleOutcome ApplyPayload(const std::string& source, const rdsync::v1::RemotePayload& payload);

  std::shared_ptr<RemoteDataProvider>   provider_;
  std::shared_ptr<ScheduleDelegate>     delegate_;
  std::shared_ptr<dispatch::Dispatcher> dispatcher_;
  std::string                           sdk_version_;

  std::shared_ptr<VersionStore>       versions_;
  std::shared_ptr<CutoffPolicy>       cutoff_;
  std::shared_ptr<StalenessTracker>   tracker_;
  std::shared_ptr<RefreshCoordinator> coordinator_;

  std::atomic<bool>       subscribed_{false};
  std::mutex              listener_mutex_;
  std::optional<uint64_t> listener_token_;
};

} // namespace rdsync::sync
