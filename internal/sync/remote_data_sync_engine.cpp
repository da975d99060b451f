#include "internal/sync/remote_data_sync_engine.hpp"

#include <set>

#include "internal/observability/logging.hpp"
#include "internal/sync/cutoff_policy.hpp"
#include "internal/sync/metadata.hpp"
#include "internal/sync/schedule_reconciler.hpp"
#include "internal/sync/staleness_tracker.hpp"
#include "internal/sync/version_store.hpp"
#include "internal/util/errors.hpp"

namespace rdsync::sync {

using rdsync::observability::BoolField;
using rdsync::observability::IntField;
using rdsync::observability::StringField;
using rdsync::observability::TimestampField;
using rdsync::v1::Schedule;
using rdsync::v1::ScheduleEdits;

namespace {

bool HoldsRemoteSchedules(const std::vector<Schedule>& schedules) {
  for (const auto& schedule : schedules) {
    if (schedule.has_remote_data_info()) return true;
  }
  return false;
}

bool HasEnded(const Schedule& schedule, util::TimePoint now) {
  return schedule.has_end() && util::FromProto(schedule.end()) <= now;
}

} // namespace

// ------------------------------------------------------------
// Construction
// ------------------------------------------------------------

std::shared_ptr<RemoteDataSyncEngine> RemoteDataSyncEngine::Create(std::shared_ptr<RemoteDataProvider>   provider,
                                                                   std::shared_ptr<ScheduleDelegate>     delegate,
                                                                   std::shared_ptr<db::PreferenceStore>  prefs,
                                                                   std::shared_ptr<dispatch::Dispatcher> dispatcher, std::string sdk_version) {
  if (!provider) throw util::InvalidArgument("remote data provider is required");
  if (!delegate) throw util::InvalidArgument("schedule delegate is required");
  if (!prefs) throw util::InvalidArgument("preference store is required");
  if (!dispatcher) throw util::InvalidArgument("dispatcher is required");

  std::shared_ptr<RemoteDataSyncEngine> engine(
      new RemoteDataSyncEngine(std::move(provider), std::move(delegate), std::move(prefs), std::move(dispatcher), std::move(sdk_version)));

  std::weak_ptr<RemoteDataSyncEngine> weak = engine;
  engine->coordinator_ = std::make_shared<RefreshCoordinator>(engine->tracker_, engine->dispatcher_,
                                                              [weak](const std::string& source, RefreshCoordinator::CycleDone done) {
                                                                if (auto self = weak.lock()) {
                                                                  self->RunCycle(source, std::move(done));
                                                                } else {
                                                                  done(CycleOutcome::Abandoned());
                                                                }
                                                              },
                                                              [weak](const std::string& id) -> std::optional<Schedule> {
                                                                auto self = weak.lock();
                                                                if (!self) return std::nullopt;
                                                                for (auto& schedule : self->delegate_->GetSchedules()) {
                                                                  if (schedule.id() == id) return std::move(schedule);
                                                                }
                                                                return std::nullopt;
                                                              });
  return engine;
}

RemoteDataSyncEngine::RemoteDataSyncEngine(std::shared_ptr<RemoteDataProvider> provider, std::shared_ptr<ScheduleDelegate> delegate,
                                           std::shared_ptr<db::PreferenceStore> prefs, std::shared_ptr<dispatch::Dispatcher> dispatcher,
                                           std::string sdk_version)
    : provider_(std::move(provider)),
      delegate_(std::move(delegate)),
      dispatcher_(std::move(dispatcher)),
      sdk_version_(std::move(sdk_version)),
      versions_(std::make_shared<VersionStore>(prefs)),
      cutoff_(std::make_shared<CutoffPolicy>(prefs)),
      tracker_(std::make_shared<StalenessTracker>(versions_)) {
  const bool existing = versions_->HasAnyRecord() || HoldsRemoteSchedules(delegate_->GetSchedules());
  cutoff_->Initialize(existing);
}

RemoteDataSyncEngine::~RemoteDataSyncEngine() {
  Unsubscribe();
}

// ------------------------------------------------------------
// Subscription
// ------------------------------------------------------------

void RemoteDataSyncEngine::Subscribe() {
  if (subscribed_.exchange(true)) return;

  coordinator_->Activate();

  std::weak_ptr<RemoteDataSyncEngine> weak  = weak_from_this();
  const auto                          token = provider_->AddChangeListener([weak](const std::vector<std::string>& sources) {
    if (auto self = weak.lock()) self->OnSourcesChanged(sources);
  });
  {
    std::lock_guard lock(listener_mutex_);
    listener_token_ = token;
  }

  const auto sources = provider_->Sources();
  RDSYNC_LOG_INFO("Remote data sync subscribed", {IntField("sources", static_cast<int64_t>(sources.size()))});

  OnSourcesChanged(sources);
}

void RemoteDataSyncEngine::Unsubscribe() {
  if (!subscribed_.exchange(false)) return;

  std::optional<uint64_t> token;
  {
    std::lock_guard lock(listener_mutex_);
    token.swap(listener_token_);
  }
  if (token) provider_->RemoveChangeListener(*token);

  coordinator_->AbandonAll();
  RDSYNC_LOG_INFO("Remote data sync unsubscribed");
}

bool RemoteDataSyncEngine::IsSubscribed() const {
  return subscribed_;
}

void RemoteDataSyncEngine::OnSourcesChanged(const std::vector<std::string>& sources) {
  if (!subscribed_) return;
  for (const auto& source : sources) {
    coordinator_->RequestCycle(source);
  }
}

// ------------------------------------------------------------
// Per-schedule queries
// ------------------------------------------------------------

bool RemoteDataSyncEngine::IsScheduleUpToDate(const Schedule& schedule) const {
  return tracker_->IsUpToDate(schedule);
}

bool RemoteDataSyncEngine::ScheduleRequiresRefresh(const Schedule& schedule) const {
  return tracker_->RequiresRefresh(schedule);
}

void RemoteDataSyncEngine::BestEffortRefresh(const Schedule& schedule, Completion done) {
  coordinator_->BestEffortRefresh(schedule, std::move(done));
}

void RemoteDataSyncEngine::WaitFullRefresh(const Schedule& schedule, Completion done) {
  coordinator_->WaitFullRefresh(schedule, std::move(done));
}

void RemoteDataSyncEngine::NotifyOutdatedSchedule(const Schedule& schedule, std::function<void()> done) {
  if (schedule.has_remote_data_info()) {
    const auto& info = schedule.remote_data_info();
    RDSYNC_LOG_DEBUG("Schedule reported outdated", {StringField("schedule_id", schedule.id()), StringField("source", info.source())});
    provider_->NotifyOutdated(info);
    coordinator_->RequestCycle(info.source());
  }

  if (done) dispatcher_->Dispatch(std::move(done));
}

std::optional<rdsync::v1::RemoteDataInfo> RemoteDataSyncEngine::RemoteDataInfoFromSchedule(const Schedule& schedule) const {
  return RemoteDataInfoOf(schedule);
}

util::TimePoint RemoteDataSyncEngine::NewUserCutoffTime() const {
  return cutoff_->NewUserCutoffTime();
}

RefreshCoordinator::Phase RemoteDataSyncEngine::SourcePhase(const std::string& source) const {
  return coordinator_->PhaseOf(source);
}

// ------------------------------------------------------------
// Reconcile cycle
// ------------------------------------------------------------

void RemoteDataSyncEngine::RunCycle(const std::string& source, RefreshCoordinator::CycleDone done) {
  RDSYNC_LOG_DEBUG("Fetching remote data", {StringField("source", source)});

  std::weak_ptr<RemoteDataSyncEngine> weak = weak_from_this();
  provider_->Fetch(source, [weak, source, done](FetchResult result) {
    auto self = weak.lock();
    if (!self) {
      done(CycleOutcome::Abandoned());
      return;
    }

    // hop off the transport's thread before touching the delegate
    self->dispatcher_->Dispatch([weak, source, done, result = std::move(result)]() {
      auto engine = weak.lock();
      if (!engine) {
        done(CycleOutcome::Abandoned());
        return;
      }
      done(engine->ProcessFetch(source, result));
    });
  });
}

CycleOutcome RemoteDataSyncEngine::ProcessFetch(const std::string& source, const FetchResult& result) {
  if (!result.ok) {
    RDSYNC_LOG_WARN("Remote data fetch failed", {StringField("source", source), StringField("error", result.error)});
    return CycleOutcome::Failed();
  }

  if (!subscribed_) return CycleOutcome::Abandoned();

  try {
    return ApplyPayload(source, result.payload);
  } catch (const std::exception& e) {
    RDSYNC_LOG_ERROR("Remote data cycle failed", {StringField("source", source), StringField("error", e.what())});
    return CycleOutcome::Failed();
  }
}

CycleOutcome RemoteDataSyncEngine::ApplyPayload(const std::string& source, const rdsync::v1::RemotePayload& payload) {
  const auto& metadata = payload.metadata();
  const auto  stored   = versions_->GetRecord(source);

  if (stored && Supersedes(stored->metadata(), metadata)) {
    RDSYNC_LOG_DEBUG("Discarding payload older than the committed one",
                     {StringField("source", source), TimestampField("fetched", metadata.last_modified()),
                      TimestampField("committed", stored->metadata().last_modified())});
    return CycleOutcome::Stale(stored->metadata());
  }

  if (stored && stored->complete() && stored->sdk_version() == sdk_version_ && SameMetadata(stored->metadata(), metadata)) {
    RDSYNC_LOG_DEBUG("Remote data unchanged", {StringField("source", source)});
    return CycleOutcome::Applied(metadata);
  }

  if (payload.has_constraints()) delegate_->SetConstraints(payload.constraints());

  const auto now = util::Now();

  ReconcileInput input;
  input.source      = source;
  input.metadata    = metadata;
  input.cutoff      = cutoff_->NewUserCutoffTime();
  input.now         = now;
  input.sdk_version = sdk_version_;
  input.drafts.assign(payload.schedules().begin(), payload.schedules().end());

  std::set<std::string> stored_ids;
  if (stored) stored_ids.insert(stored->schedule_ids().begin(), stored->schedule_ids().end());
  input.previous_ids = stored_ids;

  std::set<std::string> live_drafts;
  for (const auto& draft : payload.schedules()) {
    if (!ScheduleReconciler::IsExpired(draft, now)) live_drafts.insert(draft.id());
  }

  std::set<std::string> held;
  for (auto& schedule : delegate_->GetSchedules()) {
    if (!schedule.has_remote_data_info() || schedule.remote_data_info().source() != source) continue;
    // ended by an earlier cycle and no longer part of this source
    if (HasEnded(schedule, now) && !stored_ids.contains(schedule.id()) && !live_drafts.contains(schedule.id())) continue;
    held.insert(schedule.id());
    input.previous_ids.insert(schedule.id());
    input.previous.emplace(schedule.id(), std::move(schedule));
  }

  const auto diff = ScheduleReconciler::Reconcile(input);

  std::vector<std::string> committed = diff.retained;
  bool                     complete  = true;
  int64_t                  updated   = 0;
  int64_t                  ended     = 0;

  if (!diff.to_create.empty()) {
    if (delegate_->ScheduleMultiple(diff.to_create)) {
      for (const auto& schedule : diff.to_create) committed.push_back(schedule.id());
    } else {
      complete = false;
      RDSYNC_LOG_WARN("Failed to create schedules", {StringField("source", source), IntField("count", static_cast<int64_t>(diff.to_create.size()))});
    }
  }

  for (const auto& update : diff.to_update) {
    if (!held.contains(update.id)) {
      // dropped locally by the scheduler; still part of the payload
      committed.push_back(update.id);
      continue;
    }
    if (delegate_->EditSchedule(update.id, update.edits)) {
      committed.push_back(update.id);
      ++updated;
    } else {
      complete = false;
      RDSYNC_LOG_WARN("Failed to update schedule", {StringField("source", source), StringField("schedule_id", update.id)});
    }
  }

  for (const auto& id : diff.to_delete) {
    if (!held.contains(id)) continue;

    ScheduleEdits end_now;
    *end_now.mutable_end() = util::ToProto(now);
    if (delegate_->EditSchedule(id, end_now)) {
      ++ended;
    } else {
      // keep it attributed so the next cycle deletes it again
      committed.push_back(id);
      complete = false;
      RDSYNC_LOG_WARN("Failed to end schedule", {StringField("source", source), StringField("schedule_id", id)});
    }
  }

  auto commit = versions_->Commit(source, metadata, committed, sdk_version_, complete);
  if (!commit) {
    if (commit.code == db::ErrorCode::StaleCommit) {
      RDSYNC_LOG_DEBUG("Reconcile superseded by a newer commit", {StringField("source", source)});
      return CycleOutcome::Stale(versions_->Get(source));
    }
    RDSYNC_LOG_WARN("Failed to commit remote data version",
                    {StringField("source", source), StringField("code", db::ToString(commit.code)), StringField("error", commit.message)});
    return CycleOutcome::Failed();
  }

  RDSYNC_LOG_INFO("Remote data reconciled",
                  {StringField("source", source), TimestampField("last_modified", metadata.last_modified()),
                   IntField("created", static_cast<int64_t>(diff.to_create.size())), IntField("updated", updated), IntField("ended", ended),
                   BoolField("complete", complete)});
  return CycleOutcome::Applied(metadata);
}

} // namespace rdsync::sync
