#include "internal/sync/staleness_tracker.hpp"

#include "internal/sync/metadata.hpp"
#include "internal/sync/version_store.hpp"

namespace rdsync::sync {

StalenessTracker::StalenessTracker(std::shared_ptr<VersionStore> versions) : versions_(std::move(versions)) {
}

bool StalenessTracker::IsUpToDate(const rdsync::v1::Schedule& schedule) const {
  if (!schedule.has_remote_data_info()) return true;

  const auto& info    = schedule.remote_data_info();
  const auto  current = versions_->Get(info.source());
  return current && SameMetadata(*current, info.metadata());
}

bool StalenessTracker::RequiresRefresh(const rdsync::v1::Schedule& schedule) const {
  if (!schedule.has_remote_data_info()) return false;

  const auto& info    = schedule.remote_data_info();
  const auto  current = versions_->Get(info.source());
  if (!current) return true;
  if (SameMetadata(*current, info.metadata())) return false;

  // newer data already processed; the schedule is just behind it
  return !Supersedes(*current, info.metadata());
}

} // namespace rdsync::sync
