#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

#include "internal/util/time.hpp"
#include "rdsync/v1.hpp"

namespace rdsync::sync {

struct ReconcileInput {
  std::string                    source;
  rdsync::v1::RemoteDataMetadata metadata;
  std::vector<rdsync::v1::Schedule> drafts;

  // Ids last known to come from `source`.
  std::set<std::string> previous_ids;

  // Optional: current local copies, used to keep update edits minimal.
  std::map<std::string, rdsync::v1::Schedule> previous;

  util::TimePoint cutoff;
  util::TimePoint now;
  std::string     sdk_version;
};

struct ScheduleUpdate {
  std::string               id;
  rdsync::v1::ScheduleEdits edits;
};

/*
  Diff of one reconcile, applied create -> update -> delete.

  `retained` lists previously known ids whose draft needs a newer SDK; they
  are left untouched and stay attributed to the source.
*/
struct ReconcileResult {
  std::vector<rdsync::v1::Schedule> to_create;
  std::vector<ScheduleUpdate>       to_update;
  std::vector<std::string>          to_delete;
  std::vector<std::string>          retained;

  bool Empty() const {
    return to_create.empty() && to_update.empty() && to_delete.empty();
  }
};

/*
  Pure function from (previous ids, payload, cutoff, now) to a diff.

  Drafts are treated as absent when expired (end < now) or when they are
  new-user-only and `now` is not before the cutoff. Output lists are ordered
  by schedule id so identical inputs give identical diffs.
*/
class ScheduleReconciler {
 public:
  static ReconcileResult Reconcile(const ReconcileInput& input);

  static bool IsExpired(const rdsync::v1::Schedule& draft, util::TimePoint now);

  static bool IsAudienceEligible(const rdsync::v1::Schedule& draft, util::TimePoint cutoff, util::TimePoint now);

  // Mutable fields of `draft` that differ from `previous` (all of them when
  // previous is null), plus remote data info.
  static rdsync::v1::ScheduleEdits BuildEdits(const rdsync::v1::Schedule& draft, const rdsync::v1::Schedule* previous,
                                              const rdsync::v1::RemoteDataInfo& info);
};

} // namespace rdsync::sync
