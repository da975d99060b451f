#include "internal/sync/schedule_reconciler.hpp"

#include <algorithm>

#include <google/protobuf/util/time_util.h>

#include "internal/util/version.hpp"

namespace rdsync::sync {

using rdsync::v1::RemoteDataInfo;
using rdsync::v1::Schedule;
using rdsync::v1::ScheduleEdits;

namespace {

bool SameIds(const google::protobuf::RepeatedPtrField<std::string>& a, const google::protobuf::RepeatedPtrField<std::string>& b) {
  return std::equal(a.begin(), a.end(), b.begin(), b.end());
}

} // namespace

bool ScheduleReconciler::IsExpired(const Schedule& draft, util::TimePoint now) {
  return draft.has_end() && util::FromProto(draft.end()) < now;
}

bool ScheduleReconciler::IsAudienceEligible(const Schedule& draft, util::TimePoint cutoff, util::TimePoint now) {
  if (!draft.audience().new_user()) return true;
  return now < cutoff;
}

ScheduleEdits ScheduleReconciler::BuildEdits(const Schedule& draft, const Schedule* previous, const RemoteDataInfo& info) {
  ScheduleEdits edits;

  if (!previous || previous->priority() != draft.priority()) edits.set_priority(draft.priority());
  if (!previous || previous->limit() != draft.limit()) edits.set_limit(draft.limit());
  if (!previous || previous->content() != draft.content()) edits.set_content(draft.content());
  if (!previous || previous->min_sdk_version() != draft.min_sdk_version()) edits.set_min_sdk_version(draft.min_sdk_version());

  if (draft.has_start()) {
    if (!previous || !previous->has_start() || previous->start() != draft.start()) *edits.mutable_start() = draft.start();
  } else if (!previous || previous->has_start()) {
    edits.set_clear_start(true);
  }

  if (draft.has_end()) {
    if (!previous || !previous->has_end() || previous->end() != draft.end()) *edits.mutable_end() = draft.end();
  } else if (!previous || previous->has_end()) {
    edits.set_clear_end(true);
  }

  if (!previous || previous->audience().new_user() != draft.audience().new_user()) *edits.mutable_audience() = draft.audience();

  if (!previous || !SameIds(previous->frequency_constraint_ids(), draft.frequency_constraint_ids())) {
    *edits.mutable_frequency_constraint_ids()->mutable_ids() = draft.frequency_constraint_ids();
  }

  if (draft.has_last_updated()) *edits.mutable_last_updated() = draft.last_updated();

  *edits.mutable_remote_data_info() = info;
  return edits;
}

ReconcileResult ScheduleReconciler::Reconcile(const ReconcileInput& input) {
  ReconcileResult result;

  RemoteDataInfo info;
  info.set_source(input.source);
  *info.mutable_metadata() = input.metadata;

  // filtered drafts keyed by id, first occurrence wins
  std::map<std::string, const Schedule*> present;
  std::set<std::string>                  seen;
  std::set<std::string>                  retained;

  for (const auto& draft : input.drafts) {
    if (draft.id().empty()) continue;
    if (!seen.insert(draft.id()).second) continue;

    if (IsExpired(draft, input.now)) continue;
    if (!IsAudienceEligible(draft, input.cutoff, input.now)) continue;

    if (!util::IsVersionSatisfied(draft.min_sdk_version(), input.sdk_version)) {
      if (input.previous_ids.contains(draft.id())) retained.insert(draft.id());
      continue;
    }

    present.emplace(draft.id(), &draft);
  }

  for (const auto& [id, draft] : present) {
    if (!input.previous_ids.contains(id)) {
      Schedule schedule                    = *draft;
      *schedule.mutable_remote_data_info() = info;
      result.to_create.push_back(std::move(schedule));
      continue;
    }

    const auto      previous_it = input.previous.find(id);
    const Schedule* previous    = previous_it == input.previous.end() ? nullptr : &previous_it->second;
    result.to_update.push_back({id, BuildEdits(*draft, previous, info)});
  }

  for (const auto& id : input.previous_ids) {
    if (present.contains(id) || retained.contains(id)) continue;
    result.to_delete.push_back(id);
  }

  result.retained.assign(retained.begin(), retained.end());
  return result;
}

} // namespace rdsync::sync
