#include "internal/scheduler/in_memory_schedule_store.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace rdsync::scheduler {

using rdsync::observability::IntField;
using rdsync::observability::StringField;
using rdsync::v1::Schedule;
using rdsync::v1::ScheduleEdits;

std::vector<Schedule> InMemoryScheduleStore::GetSchedules() {
  std::lock_guard lock(mutex_);

  std::vector<Schedule> out;
  out.reserve(schedules_.size());
  for (const auto& [_, schedule] : schedules_) out.push_back(schedule);
  return out;
}

bool InMemoryScheduleStore::ScheduleMultiple(const std::vector<Schedule>& schedules) {
  for (const auto& schedule : schedules) {
    if (schedule.id().empty()) {
      RDSYNC_LOG_WARN("Rejected schedule batch with an empty id", {IntField("count", static_cast<int64_t>(schedules.size()))});
      return false;
    }
  }

  const auto now = util::ToProto(util::Now());

  std::lock_guard lock(mutex_);
  for (const auto& schedule : schedules) {
    auto& stored = schedules_[schedule.id()];
    stored       = schedule;
    if (!stored.has_created()) *stored.mutable_created() = now;
    if (!stored.has_last_updated()) *stored.mutable_last_updated() = now;
  }
  return true;
}

bool InMemoryScheduleStore::EditSchedule(const std::string& id, const ScheduleEdits& edits) {
  std::lock_guard lock(mutex_);

  auto it = schedules_.find(id);
  if (it == schedules_.end()) {
    RDSYNC_LOG_DEBUG("Edit for unknown schedule", {StringField("schedule_id", id)});
    return false;
  }

  ApplyEdits(it->second, edits);
  return true;
}

void InMemoryScheduleStore::SetConstraints(const std::string& constraint_data) {
  std::lock_guard lock(mutex_);
  constraints_ = constraint_data;
}

std::optional<Schedule> InMemoryScheduleStore::Get(const std::string& id) {
  std::lock_guard lock(mutex_);

  auto it = schedules_.find(id);
  if (it == schedules_.end()) return std::nullopt;
  return it->second;
}

std::string InMemoryScheduleStore::Constraints() {
  std::lock_guard lock(mutex_);
  return constraints_;
}

std::size_t InMemoryScheduleStore::Size() {
  std::lock_guard lock(mutex_);
  return schedules_.size();
}

void InMemoryScheduleStore::ApplyEdits(Schedule& schedule, const ScheduleEdits& edits) {
  if (edits.has_priority()) schedule.set_priority(edits.priority());
  if (edits.has_limit()) schedule.set_limit(edits.limit());
  if (edits.has_content()) schedule.set_content(edits.content());
  if (edits.has_min_sdk_version()) schedule.set_min_sdk_version(edits.min_sdk_version());
  if (edits.has_audience()) *schedule.mutable_audience() = edits.audience();
  if (edits.has_frequency_constraint_ids()) *schedule.mutable_frequency_constraint_ids() = edits.frequency_constraint_ids().ids();
  if (edits.has_remote_data_info()) *schedule.mutable_remote_data_info() = edits.remote_data_info();

  if (edits.clear_start()) {
    schedule.clear_start();
  } else if (edits.has_start()) {
    *schedule.mutable_start() = edits.start();
  }

  if (edits.clear_end()) {
    schedule.clear_end();
  } else if (edits.has_end()) {
    *schedule.mutable_end() = edits.end();
  }

  *schedule.mutable_last_updated() = edits.has_last_updated() ? edits.last_updated() : util::ToProto(util::Now());
}

} // namespace rdsync::scheduler
