#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/sync/schedule_delegate.hpp"

namespace rdsync::scheduler {

/*
  Process-local schedule store implementing the delegate capabilities.

  Create and edit are idempotent per schedule id: re-creating an id replaces
  its definition, re-applying an edit converges to the same state.
*/
class InMemoryScheduleStore final : public sync::ScheduleDelegate {
 public:
  std::vector<rdsync::v1::Schedule> GetSchedules() override;

  bool ScheduleMultiple(const std::vector<rdsync::v1::Schedule>& schedules) override;

  bool EditSchedule(const std::string& id, const rdsync::v1::ScheduleEdits& edits) override;

  void SetConstraints(const std::string& constraint_data) override;

  std::optional<rdsync::v1::Schedule> Get(const std::string& id);

  std::string Constraints();

  std::size_t Size();

  static void ApplyEdits(rdsync::v1::Schedule& schedule, const rdsync::v1::ScheduleEdits& edits);

 private:
  std::mutex                                  mutex_;
  std::map<std::string, rdsync::v1::Schedule> schedules_;
  std::string                                 constraints_;
};

} // namespace rdsync::scheduler
