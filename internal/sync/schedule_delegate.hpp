#pragma once

#include <string>
#include <vector>

#include "rdsync/v1.hpp"

namespace rdsync::sync {

/*
  Capabilities of the scheduler that owns schedule lifecycle.

  Results report local persistence only. Every call must be idempotent for a
  given schedule id: a discarded cycle may leave a diff half applied and the
  next cycle re-issues it.
*/
class ScheduleDelegate {
 public:
  virtual ~ScheduleDelegate() = default;

  virtual std::vector<rdsync::v1::Schedule> GetSchedules() = 0;

  virtual bool ScheduleMultiple(const std::vector<rdsync::v1::Schedule>& schedules) = 0;

  virtual bool EditSchedule(const std::string& id, const rdsync::v1::ScheduleEdits& edits) = 0;

  // Opaque constraint data carried by the payload; not interpreted here.
  virtual void SetConstraints(const std::string& constraint_data) = 0;
};

} // namespace rdsync::sync
