#pragma once

#include <memory>

#include "rdsync/v1.hpp"

namespace rdsync::sync {

class VersionStore;

/*
  Cheap freshness checks against the VersionStore. Never mutates schedules.

  A schedule that is not up to date only requires a refresh when local
  knowledge cannot explain it: the source was never processed, or the
  schedule carries metadata the store does not supersede.
*/
class StalenessTracker {
 public:
  explicit StalenessTracker(std::shared_ptr<VersionStore> versions);

  bool IsUpToDate(const rdsync::v1::Schedule& schedule) const;

  bool RequiresRefresh(const rdsync::v1::Schedule& schedule) const;

 private:
  std::shared_ptr<VersionStore> versions_;
};

} // namespace rdsync::sync
