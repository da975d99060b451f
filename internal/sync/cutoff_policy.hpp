#pragma once

#include <memory>
#include <mutex>
#include <optional>

#include "internal/db/api/preference_store.hpp"
#include "internal/util/time.hpp"

namespace rdsync::sync {

/*
  New-user cutoff: fixed once per install.

  Fresh installs record the first-run instant; installs that already hold
  remote data record util::DistantPast(). A persisted value always wins.
*/
class CutoffPolicy {
 public:
  static constexpr const char* kKey = "rdsync.new_user_cutoff_ms";

  explicit CutoffPolicy(std::shared_ptr<db::PreferenceStore> prefs);

  // Returns the effective cutoff.
  util::TimePoint Initialize(bool has_existing_data, util::TimePoint now = util::Now());

  // Initialize() must have been called.
  util::TimePoint NewUserCutoffTime() const;

 private:
  std::shared_ptr<db::PreferenceStore> prefs_;

  mutable std::mutex             mutex_;
  std::optional<util::TimePoint> cutoff_;
};

} // namespace rdsync::sync
