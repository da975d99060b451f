#include "internal/sync/cutoff_policy.hpp"

#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace rdsync::sync {

using rdsync::observability::IntField;
using rdsync::observability::StringField;

namespace {

std::optional<int64_t> ParseMillis(const std::string& value) {
  try {
    std::size_t consumed = 0;
    const auto  millis   = std::stoll(value, &consumed);
    if (consumed != value.size()) return std::nullopt;
    return millis;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

} // namespace

CutoffPolicy::CutoffPolicy(std::shared_ptr<db::PreferenceStore> prefs) : prefs_(std::move(prefs)) {
}

util::TimePoint CutoffPolicy::Initialize(bool has_existing_data, util::TimePoint now) {
  std::lock_guard lock(mutex_);
  if (cutoff_) return *cutoff_;

  if (auto stored = prefs_->Get(kKey)) {
    if (auto millis = ParseMillis(*stored)) {
      cutoff_ = util::FromUnixMillis(*millis);
      return *cutoff_;
    }
    RDSYNC_LOG_WARN("Ignoring unreadable new user cutoff", {StringField("value", *stored)});
  }

  const auto cutoff = has_existing_data ? util::DistantPast() : now;
  const auto millis = util::ToUnixMillis(cutoff);

  // keep the in-memory value even when persisting fails; next start retries
  if (auto put = prefs_->Put(kKey, std::to_string(millis)); !put) {
    RDSYNC_LOG_WARN("Failed to persist new user cutoff", {StringField("error", put.message)});
  }

  RDSYNC_LOG_INFO("New user cutoff initialized", {IntField("cutoff_ms", millis), rdsync::observability::BoolField("existing_data", has_existing_data)});
  cutoff_ = util::FromUnixMillis(millis);
  return *cutoff_;
}

util::TimePoint CutoffPolicy::NewUserCutoffTime() const {
  std::lock_guard lock(mutex_);
  if (!cutoff_) throw util::InvalidState("new user cutoff read before Initialize()");
  return *cutoff_;
}

} // namespace rdsync::sync
