#include "internal/sync/version_store.hpp"

#include <algorithm>

#include <google/protobuf/util/json_util.h>

#include "internal/observability/logging.hpp"
#include "internal/sync/metadata.hpp"

namespace rdsync::sync {

using rdsync::db::ErrorCode;
using rdsync::db::Result;
using rdsync::observability::StringField;

VersionStore::VersionStore(std::shared_ptr<db::PreferenceStore> prefs) : prefs_(std::move(prefs)) {
}

std::string VersionStore::Key(const std::string& source) {
  return kKeyPrefix + source;
}

std::optional<rdsync::v1::VersionRecord> VersionStore::LoadLocked(const std::string& source) {
  if (auto it = cache_.find(source); it != cache_.end()) return it->second;

  std::optional<rdsync::v1::VersionRecord> record;
  if (auto json = prefs_->Get(Key(source))) {
    rdsync::v1::VersionRecord parsed;

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;

    auto status = google::protobuf::util::JsonStringToMessage(*json, &parsed, options);
    if (status.ok()) {
      record = std::move(parsed);
    } else {
      // unreadable record: behave as if the source was never processed
      RDSYNC_LOG_WARN("Discarding unreadable version record",
                      {StringField("source", source), StringField("error", std::string(status.message()))});
    }
  }

  cache_[source] = record;
  return record;
}

std::optional<rdsync::v1::RemoteDataMetadata> VersionStore::Get(const std::string& source) {
  std::lock_guard lock(mutex_);
  auto            record = LoadLocked(source);
  if (!record) return std::nullopt;
  return record->metadata();
}

std::optional<rdsync::v1::VersionRecord> VersionStore::GetRecord(const std::string& source) {
  std::lock_guard lock(mutex_);
  return LoadLocked(source);
}

Result VersionStore::Commit(const std::string& source, const rdsync::v1::RemoteDataMetadata& metadata,
                            const std::vector<std::string>& schedule_ids, const std::string& sdk_version, bool complete) {
  std::lock_guard lock(mutex_);

  const auto current = LoadLocked(source);
  if (current && Supersedes(current->metadata(), metadata)) {
    return Result::Err(ErrorCode::StaleCommit, "stored metadata for " + source + " is newer");
  }

  std::vector<std::string> ids = schedule_ids;
  std::sort(ids.begin(), ids.end());
  ids.erase(std::unique(ids.begin(), ids.end()), ids.end());

  rdsync::v1::VersionRecord record;
  record.set_source(source);
  *record.mutable_metadata() = metadata;
  for (auto& id : ids) record.add_schedule_ids(std::move(id));
  record.set_sdk_version(sdk_version);
  record.set_complete(complete);

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(record, &json);
  if (!status.ok()) {
    return Result::Err(ErrorCode::InternalError, std::string(status.message()));
  }

  auto put = prefs_->Put(Key(source), json);
  if (!put) return put;

  cache_[source] = std::move(record);
  return Result::Ok();
}

bool VersionStore::HasAnyRecord() {
  {
    std::lock_guard lock(mutex_);
    for (const auto& [_, record] : cache_) {
      if (record) return true;
    }
  }
  return !prefs_->Keys(kKeyPrefix).empty();
}

} // namespace rdsync::sync
