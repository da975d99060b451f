#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/preference_store.hpp"
#include "internal/db/api/result.hpp"
#include "rdsync/v1.hpp"

namespace rdsync::sync {

/*
  Last processed metadata and schedule ids per remote source.

  Records live in the preference store as protobuf JSON under
  `rdsync.version.<source>` and are cached after the first read.

  Commit is the only compare-and-swap point of the sync core: a commit whose
  metadata is superseded by the stored one is rejected with StaleCommit, so
  stored metadata never moves backwards.
*/
class VersionStore {
 public:
  static constexpr const char* kKeyPrefix = "rdsync.version.";

  explicit VersionStore(std::shared_ptr<db::PreferenceStore> prefs);

  std::optional<rdsync::v1::RemoteDataMetadata> Get(const std::string& source);

  std::optional<rdsync::v1::VersionRecord> GetRecord(const std::string& source);

  db::Result Commit(const std::string& source, const rdsync::v1::RemoteDataMetadata& metadata, const std::vector<std::string>& schedule_ids,
                    const std::string& sdk_version = {}, bool complete = true);

  bool HasAnyRecord();

 private:
  static std::string Key(const std::string& source);

  std::optional<rdsync::v1::VersionRecord> LoadLocked(const std::string& source);

  std::shared_ptr<db::PreferenceStore> prefs_;

  std::mutex                                                             mutex_;
  std::unordered_map<std::string, std::optional<rdsync::v1::VersionRecord>> cache_;
};

} // namespace rdsync::sync
