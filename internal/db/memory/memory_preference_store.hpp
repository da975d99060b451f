#pragma once

#include <map>
#include <mutex>

#include "internal/db/api/preference_store.hpp"

namespace rdsync::db::memory {

/*
  Process-local preference store. Used by tests and `preferences.in_memory`.
*/
class MemoryPreferenceStore final : public db::PreferenceStore {
 public:
  MemoryPreferenceStore();

  std::optional<std::string> Get(const std::string& key) override;
  Result                     Put(const std::string& key, const std::string& value) override;
  Result                     Remove(const std::string& key) override;
  std::vector<std::string>   Keys(const std::string& prefix) override;

 private:
  std::mutex                         mutex_;
  std::map<std::string, std::string> values_;
};

} // namespace rdsync::db::memory
