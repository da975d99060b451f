#include "memory_preference_store.hpp"

namespace rdsync::db::memory {

MemoryPreferenceStore::MemoryPreferenceStore() = default;

std::optional<std::string> MemoryPreferenceStore::Get(const std::string& key) {
  std::lock_guard lock(mutex_);
  auto            it = values_.find(key);
  if (it == values_.end()) return std::nullopt;
  return it->second;
}

Result MemoryPreferenceStore::Put(const std::string& key, const std::string& value) {
  std::lock_guard lock(mutex_);
  values_[key] = value;
  return Result::Ok();
}

Result MemoryPreferenceStore::Remove(const std::string& key) {
  std::lock_guard lock(mutex_);
  if (values_.erase(key) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

std::vector<std::string> MemoryPreferenceStore::Keys(const std::string& prefix) {
  std::lock_guard          lock(mutex_);
  std::vector<std::string> keys;
  for (auto it = values_.lower_bound(prefix); it != values_.end(); ++it) {
    if (it->first.compare(0, prefix.size(), prefix) != 0) break;
    keys.push_back(it->first);
  }
  return keys;
}

} // namespace rdsync::db::memory
