#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"

namespace rdsync::db {

/*
  Durable key -> value preference storage.

  GUARANTEES (all backends):

  - Put is atomic per key: readers see the old or the new value, never a mix
  - A successful Put survives process restart (memory backend excepted)
  - Implementations are safe to call from any thread
*/

class PreferenceStore {
 public:
  virtual ~PreferenceStore() = default;

  virtual std::optional<std::string> Get(const std::string& key) = 0;

  virtual Result Put(const std::string& key, const std::string& value) = 0;

  virtual Result Remove(const std::string& key) = 0;

  // Keys starting with `prefix`, sorted.
  virtual std::vector<std::string> Keys(const std::string& prefix) = 0;
};

} // namespace rdsync::db
