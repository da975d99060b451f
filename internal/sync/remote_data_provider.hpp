#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "rdsync/v1.hpp"

namespace rdsync::sync {

struct FetchResult {
  bool                      ok = false;
  rdsync::v1::RemotePayload payload;
  std::string               error;

  static FetchResult Ok(rdsync::v1::RemotePayload payload) {
    return {true, std::move(payload), {}};
  }

  static FetchResult Failed(std::string error) {
    return {false, {}, std::move(error)};
  }
};

/*
  Transport seam: whatever downloads remote data.

  Callbacks may arrive on any thread. Retry/backoff after a failed fetch is
  the provider's business; the sync core only reacts to outcomes.
*/
class RemoteDataProvider {
 public:
  using ChangeListener = std::function<void(const std::vector<std::string>& sources)>;
  using FetchCallback  = std::function<void(FetchResult)>;

  virtual ~RemoteDataProvider() = default;

  // Returns a token for RemoveChangeListener.
  virtual uint64_t AddChangeListener(ChangeListener listener) = 0;

  virtual void RemoveChangeListener(uint64_t token) = 0;

  // Sources with data available right now.
  virtual std::vector<std::string> Sources() = 0;

  // Delivers the current payload of `source`; `done` is called exactly once.
  virtual void Fetch(const std::string& source, FetchCallback done) = 0;

  // Hint that data described by `info` is known to be outdated.
  virtual void NotifyOutdated(const rdsync::v1::RemoteDataInfo& info) = 0;
};

} // namespace rdsync::sync
