#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "internal/sync/remote_data_provider.hpp"

namespace rdsync::transport {

/*
  Remote data read from a directory: one `<source>.json` file per source,
  holding a RemotePayload in protobuf JSON.

  Fetch completes on the calling thread. Reload() stands in for a push
  notification and tells listeners that sources may have changed.
*/
class FileRemoteDataProvider final : public sync::RemoteDataProvider {
 public:
  // Empty `sources` means every *.json file in `directory`.
  FileRemoteDataProvider(std::filesystem::path directory, std::vector<std::string> sources = {});

  uint64_t AddChangeListener(ChangeListener listener) override;

  void RemoveChangeListener(uint64_t token) override;

  std::vector<std::string> Sources() override;

  void Fetch(const std::string& source, FetchCallback done) override;

  void NotifyOutdated(const rdsync::v1::RemoteDataInfo& info) override;

  // Notifies listeners about `sources`, or about every source when empty.
  void Reload(std::vector<std::string> sources = {});

  static sync::FetchResult ReadPayload(const std::filesystem::path& path, const std::string& source);

 private:
  std::filesystem::path PathOf(const std::string& source) const;

  std::filesystem::path    directory_;
  std::vector<std::string> sources_;

  std::mutex                         mutex_;
  uint64_t                           next_token_ = 1;
  std::map<uint64_t, ChangeListener> listeners_;
};

} // namespace rdsync::transport
