#include "internal/transport/file_remote_data_provider.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <fstream>
#include <sstream>

#include "internal/observability/logging.hpp"
#include "internal/sync/metadata.hpp"

namespace rdsync::transport {

using rdsync::observability::IntField;
using rdsync::observability::StringField;

FileRemoteDataProvider::FileRemoteDataProvider(std::filesystem::path directory, std::vector<std::string> sources)
    : directory_(std::move(directory)), sources_(std::move(sources)) {
}

uint64_t FileRemoteDataProvider::AddChangeListener(ChangeListener listener) {
  std::lock_guard lock(mutex_);
  const auto      token = next_token_++;
  listeners_.emplace(token, std::move(listener));
  return token;
}

void FileRemoteDataProvider::RemoveChangeListener(uint64_t token) {
  std::lock_guard lock(mutex_);
  listeners_.erase(token);
}

std::vector<std::string> FileRemoteDataProvider::Sources() {
  if (!sources_.empty()) return sources_;

  std::vector<std::string> out;
  std::error_code          ec;
  for (const auto& entry : std::filesystem::directory_iterator(directory_, ec)) {
    if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;
    out.push_back(entry.path().stem().string());
  }
  if (ec) {
    RDSYNC_LOG_WARN("Failed to list remote data directory", {StringField("path", directory_.string()), StringField("error", ec.message())});
  }

  std::sort(out.begin(), out.end());
  return out;
}

std::filesystem::path FileRemoteDataProvider::PathOf(const std::string& source) const {
  return directory_ / (source + ".json");
}

sync::FetchResult FileRemoteDataProvider::ReadPayload(const std::filesystem::path& path, const std::string& source) {
  std::ifstream in(path);
  if (!in) return sync::FetchResult::Failed("cannot open " + path.string());

  std::stringstream buffer;
  buffer << in.rdbuf();

  rdsync::v1::RemotePayload                 payload;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(buffer.str(), &payload, options);
  if (!status.ok()) return sync::FetchResult::Failed("invalid payload " + path.string() + ": " + std::string(status.message()));

  if (payload.source().empty()) payload.set_source(source);
  if (payload.source() != source) {
    return sync::FetchResult::Failed("payload " + path.string() + " belongs to source " + payload.source());
  }

  return sync::FetchResult::Ok(std::move(payload));
}

void FileRemoteDataProvider::Fetch(const std::string& source, FetchCallback done) {
  auto result = ReadPayload(PathOf(source), source);
  if (result.ok) {
    RDSYNC_LOG_DEBUG("Remote payload read",
                     {StringField("source", source), IntField("schedules", static_cast<int64_t>(result.payload.schedules_size()))});
  }
  done(std::move(result));
}

void FileRemoteDataProvider::NotifyOutdated(const rdsync::v1::RemoteDataInfo& info) {
  const auto current = ReadPayload(PathOf(info.source()), info.source());
  if (!current.ok) {
    RDSYNC_LOG_WARN("Outdated source is unreadable", {StringField("source", info.source()), StringField("error", current.error)});
    return;
  }

  // a newer file on disk counts as a change notification
  if (!sync::SameMetadata(current.payload.metadata(), info.metadata())) Reload({info.source()});
}

void FileRemoteDataProvider::Reload(std::vector<std::string> sources) {
  if (sources.empty()) sources = Sources();

  std::vector<ChangeListener> listeners;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [_, listener] : listeners_) listeners.push_back(listener);
  }

  RDSYNC_LOG_DEBUG("Remote data changed", {IntField("sources", static_cast<int64_t>(sources.size())), IntField("listeners", static_cast<int64_t>(listeners.size()))});
  for (const auto& listener : listeners) listener(sources);
}

} // namespace rdsync::transport
