#include "internal/sync/metadata.hpp"

#include <google/protobuf/util/message_differencer.h>
#include <google/protobuf/util/time_util.h>

namespace rdsync::sync {

bool SameMetadata(const rdsync::v1::RemoteDataMetadata& a, const rdsync::v1::RemoteDataMetadata& b) {
  return google::protobuf::util::MessageDifferencer::Equivalent(a, b);
}

bool Supersedes(const rdsync::v1::RemoteDataMetadata& newer, const rdsync::v1::RemoteDataMetadata& older) {
  return newer.last_modified() > older.last_modified();
}

std::optional<rdsync::v1::RemoteDataInfo> RemoteDataInfoOf(const rdsync::v1::Schedule& schedule) {
  if (!schedule.has_remote_data_info()) return std::nullopt;
  return schedule.remote_data_info();
}

} // namespace rdsync::sync
