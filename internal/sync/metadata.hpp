#pragma once

#include <optional>

#include "rdsync/v1.hpp"

namespace rdsync::sync {

// Field-by-field equality, attributes included.
bool SameMetadata(const rdsync::v1::RemoteDataMetadata& a, const rdsync::v1::RemoteDataMetadata& b);

// `newer` was produced strictly after `older`.
bool Supersedes(const rdsync::v1::RemoteDataMetadata& newer, const rdsync::v1::RemoteDataMetadata& older);

std::optional<rdsync::v1::RemoteDataInfo> RemoteDataInfoOf(const rdsync::v1::Schedule& schedule);

} // namespace rdsync::sync
