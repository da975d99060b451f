#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace google::protobuf {
class Timestamp;
}

namespace rdsync::runtime::config {
class RuntimeConfig;
}

namespace rdsync::observability {

/*
  Structured logging over spdlog.

  Messages are followed by `key=value` fields. Until InitializeLogging runs,
  records go to spdlog's default logger, so library code and tests can log
  without any setup. RDSYNC_LOG_LEVEL / RDSYNC_LOG_PATTERN override config.
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
// RFC 3339, e.g. remote data last_modified
LogField TimestampField(std::string_view key, const google::protobuf::Timestamp& value);

void InitializeLogging(const rdsync::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace rdsync::observability

#define RDSYNC_LOG_DEBUG(message, ...) ::rdsync::observability::LogDebug((message), ##__VA_ARGS__)
#define RDSYNC_LOG_INFO(message, ...) ::rdsync::observability::LogInfo((message), ##__VA_ARGS__)
#define RDSYNC_LOG_WARN(message, ...) ::rdsync::observability::LogWarn((message), ##__VA_ARGS__)
#define RDSYNC_LOG_ERROR(message, ...) ::rdsync::observability::LogError((message), ##__VA_ARGS__)
