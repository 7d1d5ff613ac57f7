#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace timekeeper::runtime::config {
class RuntimeConfig;
}

namespace timekeeper::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
// Match clock rendered as HH:MM:SS, e.g. clock=01:29:59.
LogField ClockField(std::string_view key, std::int32_t seconds_remaining);

void InitializeLogging(const timekeeper::runtime::config::RuntimeConfig& config);
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

} // namespace timekeeper::observability

#define TIMEKEEPER_LOG_DEBUG(message, ...) ::timekeeper::observability::LogDebug((message), ##__VA_ARGS__)
#define TIMEKEEPER_LOG_INFO(message, ...) ::timekeeper::observability::LogInfo((message), ##__VA_ARGS__)
#define TIMEKEEPER_LOG_WARN(message, ...) ::timekeeper::observability::LogWarn((message), ##__VA_ARGS__)
#define TIMEKEEPER_LOG_ERROR(message, ...) ::timekeeper::observability::LogError((message), ##__VA_ARGS__)
