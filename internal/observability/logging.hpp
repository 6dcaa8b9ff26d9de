#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace receiver::runtime::config {
class RuntimeConfig;
}

namespace receiver::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// key=value pairs separated by spaces; values with spaces, quotes or '=' are
// quoted, and secret-bearing keys (token, password, ...) are redacted.
std::string FormatLogFields(std::initializer_list<LogField> fields);

void InitializeLogging(const receiver::runtime::config::RuntimeConfig& config);
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

} // namespace receiver::observability

#define RECEIVER_LOG_DEBUG(message, ...) ::receiver::observability::LogDebug((message), ##__VA_ARGS__)
#define RECEIVER_LOG_INFO(message, ...) ::receiver::observability::LogInfo((message), ##__VA_ARGS__)
#define RECEIVER_LOG_WARN(message, ...) ::receiver::observability::LogWarn((message), ##__VA_ARGS__)
#define RECEIVER_LOG_ERROR(message, ...) ::receiver::observability::LogError((message), ##__VA_ARGS__)
