#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace threadnet::runtime::config {
class RuntimeConfig;
}

namespace threadnet::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

/*
  Level, pattern and trace context come from the config, overridden by
  THREADNET_LOG_LEVEL / THREADNET_LOG_PATTERN / THREADNET_LOG_INCLUDE_TRACE_CONTEXT.
  Safe to call more than once; the last call wins.
*/
void InitializeLogging(const threadnet::runtime::config::RuntimeConfig& config);
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

} // namespace threadnet::observability

#define THREADNET_LOG_DEBUG(message, ...) ::threadnet::observability::LogDebug((message), ##__VA_ARGS__)
#define THREADNET_LOG_INFO(message, ...) ::threadnet::observability::LogInfo((message), ##__VA_ARGS__)
#define THREADNET_LOG_WARN(message, ...) ::threadnet::observability::LogWarn((message), ##__VA_ARGS__)
#define THREADNET_LOG_ERROR(message, ...) ::threadnet::observability::LogError((message), ##__VA_ARGS__)
