#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace debugpod::runtime::config {
class RuntimeConfig;
}

namespace debugpod::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

/*
  Orchestrator log: one "message key=value ..." line per event on stderr,
  mirrored to logging.file when configured. DEBUGPOD_LOG_LEVEL and
  DEBUGPOD_LOG_PATTERN override the configured level and pattern.

  Agent output never goes through here; each agent writes its own log file
  inside its working copy.
*/
void InitializeLogging(const debugpod::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

// Throws std::invalid_argument for names spdlog does not know.
spdlog::level::level_enum ParseLevel(std::string_view name);

// key=value pairs; values with spaces, quotes or '=' are quoted.
std::string FormatFields(std::initializer_list<LogField> fields);

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

} // namespace debugpod::observability

#define DEBUGPOD_LOG_DEBUG(message, ...) ::debugpod::observability::LogDebug((message), ##__VA_ARGS__)
#define DEBUGPOD_LOG_INFO(message, ...) ::debugpod::observability::LogInfo((message), ##__VA_ARGS__)
#define DEBUGPOD_LOG_WARN(message, ...) ::debugpod::observability::LogWarn((message), ##__VA_ARGS__)
#define DEBUGPOD_LOG_ERROR(message, ...) ::debugpod::observability::LogError((message), ##__VA_ARGS__)
