#include "internal/observability/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config.pb.h"

namespace debugpod::observability {
namespace {

constexpr const char* kLoggerName     = "debugpod";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";

std::string FromEnvOr(const char* variable, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(variable); value != nullptr && *value != '\0') {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool NeedsQuoting(const std::string& value) {
  return value.empty() || value.find_first_of(" \t\"=") != std::string::npos;
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

spdlog::level::level_enum ParseLevel(std::string_view name) {
  const auto level = spdlog::level::from_str(std::string(name));
  // from_str maps anything unknown to off
  if (level == spdlog::level::off && name != "off") {
    throw std::invalid_argument("unknown log level '" + std::string(name) + "'");
  }
  return level;
}

std::string FormatFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += field.key;
    out.push_back('=');
    if (!NeedsQuoting(field.value)) {
      out += field.value;
      continue;
    }
    out.push_back('"');
    for (char c : field.value) {
      if (c == '"' || c == '\\') out.push_back('\\');
      out.push_back(c);
    }
    out.push_back('"');
  }
  return out;
}

void InitializeLogging(const debugpod::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();
  const auto  level   = ParseLevel(FromEnvOr("DEBUGPOD_LOG_LEVEL", logging.level(), "info"));

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!logging.file().empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(logging.file()));
  }

  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(FromEnvOr("DEBUGPOD_LOG_PATTERN", logging.pattern(), kDefaultPattern));
  logger->set_level(level);
  logger->flush_on(spdlog::level::warn);

  spdlog::drop(kLoggerName);
  spdlog::set_default_logger(std::move(logger));
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }
  if (fields.size() == 0) {
    spdlog::log(level, "{}", message);
    return;
  }
  spdlog::log(level, "{} {}", message, FormatFields(fields));
}

} // namespace debugpod::observability
