#pragma once

#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace launcher::runtime::config {
class RuntimeConfig;
}

namespace launcher::observability {

// One key=value pair appended to a log line. Values containing spaces are
// quoted by Log().
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DurationField(std::string_view key, std::chrono::nanoseconds value);

// Installs the "launcher" stdout logger as the spdlog default. Call once.
void InitializeLogging(const launcher::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});
// Used by the service middleware, which builds its field list per call.
void Log(spdlog::level::level_enum level, std::string_view message, const std::vector<LogField>& fields);

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

} // namespace launcher::observability

#define LAUNCHER_LOG_DEBUG(message, ...) ::launcher::observability::LogDebug((message), ##__VA_ARGS__)
#define LAUNCHER_LOG_INFO(message, ...) ::launcher::observability::LogInfo((message), ##__VA_ARGS__)
#define LAUNCHER_LOG_WARN(message, ...) ::launcher::observability::LogWarn((message), ##__VA_ARGS__)
#define LAUNCHER_LOG_ERROR(message, ...) ::launcher::observability::LogError((message), ##__VA_ARGS__)
