#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/util/time.hpp"

namespace launcher::observability {
namespace {

std::string ResolveLevel(const launcher::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("LAUNCHER_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const launcher::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("LAUNCHER_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

// Values containing spaces are quoted so the k=v form stays parseable.
void AppendValue(std::ostringstream& out, const std::string& value) {
  if (value.find_first_of(" \"=") == std::string::npos && !value.empty()) {
    out << value;
    return;
  }

  out << '"';
  for (char c : value) {
    if (c == '"' || c == '\\') {
      out << '\\';
    }
    out << c;
  }
  out << '"';
}

template <typename Fields>
std::string SerializeFields(const Fields& fields) {
  std::ostringstream out;
  bool               first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=';
    AppendValue(out, field.value);
  }
  return out.str();
}

template <typename Fields>
void Emit(spdlog::level::level_enum level, std::string_view message, const Fields& fields) {
  auto serialized_fields = SerializeFields(fields);
  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  spdlog::log(level, "{}", message);
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

LogField DurationField(std::string_view key, std::chrono::nanoseconds value) {
  return {std::string(key), util::FormatDuration(value)};
}

void InitializeLogging(const launcher::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::stdout_color_mt("launcher");
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  Emit(level, message, fields);
}

void Log(spdlog::level::level_enum level, std::string_view message, const std::vector<LogField>& fields) {
  Emit(level, message, fields);
}

} // namespace launcher::observability
