#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace imgvar::runtime::config {
class RuntimeConfig;
}

namespace imgvar::observability {

/*
  Structured logging on top of spdlog.

  A line is the message followed by key=value fields; values containing
  spaces, quotes or '=' are double-quoted.

    Created variant parent_id=7 wanted=100x100 size=100x67 storage=STORAGE_KIND_INLINE

  Before InitializeLogging() lines go to spdlog's default logger.
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField SizeField(std::string_view key, std::int32_t width, std::int32_t height);

// Level/pattern from IMGVAR_LOG_LEVEL/IMGVAR_LOG_PATTERN, then the config.
// Throws std::runtime_error on an unknown level name.
void InitializeLogging(const imgvar::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace imgvar::observability

#define IMGVAR_LOG_DEBUG(message, ...) ::imgvar::observability::Log(spdlog::level::debug, (message), ##__VA_ARGS__)
#define IMGVAR_LOG_INFO(message, ...) ::imgvar::observability::Log(spdlog::level::info, (message), ##__VA_ARGS__)
#define IMGVAR_LOG_WARN(message, ...) ::imgvar::observability::Log(spdlog::level::warn, (message), ##__VA_ARGS__)
#define IMGVAR_LOG_ERROR(message, ...) ::imgvar::observability::Log(spdlog::level::err, (message), ##__VA_ARGS__)
