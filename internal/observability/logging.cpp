#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace imgvar::observability {
namespace {

constexpr const char* kLoggerName     = "imgvar";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

// Environment wins over the config file, the config file over the default.
std::string Pick(const char* env_name, const std::string& configured, const char* fallback) {
  if (const char* env = std::getenv(env_name); env != nullptr && *env != '\0') return env;
  if (!configured.empty()) return configured;
  return fallback;
}

// spdlog maps unknown names to "off", which would silently drop every line.
spdlog::level::level_enum ParseLevel(const std::string& name) {
  const auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") {
    throw std::runtime_error("unknown log level '" + name + "'");
  }
  return level;
}

bool NeedsQuoting(const std::string& value) {
  return value.empty() || value.find_first_of(" \t\"=") != std::string::npos;
}

void AppendField(std::string& out, const LogField& field) {
  out += ' ';
  out += field.key;
  out += '=';
  if (!NeedsQuoting(field.value)) {
    out += field.value;
    return;
  }
  out += '"';
  for (char c : field.value) {
    if (c == '"' || c == '\\') out += '\\';
    out += c;
  }
  out += '"';
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

LogField SizeField(std::string_view key, std::int32_t width, std::int32_t height) {
  return {std::string(key), std::to_string(width) + "x" + std::to_string(height)};
}

// stderr only: imgvarctl prints records as JSON on stdout.
void InitializeLogging(const imgvar::runtime::config::RuntimeConfig& config) {
  const auto level   = ParseLevel(Pick("IMGVAR_LOG_LEVEL", config.logging().level(), "info"));
  const auto pattern = Pick("IMGVAR_LOG_PATTERN", config.logging().pattern(), kDefaultPattern);

  spdlog::drop(kLoggerName);
  auto logger = spdlog::stderr_color_mt(kLoggerName);
  logger->set_pattern(pattern);
  logger->set_level(level);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;

  std::string line(message);
  for (const auto& field : fields) {
    AppendField(line, field);
  }
  spdlog::log(level, "{}", line);
}

} // namespace imgvar::observability
