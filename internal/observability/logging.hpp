#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace catalog::runtime::config {
class RuntimeConfig;
}

namespace catalog::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Level and pattern come from CATALOG_LOG_LEVEL and CATALOG_LOG_PATTERN when
// set, then from config. Throws on an unknown level name.
void InitializeLogging(const catalog::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

// Writes `message key=value ...` to the default logger.
void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace catalog::observability

#define CATALOG_LOG_DEBUG(message, ...) ::catalog::observability::Log(::spdlog::level::debug, (message), ##__VA_ARGS__)
#define CATALOG_LOG_INFO(message, ...) ::catalog::observability::Log(::spdlog::level::info, (message), ##__VA_ARGS__)
#define CATALOG_LOG_WARN(message, ...) ::catalog::observability::Log(::spdlog::level::warn, (message), ##__VA_ARGS__)
#define CATALOG_LOG_ERROR(message, ...) ::catalog::observability::Log(::spdlog::level::err, (message), ##__VA_ARGS__)
