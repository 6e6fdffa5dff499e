#pragma once

#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace bazaar::runtime::config {
class RuntimeConfig;
}

namespace bazaar::observability {

struct LogField {
  std::string key;
  std::string value;
};

// Values that are empty or contain spaces, quotes or '=' are quoted so
// every line stays parseable as key=value pairs.
LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField UintField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);
// Rendered as "<n>ms".
LogField DurationField(std::string_view key, std::chrono::milliseconds value);

/*
  Installs the process-wide logger.

  Level and pattern come from BAZAAR_LOG_LEVEL / BAZAAR_LOG_PATTERN when
  set, else from config. Throws std::runtime_error on an unknown level.
*/
void InitializeLogging(const bazaar::runtime::config::RuntimeConfig& config);
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

} // namespace bazaar::observability

#define BAZAAR_LOG_DEBUG(message, ...) ::bazaar::observability::LogDebug((message), ##__VA_ARGS__)
#define BAZAAR_LOG_INFO(message, ...) ::bazaar::observability::LogInfo((message), ##__VA_ARGS__)
#define BAZAAR_LOG_WARN(message, ...) ::bazaar::observability::LogWarn((message), ##__VA_ARGS__)
#define BAZAAR_LOG_ERROR(message, ...) ::bazaar::observability::LogError((message), ##__VA_ARGS__)
