#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace renderplan::runtime::config {
class RuntimeConfig;
}

namespace renderplan::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);

// Installs a stderr logger; stdout is left to command output.
void InitializeLogging(const renderplan::runtime::config::RuntimeConfig& config);
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

} // namespace renderplan::observability

#define RENDERPLAN_LOG_DEBUG(message, ...) ::renderplan::observability::LogDebug((message), ##__VA_ARGS__)
#define RENDERPLAN_LOG_INFO(message, ...) ::renderplan::observability::LogInfo((message), ##__VA_ARGS__)
#define RENDERPLAN_LOG_WARN(message, ...) ::renderplan::observability::LogWarn((message), ##__VA_ARGS__)
#define RENDERPLAN_LOG_ERROR(message, ...) ::renderplan::observability::LogError((message), ##__VA_ARGS__)
