#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace purchase::runtime::config {
class RuntimeConfig;
}

namespace purchase::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DoubleField(std::string_view key, double value);

enum class LogSink {
  kStdout,
  // interactive tools keep stdout for their own output
  kStderr,
};

void InitializeLogging(const purchase::runtime::config::RuntimeConfig& config, LogSink console = LogSink::kStdout);
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

} // namespace purchase::observability

#define PURCHASE_LOG_DEBUG(message, ...) ::purchase::observability::LogDebug((message), ##__VA_ARGS__)
#define PURCHASE_LOG_INFO(message, ...) ::purchase::observability::LogInfo((message), ##__VA_ARGS__)
#define PURCHASE_LOG_WARN(message, ...) ::purchase::observability::LogWarn((message), ##__VA_ARGS__)
#define PURCHASE_LOG_ERROR(message, ...) ::purchase::observability::LogError((message), ##__VA_ARGS__)
