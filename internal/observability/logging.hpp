#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}

namespace cadence::config::v1 {
class RuntimeConfig;
}

namespace cadence::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

void InitializeLogging(const cadence::config::v1::RuntimeConfig& config);

// Replaces the sink set up by InitializeLogging (tests capture output this way).
void InstallLogger(std::shared_ptr<spdlog::logger> logger);

void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace cadence::observability

#define CADENCE_LOG_INFO(message, ...) ::cadence::observability::LogInfo((message), ##__VA_ARGS__)
#define CADENCE_LOG_WARN(message, ...) ::cadence::observability::LogWarn((message), ##__VA_ARGS__)
#define CADENCE_LOG_ERROR(message, ...) ::cadence::observability::LogError((message), ##__VA_ARGS__)
