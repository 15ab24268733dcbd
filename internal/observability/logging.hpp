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

namespace shipx::runtime::config {
class RuntimeConfig;
}

namespace shipx::observability {

inline constexpr const char* kLoggerName = "shipx-courier";

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

/*
  Builds the process logger (console + append-only log file), installs it as
  the spdlog default and returns it so it can be handed to the workflow.
*/
std::shared_ptr<spdlog::logger> InitializeLogging(const shipx::runtime::config::RuntimeConfig& config);
void                            ShutdownLogging();

void Log(spdlog::logger& logger, spdlog::level::level_enum level, std::string_view message,
         std::initializer_list<LogField> fields = {});

// Default logger variants.
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

} // namespace shipx::observability

#define SHIPX_LOG_INFO(message, ...) ::shipx::observability::LogInfo((message), ##__VA_ARGS__)
#define SHIPX_LOG_WARN(message, ...) ::shipx::observability::LogWarn((message), ##__VA_ARGS__)
#define SHIPX_LOG_ERROR(message, ...) ::shipx::observability::LogError((message), ##__VA_ARGS__)
