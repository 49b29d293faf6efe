#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace fleetlink::runtime::config {
class RuntimeConfig;
}

namespace fleetlink::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Fleet identifiers under fixed keys so log queries can join on them.
LogField VehicleField(std::string_view vehicle_id);
LogField OrderField(std::string_view order_id);

// key=value pairs separated by spaces; values with whitespace, '"' or '=' are quoted.
std::string FormatFields(std::initializer_list<LogField> fields);

void InitializeLogging(const fleetlink::runtime::config::RuntimeConfig& config);
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

} // namespace fleetlink::observability

#define FLEETLINK_LOG_DEBUG(message, ...) ::fleetlink::observability::LogDebug((message), ##__VA_ARGS__)
#define FLEETLINK_LOG_INFO(message, ...) ::fleetlink::observability::LogInfo((message), ##__VA_ARGS__)
#define FLEETLINK_LOG_WARN(message, ...) ::fleetlink::observability::LogWarn((message), ##__VA_ARGS__)
#define FLEETLINK_LOG_ERROR(message, ...) ::fleetlink::observability::LogError((message), ##__VA_ARGS__)
