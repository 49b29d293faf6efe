#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace fleetlink::observability {
namespace {

std::string ResolveLevel(const fleetlink::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("FLEETLINK_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const fleetlink::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("FLEETLINK_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
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

LogField VehicleField(std::string_view vehicle_id) {
  return StringField("vehicle_id", vehicle_id);
}

LogField OrderField(std::string_view order_id) {
  return StringField("order_id", order_id);
}

std::string FormatFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool               first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=';

    // broker and sqlite errors carry spaces; quote so each line stays key=value parseable
    const bool quote = field.value.empty() || field.value.find_first_of(" \t\"=") != std::string::npos;
    if (!quote) {
      out << field.value;
      continue;
    }
    out << '"';
    for (const char c : field.value) {
      if (c == '"' || c == '\\') {
        out << '\\';
      }
      out << c;
    }
    out << '"';
  }
  return out.str();
}

void InitializeLogging(const fleetlink::runtime::config::RuntimeConfig& config) {
  spdlog::drop("fleetlink");
  auto logger = spdlog::stdout_color_mt("fleetlink");
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = FormatFields(fields);

  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

} // namespace fleetlink::observability
