#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace courier::runtime::config {
class RuntimeConfig;
}

namespace courier::observability {

/*
  Structured logging on top of spdlog. Every line is the message followed by
  key=value pairs; values holding spaces are quoted so a line still splits on
  whitespace.

  COURIER_LOG_LEVEL, COURIER_LOG_PATTERN and COURIER_LOG_INCLUDE_TRACE_CONTEXT
  override the logging section of the node config.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Bundle ids and node ids are 64 hex chars; logs carry the first 12.
LogField IdField(std::string_view key, std::string_view hex_id);

void InitializeLogging(const courier::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace courier::observability

#define COURIER_LOG_DEBUG(message, ...) ::courier::observability::Log(::spdlog::level::debug, (message), ##__VA_ARGS__)
#define COURIER_LOG_INFO(message, ...) ::courier::observability::Log(::spdlog::level::info, (message), ##__VA_ARGS__)
#define COURIER_LOG_WARN(message, ...) ::courier::observability::Log(::spdlog::level::warn, (message), ##__VA_ARGS__)
#define COURIER_LOG_ERROR(message, ...) ::courier::observability::Log(::spdlog::level::err, (message), ##__VA_ARGS__)
