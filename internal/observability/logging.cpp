#include "internal/observability/logging.hpp"

#include <atomic>
#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace courier::observability {
namespace {

constexpr const char* kLoggerName     = "courierd";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

struct LogSettings {
  std::string level;
  std::string pattern;
  bool        trace_context{false};
};

std::string EnvOr(const char* name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(name)) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

LogSettings ResolveSettings(const courier::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  LogSettings settings;
  settings.level         = EnvOr("COURIER_LOG_LEVEL", logging.level(), "info");
  settings.pattern       = EnvOr("COURIER_LOG_PATTERN", logging.pattern(), kDefaultPattern);
  settings.trace_context = logging.include_trace_context();
  if (const char* flag = std::getenv("COURIER_LOG_INCLUDE_TRACE_CONTEXT")) {
    settings.trace_context = std::string(flag) == "1" || std::string(flag) == "true";
  }
  return settings;
}

std::atomic<bool> g_trace_context{false};

void AppendField(std::string& line, std::string_view key, std::string_view value) {
  line += ' ';
  line += key;
  line += '=';
  if (!value.empty() && value.find_first_of(" \t\"") == std::string_view::npos) {
    line += value;
    return;
  }
  line += '"';
  for (const char c : value) {
    if (c == '"' || c == '\\') line += '\\';
    line += c;
  }
  line += '"';
}

#ifdef ENABLE_OTEL
template <std::size_t N>
std::string Hex(const opentelemetry::nostd::span<const uint8_t, N> bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(N * 2);
  for (const uint8_t b : bytes) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

void AppendTraceContext(std::string& line) {
  if (!g_trace_context.load(std::memory_order_relaxed)) {
    return;
  }
  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return;
  }
  const auto context = span->GetContext();
  if (!context.IsValid()) {
    return;
  }
  AppendField(line, "trace_id", Hex(context.trace_id().Id()));
  AppendField(line, "span_id", Hex(context.span_id().Id()));
}
#else
void AppendTraceContext(std::string&) {
}
#endif

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

LogField IdField(std::string_view key, std::string_view hex_id) {
  return {std::string(key), std::string(hex_id.substr(0, 12))};
}

void InitializeLogging(const courier::runtime::config::RuntimeConfig& config) {
  const auto settings = ResolveSettings(config);

  // tests and restarts initialize more than once
  spdlog::drop(kLoggerName);
  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(settings.pattern);
  logger->set_level(spdlog::level::from_str(settings.level));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_trace_context.store(settings.trace_context);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  std::string line(message);
  for (const auto& field : fields) {
    AppendField(line, field.key, field.value);
  }
  AppendTraceContext(line);
  spdlog::log(level, "{}", line);
}

} // namespace courier::observability
