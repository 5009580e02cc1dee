#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace engram::observability {
namespace {

constexpr const char* kLoggerName     = "engram";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::string EnvOr(const char* name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(name)) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool IncludeTraceContext(const engram::runtime::config::RuntimeConfig& config) {
  if (const char* value = std::getenv("ENGRAM_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string flag(value);
    return flag == "1" || flag == "true";
  }
  return config.logging().include_trace_context();
}

bool g_include_trace_context{false};

// Values with spaces or '=' are quoted so key=value pairs stay splittable.
void AppendValue(std::ostringstream& out, const std::string& value) {
  if (value.find_first_of(" =\"") == std::string::npos && !value.empty()) {
    out << value;
    return;
  }
  out << '"';
  for (char c : value) {
    if (c == '"' || c == '\\') {
      out << '\\';
    }
    out << c;
  }
  out << '"';
}

std::string RenderFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool               first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=';
    AppendValue(out, field.value);
  }
  return out.str();
}

#ifdef ENABLE_OTEL
std::string Hex(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

std::string RenderTraceContext() {
  if (!g_include_trace_context) {
    return {};
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span || !span->GetContext().IsValid()) {
    return {};
  }

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  span->GetContext().trace_id().CopyBytesTo(trace_bytes);
  span->GetContext().span_id().CopyBytesTo(span_bytes);
  return "trace_id=" + Hex(trace_bytes, 16) + " span_id=" + Hex(span_bytes, 8);
}
#else
std::string RenderTraceContext() {
  return {};
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

void InitializeLogging(const engram::runtime::config::RuntimeConfig& config) {
  // Re-initialization (tests, embedded use) reconfigures the existing logger.
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }

  logger->set_pattern(EnvOr("ENGRAM_LOG_PATTERN", config.logging().pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(EnvOr("ENGRAM_LOG_LEVEL", config.logging().level(), "info")));
  spdlog::set_default_logger(logger);
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = IncludeTraceContext(config);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  std::string line(message);
  const auto  rendered = RenderFields(fields);
  if (!rendered.empty()) {
    line += ' ';
    line += rendered;
  }
  const auto trace = RenderTraceContext();
  if (!trace.empty()) {
    line += ' ';
    line += trace;
  }
  spdlog::log(level, "{}", line);
}

} // namespace engram::observability
