#include "internal/observability/logging.hpp"

#include <array>
#include <cstdlib>
#include <string>

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace ragturn::observability {
namespace {

constexpr const char* kLoggerName     = "ragturn";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

constexpr std::array<std::string_view, 4> kRedactedKeys = {"api_key", "secret", "password", "authorization"};

struct LogSettings {
  std::string level   = "info";
  std::string pattern = kDefaultPattern;
  bool        trace_context{false};
};

// RAGTURN_LOG_* environment variables win over the config document.
LogSettings ResolveSettings(const ragturn::runtime::config::RuntimeConfig& config) {
  LogSettings settings;
  const auto& logging = config.logging();
  if (!logging.level().empty()) settings.level = logging.level();
  if (!logging.pattern().empty()) settings.pattern = logging.pattern();
  settings.trace_context = logging.include_trace_context();

  if (const char* level = std::getenv("RAGTURN_LOG_LEVEL")) settings.level = level;
  if (const char* pattern = std::getenv("RAGTURN_LOG_PATTERN")) settings.pattern = pattern;
  if (const char* trace = std::getenv("RAGTURN_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string value(trace);
    settings.trace_context = value == "1" || value == "true";
  }
  return settings;
}

bool g_include_trace_context{false};

thread_local std::vector<LogField> t_context;

bool IsRedacted(std::string_view key) {
  for (auto name : kRedactedKeys) {
    if (key.find(name) != std::string_view::npos) return true;
  }
  return false;
}

void AppendField(std::string& out, const LogField& field) {
  if (!out.empty()) out.push_back(' ');
  out.append(field.key).push_back('=');

  if (IsRedacted(field.key)) {
    out.append("[redacted]");
    return;
  }

  const auto& value = field.value;
  if (!value.empty() && value.find_first_of(" \t\n\"=") == std::string::npos) {
    out.append(value);
    return;
  }
  out.push_back('"');
  for (char c : value) {
    if (c == '"' || c == '\\') out.push_back('\\');
    out.push_back(c == '\n' ? ' ' : c);
  }
  out.push_back('"');
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

std::string TraceContextFields() {
  if (!g_include_trace_context) return {};

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return {};

  const auto context = span->GetContext();
  if (!context.IsValid() || !context.trace_id().IsValid() || !context.span_id().IsValid()) return {};

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  return "trace_id=" + HexId(trace_bytes, 16) + " span_id=" + HexId(span_bytes, 8);
}
#else
std::string TraceContextFields() {
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

LogField DoubleField(std::string_view key, double value) {
  return {std::string(key), fmt::format("{:.3f}", value)};
}

ScopedLogContext::ScopedLogContext(std::initializer_list<LogField> fields) : mark_(t_context.size()) {
  t_context.insert(t_context.end(), fields.begin(), fields.end());
}

ScopedLogContext::~ScopedLogContext() {
  t_context.resize(mark_);
}

const std::vector<LogField>& CurrentLogContext() {
  return t_context;
}

std::string FormatLogLine(std::string_view message, std::initializer_list<LogField> fields) {
  std::string pairs;
  for (const auto& field : fields) AppendField(pairs, field);
  for (const auto& field : t_context) AppendField(pairs, field);

  if (pairs.empty()) return std::string(message);
  return fmt::format("{} {}", message, pairs);
}

void InitializeLogging(const ragturn::runtime::config::RuntimeConfig& config) {
  const auto settings = ResolveSettings(config);

  spdlog::drop(kLoggerName);
  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(settings.pattern);
  logger->set_level(spdlog::level::from_str(settings.level));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = settings.trace_context;
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;

  auto line  = FormatLogLine(message, fields);
  auto trace = TraceContextFields();
  if (trace.empty()) {
    spdlog::log(level, "{}", line);
    return;
  }
  spdlog::log(level, "{} {}", line, trace);
}

} // namespace ragturn::observability
