#pragma once

#include <spdlog/common.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace ragturn::runtime::config {
class RuntimeConfig;
}

namespace ragturn::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DoubleField(std::string_view key, double value);

/*
  ScopedLogContext

  Correlation fields (request, thread, owner) appended to every line this
  thread logs while the scope is alive, and copied onto spans started
  inside it. Scopes nest and must be destroyed in reverse order.
*/
class ScopedLogContext {
 public:
  explicit ScopedLogContext(std::initializer_list<LogField> fields);
  ~ScopedLogContext();

  ScopedLogContext(const ScopedLogContext&)            = delete;
  ScopedLogContext& operator=(const ScopedLogContext&) = delete;

 private:
  std::size_t mark_;
};

const std::vector<LogField>& CurrentLogContext();

/*
  The text handed to spdlog: message, then key=value pairs with the
  thread's context last. Values with spaces, quotes or '=' are quoted.
  Keys naming a credential (api_key, secret, password, authorization)
  are written as [redacted].
*/
std::string FormatLogLine(std::string_view message, std::initializer_list<LogField> fields);

void InitializeLogging(const ragturn::runtime::config::RuntimeConfig& config);
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

} // namespace ragturn::observability

#define RAGTURN_LOG_INFO(message, ...) ::ragturn::observability::LogInfo((message), ##__VA_ARGS__)
#define RAGTURN_LOG_WARN(message, ...) ::ragturn::observability::LogWarn((message), ##__VA_ARGS__)
#define RAGTURN_LOG_ERROR(message, ...) ::ragturn::observability::LogError((message), ##__VA_ARGS__)
