#include "internal/observability/logging.hpp"

#include <array>
#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/observability/resource.hpp"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace receiver::observability {
namespace {

constexpr char kDefaultPattern[] = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%n] %v";

// Bearer tokens pass through request handling; they never reach a log line.
constexpr std::array<std::string_view, 4> kRedactedKeys = {"token", "auth_token", "password", "secret"};

struct LogSettings {
  bool        include_trace_context = false;
  std::string instance_field;
};

LogSettings g_settings;

const char* Env(const char* name) {
  const char* value = std::getenv(name);
  return value != nullptr && *value != '\0' ? value : nullptr;
}

bool IsRedacted(std::string_view key) {
  for (auto redacted : kRedactedKeys) {
    if (key == redacted) return true;
  }
  return false;
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) return true;
  for (char c : value) {
    if (c == ' ' || c == '"' || c == '=' || c == '\n' || c == '\t') return true;
  }
  return false;
}

void AppendValue(std::string& out, std::string_view value) {
  if (!NeedsQuoting(value)) {
    out.append(value);
    return;
  }
  out.push_back('"');
  for (char c : value) {
    switch (c) {
      case '"':
        out.append("\\\"");
        break;
      case '\\':
        out.append("\\\\");
        break;
      case '\n':
        out.append("\\n");
        break;
      case '\t':
        out.append("\\t");
        break;
      default:
        out.push_back(c);
    }
  }
  out.push_back('"');
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

// trace_id/span_id of the active span, so a trigger's log lines join its trace.
void AppendTraceContext(std::string& line) {
  if (!g_settings.include_trace_context) {
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

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  line += " trace_id=" + HexId(trace_bytes, sizeof(trace_bytes)) + " span_id=" + HexId(span_bytes, sizeof(span_bytes));
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

std::string FormatLogFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out.append(field.key);
    out.push_back('=');
    AppendValue(out, IsRedacted(field.key) ? std::string_view("[redacted]") : std::string_view(field.value));
  }
  return out;
}

void InitializeLogging(const receiver::runtime::config::RuntimeConfig& config) {
  const auto service = ResolveServiceIdentity(config);

  std::string level = config.logging().level().empty() ? "info" : config.logging().level();
  if (const char* env = Env("RECEIVER_LOG_LEVEL")) level = env;

  std::string pattern = config.logging().pattern().empty() ? kDefaultPattern : config.logging().pattern();
  if (const char* env = Env("RECEIVER_LOG_PATTERN")) pattern = env;

  bool include_trace_context = config.logging().include_trace_context();
  if (const char* env = Env("RECEIVER_LOG_INCLUDE_TRACE_CONTEXT")) {
    include_trace_context = std::string_view(env) == "1" || std::string_view(env) == "true";
  }

  spdlog::drop(service.name);
  auto logger = spdlog::stdout_color_mt(service.name);
  logger->set_pattern(pattern);
  logger->set_level(spdlog::level::from_str(level));
  spdlog::set_default_logger(std::move(logger));
  // a failed trigger or revoke must be on disk before a crash
  spdlog::flush_on(spdlog::level::warn);

  g_settings.include_trace_context = include_trace_context;
  g_settings.instance_field        = service.instance_id.empty() ? std::string() : FormatLogFields({StringField("instance", service.instance_id)});
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  std::string line(message);
  if (fields.size() > 0) {
    line.push_back(' ');
    line += FormatLogFields(fields);
  }
  if (!g_settings.instance_field.empty()) {
    line.push_back(' ');
    line += g_settings.instance_field;
  }
  AppendTraceContext(line);

  spdlog::log(level, "{}", line);
}

} // namespace receiver::observability
