// polyschema/basic/logging.cpp - Library logger implementation
#include "polyschema/basic/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace polyschema
{

namespace
{

constexpr const char * k_logger_name = "polyschema";

spdlog::level::level_enum to_spdlog(LogLevel level)
{
  switch (level) {
    case LogLevel::Trace:
      return spdlog::level::trace;
    case LogLevel::Debug:
      return spdlog::level::debug;
    case LogLevel::Info:
      return spdlog::level::info;
    case LogLevel::Warn:
      return spdlog::level::warn;
    case LogLevel::Error:
      return spdlog::level::err;
    case LogLevel::Off:
      return spdlog::level::off;
  }
  return spdlog::level::info;
}

}  // namespace

std::shared_ptr<spdlog::logger> logger()
{
  // Function-local static: creation is thread-safe and happens on first use.
  static const std::shared_ptr<spdlog::logger> instance = [] {
    auto existing = spdlog::get(k_logger_name);
    if (existing) {
      return existing;
    }
    auto created = spdlog::stderr_color_mt(k_logger_name);
    created->set_level(spdlog::level::warn);
    created->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    return created;
  }();
  return instance;
}

void set_log_level(LogLevel level) { logger()->set_level(to_spdlog(level)); }

std::optional<LogLevel> parse_log_level(std::string_view text)
{
  if (text == "trace") return LogLevel::Trace;
  if (text == "debug") return LogLevel::Debug;
  if (text == "info") return LogLevel::Info;
  if (text == "warn" || text == "warning") return LogLevel::Warn;
  if (text == "error") return LogLevel::Error;
  if (text == "off") return LogLevel::Off;
  return std::nullopt;
}

}  // namespace polyschema
