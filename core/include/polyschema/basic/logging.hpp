// polyschema/basic/logging.hpp - Library logger
//
// All library log output goes through one spdlog logger named "polyschema".
//
#pragma once

#include <spdlog/logger.h>

#include <memory>
#include <optional>
#include <string_view>

namespace polyschema
{

enum class LogLevel {
  Trace,
  Debug,
  Info,
  Warn,
  Error,
  Off,
};

/// The shared library logger (created on first use, writes to stderr)
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

/// Set the level of the library logger
void set_log_level(LogLevel level);

/// Parse "trace" | "debug" | "info" | "warn" | "error" | "off"
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text);

}  // namespace polyschema
