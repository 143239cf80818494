#pragma once
/*
===========================================================
Core: Logging
FILE: cpp/engine/core/logging.hpp
===========================================================
Purpose:
  - Single logging entry point for the sizing engine, the
    boundary helpers and the CLI.
  - Centralizes stdout/stderr routing.

Rules:
  - Logging MUST NOT throw (noexcept API).
  - Thread-safe: the engine is called from many request threads.
  - DEBUG/INFO go to stdout, WARN/ERROR to stderr.

Notes:
  - A non-compliant sizing result is not an error. The engine
    logs it at INFO at most.
===========================================================
*/

#include <string>

namespace cable {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Set global logging verbosity (default INFO).
void set_log_level(LogLevel lvl) noexcept;

LogLevel get_log_level() noexcept;

// True when a message at `lvl` would be emitted. Lets callers skip
// building the message string for filtered levels.
bool log_enabled(LogLevel lvl) noexcept;

// Core logging call. Never throws.
void log(LogLevel lvl, const std::string& msg) noexcept;

// Parses "debug" / "info" / "warn" / "error", any case.
bool parse_log_level(const std::string& s, LogLevel* out) noexcept;

} // namespace cable
