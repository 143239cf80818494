/*
===========================================================
Core: Logging (Implementation)
FILE: cpp/engine/core/logging.cpp
===========================================================
  One process-wide sink. Lines are assembled before the lock
  is taken so the critical section is a single write.
===========================================================
*/

#include "engine/core/logging.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <exception>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace cable {
namespace {

struct Sink {
  std::atomic<int> level{static_cast<int>(LogLevel::INFO)};
  std::mutex mu;
};

Sink& sink() {
  static Sink s;
  return s;
}

const char* level_name(LogLevel lvl) noexcept {
  switch (lvl) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
  }
  return "INFO";
}

std::string format_line(LogLevel lvl, const std::string& msg) {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm utc{};
#if defined(_WIN32)
  gmtime_s(&utc, &now);
#else
  gmtime_r(&now, &utc);
#endif
  std::ostringstream line;
  line << '[' << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ") << "][" << level_name(lvl) << "] " << msg
       << '\n';
  return line.str();
}

} // namespace

void set_log_level(LogLevel lvl) noexcept {
  sink().level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel get_log_level() noexcept {
  return static_cast<LogLevel>(sink().level.load(std::memory_order_relaxed));
}

bool log_enabled(LogLevel lvl) noexcept {
  return static_cast<int>(lvl) >= sink().level.load(std::memory_order_relaxed);
}

bool parse_log_level(const std::string& s, LogLevel* out) noexcept {
  if (!out) return false;
  std::string upper(s.size(), ' ');
  for (size_t i = 0; i < s.size(); ++i) {
    upper[i] = static_cast<char>(std::toupper(static_cast<unsigned char>(s[i])));
  }
  for (LogLevel lvl : {LogLevel::DEBUG, LogLevel::INFO, LogLevel::WARN, LogLevel::ERROR}) {
    if (upper == level_name(lvl)) {
      *out = lvl;
      return true;
    }
  }
  return false;
}

void log(LogLevel lvl, const std::string& msg) noexcept {
  if (!log_enabled(lvl)) return;
  try {
    const std::string line = format_line(lvl, msg);
    std::ostream& out = (lvl >= LogLevel::WARN) ? std::cerr : std::cout;
    std::lock_guard<std::mutex> lk(sink().mu);
    out << line;
    out.flush();
  } catch (const std::exception&) {
    // best-effort: a failed write drops the line
  }
}

} // namespace cable
