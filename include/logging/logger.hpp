#pragma once

#include "util/time.hpp"
#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace logging {

enum class Level { debug = 0, info = 1, error = 2 };

inline const char *LevelTag(Level level) {
  switch (level) {
  case Level::debug:
    return "[DEBUG] ";
  case Level::info:
    return "[INFO] ";
  case Level::error:
    return "[ERROR] ";
  }
  return "[?] ";
}

// Logger
// Injected into every component instead of a process-wide logger. Derived
// classes implement Write(); the variadic helpers stream their arguments into
// one message so call sites read like
//   log.Info("server", "Sent line ", n, ": ", line);
class Logger {
public:
  explicit Logger(Level min_level = Level::info) : min_level_(min_level) {}
  virtual ~Logger() = default;

  bool Enabled(Level level) const {
    return level >= min_level_.load(std::memory_order_relaxed);
  }
  void SetLevel(Level level) {
    min_level_.store(level, std::memory_order_relaxed);
  }

  template <typename... Args>
  void Debug(std::string_view component, Args &&...args) {
    Log(Level::debug, component, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void Info(std::string_view component, Args &&...args) {
    Log(Level::info, component, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void Error(std::string_view component, Args &&...args) {
    Log(Level::error, component, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void Log(Level level, std::string_view component, Args &&...args) {
    if (!Enabled(level)) {
      return;
    }
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    Write(level, component, oss.str());
  }

protected:
  virtual void Write(Level level, std::string_view component,
                     std::string_view message) = 0;

private:
  std::atomic<Level> min_level_;
};

// ConsoleLogger
// Threading model:
// - Called from any thread (reactor, handler pool, session threads); a mutex
//   keeps records whole
// - Errors go to `err`, everything else to `out`. Both default to stderr so
//   that stdout stays free for the received line stream.
class ConsoleLogger : public Logger {
public:
  explicit ConsoleLogger(Level min_level = Level::info,
                         std::ostream &out = std::cerr,
                         std::ostream &err = std::cerr)
      : Logger(min_level), out_(out), err_(err) {}

protected:
  void Write(Level level, std::string_view component,
             std::string_view message) override {
    std::string line = LevelTag(level);
    line += timeutil::LogTimestamp();
    line += " [";
    line += component;
    line += "] ";
    line += message;
    line += '\n';
    std::lock_guard lock(mu_);
    std::ostream &os = level == Level::error ? err_ : out_;
    os << line;
    os.flush();
  }

private:
  std::mutex mu_;
  std::ostream &out_;
  std::ostream &err_;
};

class NullLogger : public Logger {
public:
  NullLogger() : Logger(Level::error) {}

protected:
  void Write(Level, std::string_view, std::string_view) override {}
};

// Logs "<name> took <duration>" at info level when leaving scope.
class ScopedTimer {
public:
  ScopedTimer(Logger &log, std::string_view component, std::string name)
      : log_(log), component_(component), name_(std::move(name)),
        start_(std::chrono::steady_clock::now()) {}

  ~ScopedTimer() {
    log_.Info(component_, name_, " took ",
              timeutil::FormatDuration(std::chrono::steady_clock::now() -
                                       start_));
  }

  ScopedTimer(const ScopedTimer &) = delete;
  ScopedTimer &operator=(const ScopedTimer &) = delete;

private:
  Logger &log_;
  std::string component_;
  std::string name_;
  std::chrono::steady_clock::time_point start_;
};

} // namespace logging
