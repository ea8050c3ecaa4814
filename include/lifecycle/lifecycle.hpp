#pragma once

#include "core/error.hpp"
#include "logging/logger.hpp"
#include <mutex>
#include <optional>
#include <string>

namespace lifecycle {

enum class Phase { idle, signaling_up, streaming, draining, closed };

inline const char *ToString(Phase phase) {
  switch (phase) {
  case Phase::idle:
    return "idle";
  case Phase::signaling_up:
    return "signaling-up";
  case Phase::streaming:
    return "streaming";
  case Phase::draining:
    return "draining";
  case Phase::closed:
    return "closed";
  }
  return "unknown";
}

// Lifecycle: server process phases:
//   idle -> signaling-up -> streaming -> draining -> closed
// signaling-up may go straight to draining when no session ever opened, and
// idle may go straight to closed when startup fails. Every other move is
// rejected. A fatal error recorded at any point turns the exit code into 1.
class Lifecycle {
public:
  explicit Lifecycle(logging::Logger &log) : log_(log) {}

  core::Status Advance(Phase next) {
    Phase from;
    {
      std::lock_guard lock(mu_);
      from = phase_;
      if (from == next) {
        return {};
      }
      if (!Allowed(from, next)) {
        return core::MakeError(core::ErrorKind::config,
                               std::string("invalid lifecycle transition ") +
                                   ToString(from) + " -> " + ToString(next));
      }
      phase_ = next;
    }
    log_.Debug(kComponent, "Lifecycle: ", ToString(from), " -> ",
               ToString(next));
    return {};
  }

  // Keeps only the first fatal error.
  void ReportFatal(const core::Error &error) {
    std::lock_guard lock(mu_);
    if (!fatal_) {
      fatal_ = error;
    }
  }

  Phase Current() const {
    std::lock_guard lock(mu_);
    return phase_;
  }

  std::optional<core::Error> Fatal() const {
    std::lock_guard lock(mu_);
    return fatal_;
  }

  int ExitCode() const {
    std::lock_guard lock(mu_);
    return fatal_ ? 1 : 0;
  }

private:
  static constexpr std::string_view kComponent = "lifecycle";

  static bool Allowed(Phase from, Phase to) {
    switch (from) {
    case Phase::idle:
      return to == Phase::signaling_up || to == Phase::closed;
    case Phase::signaling_up:
      return to == Phase::streaming || to == Phase::draining;
    case Phase::streaming:
      return to == Phase::draining;
    case Phase::draining:
      return to == Phase::closed;
    case Phase::closed:
      return false;
    }
    return false;
  }

  logging::Logger &log_;
  mutable std::mutex mu_;
  Phase phase_ = Phase::idle;
  std::optional<core::Error> fatal_;
};

} // namespace lifecycle
