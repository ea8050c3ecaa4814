#pragma once

#include "core/error.hpp"
#include <chrono>
#include <cstddef>
#include <optional>

namespace streaming {

struct TransferStats {
  std::size_t lines = 0;
  std::chrono::steady_clock::duration elapsed{};

  double LinesPerSecond() const {
    const double secs = std::chrono::duration<double>(elapsed).count();
    return secs > 0.0 ? static_cast<double>(lines) / secs : 0.0;
  }
};

// Outcome of one LineProcessor run; `error` is empty on success, including
// termination by the end-of-stream sentinel.
struct ProcessResult {
  TransferStats stats;
  std::optional<core::Error> error;

  bool Ok() const { return !error.has_value(); }
};

} // namespace streaming
