#pragma once

#include "core/error.hpp"
#include "logging/logger.hpp"
#include "streaming/line_feed.hpp"
#include "streaming/line_sink.hpp"
#include "streaming/transfer_stats.hpp"
#include "util/time.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>
#include <string>
#include <variant>

namespace streaming {

// LineProcessor
// Receiving side of the line protocol. Consumes a LineSource event by event:
// - Line          -> write line + '\n' to the sink, then count it
// - LinesClosed   -> success
// - Failure(EOF)  -> success (expected termination)
// - Failure(err)  -> stop, report err with the lines counted so far
// - ErrorsClosed  -> keep waiting for lines
// Elapsed time covers the whole call, whichever way it ends. Lines already
// written stay in the sink.
class LineProcessor {
public:
  explicit LineProcessor(logging::Logger &log) : log_(log) {}

  ProcessResult Process(LineSource &source, const std::string &sink_path) {
    const auto start = std::chrono::steady_clock::now();
    auto sink = OpenSink(sink_path);
    if (!sink) {
      ProcessResult result;
      result.stats.elapsed = std::chrono::steady_clock::now() - start;
      result.error = sink.error();
      log_.Error(kComponent, "Failed to open output: ", sink.error().message);
      return result;
    }
    if (!sink_path.empty()) {
      log_.Info(kComponent, "Writing received lines to ", sink_path);
    }
    return Run(source, **sink, start);
  }

  ProcessResult Process(LineSource &source, LineSink &sink) {
    return Run(source, sink, std::chrono::steady_clock::now());
  }

private:
  static constexpr std::string_view kComponent = "client";

  ProcessResult Run(LineSource &source, LineSink &sink,
                    std::chrono::steady_clock::time_point start) {
    ProcessResult result;
    for (;;) {
      auto ev = source.Next();
      if (!ev) {
        break;
      }
      if (auto *line = std::get_if<Line>(&*ev)) {
        if (auto st = sink.Write(line->text); !st) {
          log_.Error(kComponent, "Failed to write line ",
                     result.stats.lines + 1, ": ", st.error().message);
          result.error = st.error();
          break;
        }
        ++result.stats.lines;
        log_.Debug(kComponent, "Received line ", result.stats.lines, ": ",
                   line->text);
        continue;
      }
      if (std::holds_alternative<LinesClosed>(*ev)) {
        break;
      }
      if (auto *failure = std::get_if<Failure>(&*ev)) {
        if (!core::IsEndOfStream(failure->error)) {
          log_.Error(kComponent, "Stream failed after ", result.stats.lines,
                     " lines: ", core::Describe(failure->error));
          result.error = failure->error;
        }
        break;
      }
      // ErrorsClosed: no error will come, keep reading lines.
    }
    result.stats.elapsed = std::chrono::steady_clock::now() - start;
    Report(result.stats);
    return result;
  }

  void Report(const TransferStats &stats) {
    std::ostringstream rate;
    rate << std::fixed << std::setprecision(2) << stats.LinesPerSecond();
    log_.Info(kComponent, "Received ", stats.lines, " lines in ",
              timeutil::FormatDuration(stats.elapsed), " (", rate.str(),
              " lines/sec)");
  }

  logging::Logger &log_;
};

} // namespace streaming
