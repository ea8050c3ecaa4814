#pragma once

#include "core/error.hpp"
#include "logging/logger.hpp"
#include "transport/data_channel.hpp"
#include <chrono>
#include <cstddef>
#include <fstream>
#include <string>
#include <thread>

namespace streaming {

// FileStreamer
// Sends a text file over a TextSender one line per message, in file order,
// sleeping `delay` between consecutive lines. Runs on the calling (session)
// thread; the first failed send ends the run and is returned. The channel is
// left for the caller to close.
class FileStreamer {
public:
  static constexpr std::size_t kMaxLineBytes = 64 * 1024;

  explicit FileStreamer(logging::Logger &log) : log_(log) {}

  core::Status Stream(transport::TextSender &channel, const std::string &path,
                      std::chrono::milliseconds delay) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
      log_.Error(kComponent, "Failed to open file ", path);
      return core::MakeError(core::ErrorKind::io,
                             "open " + path + ": cannot open file");
    }

    std::size_t sent = 0;
    std::string line;
    while (std::getline(in, line)) {
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      const std::size_t number = sent + 1;
      if (line.size() > kMaxLineBytes) {
        log_.Error(kComponent, "Line ", number, " is too long (", line.size(),
                   " bytes)");
        return core::MakeError(core::ErrorKind::io,
                               "line " + std::to_string(number) +
                                   " exceeds " + std::to_string(kMaxLineBytes) +
                                   " bytes");
      }
      if (sent > 0 && delay.count() > 0) {
        std::this_thread::sleep_for(delay);
      }
      if (auto st = channel.SendText(line); !st) {
        log_.Error(kComponent, "Failed to send line ", number, ": ",
                   st.error().message);
        return st;
      }
      sent = number;
      log_.Debug(kComponent, "Sent line ", number, ": ", line);
    }
    if (in.bad()) {
      log_.Error(kComponent, "Error reading file ", path, " after ", sent,
                 " lines");
      return core::MakeError(core::ErrorKind::io,
                             "read " + path + ": I/O error after line " +
                                 std::to_string(sent));
    }
    log_.Info(kComponent, "Finished streaming file, sent ", sent, " lines");
    return {};
  }

private:
  static constexpr std::string_view kComponent = "server";

  logging::Logger &log_;
};

} // namespace streaming
