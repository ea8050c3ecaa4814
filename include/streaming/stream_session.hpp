#pragma once

#include "core/error.hpp"
#include "logging/logger.hpp"
#include "streaming/file_streamer.hpp"
#include "transport/data_channel.hpp"
#include <chrono>
#include <exception>
#include <memory>
#include <string>

namespace streaming {

// StreamSession: one open channel bound to one file and a pacing delay.
// Run() streams the file and always closes the channel afterwards, so the
// session never outlives its channel.
class StreamSession {
public:
  StreamSession(std::shared_ptr<transport::DataChannel> channel,
                std::string path, std::chrono::milliseconds delay,
                logging::Logger &log)
      : channel_(std::move(channel)), path_(std::move(path)), delay_(delay),
        log_(log) {}

  core::Status Run() {
    core::Status st;
    try {
      st = FileStreamer(log_).Stream(*channel_, path_, delay_);
    } catch (const std::exception &e) {
      st = core::MakeError(core::ErrorKind::io,
                           std::string("streaming aborted: ") + e.what());
    } catch (...) {
      st = core::MakeError(core::ErrorKind::io,
                           "streaming aborted: unknown exception");
    }
    if (!st) {
      log_.Error(kComponent, "Stream session on ", channel_->Label(),
                 " ended: ", core::Describe(st.error()));
    }
    channel_->Close();
    return st;
  }

  const std::string &Label() const { return channel_->Label(); }

private:
  static constexpr std::string_view kComponent = "server";

  std::shared_ptr<transport::DataChannel> channel_;
  std::string path_;
  std::chrono::milliseconds delay_;
  logging::Logger &log_;
};

} // namespace streaming
